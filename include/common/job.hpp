#pragma once

#include <string>
#include <mutex>
#include <atomic>

class Job {
public:
    enum class State {
        IDLE,
        SNAPSHOTTING,
        EXTRACTING,
        FINALIZING,
        DONE,
        ABORTING,
        CLEANED
    };

    Job() = default;
    virtual ~Job() = default;

    // Runs the whole job on the calling thread. Throws on failure.
    virtual void start() = 0;

    bool isRunning() const { return running_.load(); }
    State getState() const;
    int getProgress() const;
    std::string getError() const;

protected:
    // Sets the running flag; false if it was already set.
    bool tryMarkRunning();
    void clearRunning() { running_.store(false); }

    void updateProgress(int progress);
    void setError(const std::string& error);
    void setState(State state);

private:
    std::atomic<bool> running_{false};
    State state_{State::IDLE};
    int progress_{0};
    std::string error_;
    mutable std::mutex mutex_;
};
