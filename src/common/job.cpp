#include "common/job.hpp"

Job::State Job::getState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

int Job::getProgress() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return progress_;
}

std::string Job::getError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

bool Job::tryMarkRunning() {
    bool expected = false;
    return running_.compare_exchange_strong(expected, true);
}

void Job::updateProgress(int progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    progress_ = progress;
}

void Job::setError(const std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    error_ = error;
}

void Job::setState(State state) {
    std::lock_guard<std::mutex> lock(mutex_);
    state_ = state;
}
