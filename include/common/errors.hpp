#pragma once

#include <exception>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

class BackupJob;

class BackupError : public std::runtime_error {
public:
    explicit BackupError(const std::string& message) : std::runtime_error(message) {}
};

// Raised before anything was started: nothing to clean up.
class PreconditionError : public BackupError {
public:
    explicit PreconditionError(const std::string& message) : BackupError(message) {}
};

class AlreadyRunningError : public PreconditionError {
public:
    explicit AlreadyRunningError(const std::string& domainName)
        : PreconditionError(domainName + ": backup already running") {}
};

class UnknownDiskError : public PreconditionError {
public:
    UnknownDiskError(const std::string& domainName, const std::string& devName)
        : PreconditionError(domainName + ": disk " + devName + " not found")
        , devName_(devName) {}

    const std::string& devName() const { return devName_; }

private:
    std::string devName_;
};

class ArchiveExistsError : public BackupError {
public:
    explicit ArchiveExistsError(const std::string& path)
        : BackupError("archive already exists: " + path)
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

class SnapshotError : public BackupError {
public:
    explicit SnapshotError(const std::string& message) : BackupError(message) {}
};

class SnapshotTimeoutError : public SnapshotError {
public:
    explicit SnapshotTimeoutError(const std::string& message) : SnapshotError(message) {}
};

class HypervisorError : public BackupError {
public:
    explicit HypervisorError(const std::string& message) : BackupError(message) {}
};

class DomainNotFoundError : public HypervisorError {
public:
    explicit DomainNotFoundError(const std::string& domainName)
        : HypervisorError("domain not found: " + domainName) {}
};

class JobNotFoundError : public BackupError {
public:
    explicit JobNotFoundError(const std::string& domainName)
        : BackupError("no backup job for domain " + domainName) {}
};

class ConfigError : public BackupError {
public:
    explicit ConfigError(const std::string& message) : BackupError(message) {}
};

// One entry per job whose start() threw.
struct JobFailure {
    std::shared_ptr<BackupJob> job;
    std::exception_ptr error;
};

class GroupBackupFailureError : public BackupError {
public:
    GroupBackupFailureError(const std::string& groupName, std::vector<JobFailure> failures);

    const std::vector<JobFailure>& failures() const { return failures_; }

private:
    static std::string buildMessage(const std::string& groupName, const std::vector<JobFailure>& failures);

    std::vector<JobFailure> failures_;
};

// Message of an exception_ptr, or a placeholder for non-standard exceptions.
std::string describeException(const std::exception_ptr& error);
