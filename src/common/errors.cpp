#include "common/errors.hpp"
#include "backup/backup_job.hpp"
#include <sstream>

GroupBackupFailureError::GroupBackupFailureError(const std::string& groupName,
                                                 std::vector<JobFailure> failures)
    : BackupError(buildMessage(groupName, failures))
    , failures_(std::move(failures)) {
}

std::string GroupBackupFailureError::buildMessage(const std::string& groupName,
                                                  const std::vector<JobFailure>& failures) {
    std::stringstream ss;
    ss << "group " << groupName << ": " << failures.size() << " backup(s) failed";
    for (const auto& failure : failures) {
        ss << "; " << (failure.job ? failure.job->getDomainName() : std::string("<unknown>"))
           << ": " << describeException(failure.error);
    }
    return ss.str();
}

std::string describeException(const std::exception_ptr& error) {
    if (!error) {
        return "no error";
    }
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}
