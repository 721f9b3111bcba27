#include "backup/pending_recovery.hpp"
#include "backup/backup_definition.hpp"
#include "backup/backup_job.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace {

bool hasLedgerSuffix(const std::string& filename) {
    const size_t suffixLength = std::strlen(PENDING_LEDGER_SUFFIX);
    return filename.size() > suffixLength &&
           filename.compare(filename.size() - suffixLength, suffixLength, PENDING_LEDGER_SUFFIX) == 0;
}

} // namespace

std::vector<std::string> findPendingLedgers(const std::string& dir,
                                            const std::optional<std::string>& domainName) {
    std::vector<std::string> ledgers;

    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return ledgers;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        if (!it->is_regular_file() || !hasLedgerSuffix(it->path().filename().string())) {
            continue;
        }
        std::string path = it->path().string();
        if (domainName) {
            try {
                if (PendingLedger::load(path).domainName != *domainName) {
                    continue;
                }
            } catch (const ConfigError& e) {
                Logger::warning(std::string("Skipping pending ledger: ") + e.what());
                continue;
            }
        }
        ledgers.push_back(path);
    }
    if (ec) {
        Logger::error("Failed to scan " + dir + " for pending backups: " + ec.message());
    }

    std::sort(ledgers.begin(), ledgers.end());
    return ledgers;
}

size_t cleanPendingBackups(const std::string& dir,
                           HypervisorConnection& conn,
                           const std::shared_ptr<SnapshotCoordinatorProvider>& provider,
                           const std::optional<std::string>& domainName,
                           std::optional<std::chrono::seconds> timeout) {
    size_t cleaned = 0;
    for (const auto& ledgerPath : findPendingLedgers(dir, domainName)) {
        Logger::info("Cleaning interrupted backup " + ledgerPath);
        try {
            auto job = BackupJob::fromPendingLedger(ledgerPath, conn, provider, timeout);
            job->cleanAborted();
            if (!job->hasPendingLedger()) {
                ++cleaned;
            }
        } catch (const std::exception& e) {
            Logger::error("Failed to clean " + ledgerPath + ": " + e.what());
        }
    }
    return cleaned;
}
