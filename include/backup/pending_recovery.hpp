#pragma once

#include "backup/hypervisor.hpp"
#include "backup/snapshot_coordinator.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// Paths of the pending ledgers in dir, sorted. With domainName, only the
// ledgers recorded for that domain. Unreadable ledgers are logged and skipped.
std::vector<std::string> findPendingLedgers(const std::string& dir,
                                            const std::optional<std::string>& domainName = std::nullopt);

// Rolls back every interrupted backup found in dir. Returns how many were
// cleaned; ledgers that could not be processed are logged and left in place.
size_t cleanPendingBackups(const std::string& dir,
                           HypervisorConnection& conn,
                           const std::shared_ptr<SnapshotCoordinatorProvider>& provider,
                           const std::optional<std::string>& domainName = std::nullopt,
                           std::optional<std::chrono::seconds> timeout = std::nullopt);
