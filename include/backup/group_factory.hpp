#pragma once

#include "backup/hypervisor.hpp"
#include "backup/job_group.hpp"
#include "backup/snapshot_coordinator.hpp"
#include <memory>
#include <vector>
#include <nlohmann/json.hpp>

// Default policy of a group entry: target, compression and compression_lvl.
// Throws ConfigError on wrong types.
BackupPolicy policyFromGroupConfig(const nlohmann::json& groupConfig);

// One JobGroup per entry of groupsConfig, jobs resolved from each entry's
// "hosts" against the domains conn currently knows.
std::vector<std::shared_ptr<JobGroup>> buildGroupsFromConfig(
    const nlohmann::json& groupsConfig,
    HypervisorConnection& conn,
    const std::shared_ptr<SnapshotCoordinatorProvider>& provider);
