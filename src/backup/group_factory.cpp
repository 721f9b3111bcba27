#include "backup/group_factory.hpp"
#include "backup/pattern_resolver.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"

using json = nlohmann::json;

BackupPolicy policyFromGroupConfig(const json& groupConfig) {
    BackupPolicy policy;

    if (groupConfig.contains("target") && !groupConfig["target"].is_null()) {
        if (!groupConfig["target"].is_string()) {
            throw ConfigError("target must be a path");
        }
        policy.targetDir = groupConfig["target"].get<std::string>();
    }
    if (groupConfig.contains("compression")) {
        policy.compression = compressionFromJson(groupConfig["compression"]);
    }
    if (groupConfig.contains("compression_lvl") && !groupConfig["compression_lvl"].is_null()) {
        if (!groupConfig["compression_lvl"].is_number_integer()) {
            throw ConfigError("compression_lvl must be an integer");
        }
        policy.compressionLevel = groupConfig["compression_lvl"].get<int>();
    }
    return policy;
}

std::vector<std::shared_ptr<JobGroup>> buildGroupsFromConfig(
    const json& groupsConfig,
    HypervisorConnection& conn,
    const std::shared_ptr<SnapshotCoordinatorProvider>& provider) {
    std::vector<std::shared_ptr<JobGroup>> groups;
    if (groupsConfig.is_null()) {
        return groups;
    }
    if (!groupsConfig.is_object()) {
        throw ConfigError("groups must be an object of group entries");
    }

    for (const auto& entry : groupsConfig.items()) {
        if (!entry.value().is_object()) {
            throw ConfigError("group " + entry.key() + " must be an object");
        }

        auto group = std::make_shared<JobGroup>(entry.key(), provider, policyFromGroupConfig(entry.value()));
        json hosts = entry.value().value("hosts", json::array());
        for (const auto& selection : resolveGroupHosts(hosts, conn)) {
            group->addDomain(conn.lookupDomainByName(selection.first), selection.second);
        }

        Logger::info("Group " + group->getName() + ": " + std::to_string(group->getJobs().size()) + " domain(s)");
        groups.push_back(group);
    }
    return groups;
}
