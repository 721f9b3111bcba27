#include "backup/pattern_resolver.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <map>
#include <regex>

using json = nlohmann::json;

namespace {

const char* const REGEX_PREFIX = "r:";

std::vector<std::string> mergeDisks(const std::vector<std::string>& current,
                                    const std::vector<std::string>& added) {
    std::vector<std::string> merged = current;
    for (const auto& dev : added) {
        if (std::find(merged.begin(), merged.end(), dev) == merged.end()) {
            merged.push_back(dev);
        }
    }
    return merged;
}

} // namespace

std::set<std::string> patternMatchingDomains(const std::string& pattern,
                                             const std::set<std::string>& inventory,
                                             bool& exclude) {
    std::string rule = pattern;
    exclude = !rule.empty() && rule[0] == '!';
    if (exclude) {
        rule.erase(0, 1);
    }

    std::set<std::string> matches;
    if (rule.compare(0, 2, REGEX_PREFIX) == 0) {
        std::regex regex;
        try {
            regex = std::regex(rule.substr(2), std::regex::ECMAScript);
        } catch (const std::regex_error& e) {
            throw ConfigError("invalid host pattern " + pattern + ": " + e.what());
        }
        for (const auto& name : inventory) {
            if (std::regex_match(name, regex)) {
                matches.insert(name);
            }
        }
    } else if (inventory.count(rule)) {
        matches.insert(rule);
    }
    return matches;
}

DomainMatch matchDomainsFromHostConfig(const json& hostConfig,
                                       const std::set<std::string>& inventory) {
    DomainMatch match;
    std::string pattern;

    if (hostConfig.is_string()) {
        pattern = hostConfig.get<std::string>();
    } else if (hostConfig.is_object() && hostConfig.contains("host") && hostConfig["host"].is_string()) {
        pattern = hostConfig["host"].get<std::string>();
        if (hostConfig.contains("disks") && !hostConfig["disks"].is_null()) {
            if (!hostConfig["disks"].is_array()) {
                throw ConfigError("disks of host " + pattern + " must be a list");
            }
            std::vector<std::string> disks;
            for (const auto& dev : hostConfig["disks"]) {
                if (!dev.is_string()) {
                    throw ConfigError("disks of host " + pattern + " must be device names");
                }
                disks.push_back(dev.get<std::string>());
            }
            match.disks = disks;
        }
    } else {
        throw ConfigError("invalid host rule: " + hostConfig.dump());
    }

    match.domains = patternMatchingDomains(pattern, inventory, match.exclude);
    if (match.domains.empty()) {
        Logger::debug("Host rule " + pattern + " matches no domain");
    }
    return match;
}

DomainMatch matchDomainsFromHostConfig(const json& hostConfig, HypervisorConnection& conn) {
    return matchDomainsFromHostConfig(hostConfig, conn.listAllDomainNames());
}

std::vector<DomainSelection> resolveGroupHosts(const json& hosts, HypervisorConnection& conn) {
    if (hosts.is_null()) {
        return {};
    }
    if (!hosts.is_array()) {
        throw ConfigError("hosts must be a list of host rules");
    }

    std::set<std::string> inventory = conn.listAllDomainNames();
    std::map<std::string, std::optional<std::vector<std::string>>> included;
    std::set<std::string> excluded;

    for (const auto& hostConfig : hosts) {
        DomainMatch match = matchDomainsFromHostConfig(hostConfig, inventory);
        if (match.exclude) {
            excluded.insert(match.domains.begin(), match.domains.end());
            continue;
        }
        for (const auto& name : match.domains) {
            auto it = included.find(name);
            if (it == included.end()) {
                included.emplace(name, match.disks);
            } else if (it->second && match.disks) {
                it->second = mergeDisks(*it->second, *match.disks);
            } else {
                it->second.reset();
            }
        }
    }

    std::vector<DomainSelection> selections;
    for (const auto& entry : included) {
        if (!excluded.count(entry.first)) {
            selections.emplace_back(entry.first, entry.second);
        }
    }
    return selections;
}
