#pragma once

#include "backup/hypervisor.hpp"
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include <nlohmann/json.hpp>

// Domains selected by one host rule of a group.
struct DomainMatch {
    std::set<std::string> domains;
    bool exclude{false};
    std::optional<std::vector<std::string>> disks;  // unset: every disk
};

// Domain name with the disks to back up (unset: every disk).
using DomainSelection = std::pair<std::string, std::optional<std::vector<std::string>>>;

// Host rule syntax:
//   "name"        the domain called name, if it exists
//   "r:<regex>"   every domain whose whole name matches regex (ECMAScript)
//   "!<rule>"     exclude what <rule> matches
std::set<std::string> patternMatchingDomains(const std::string& pattern,
                                             const std::set<std::string>& inventory,
                                             bool& exclude);

// Accepts a rule string or {"host": rule, "disks": [dev...]}. Throws
// ConfigError for anything else.
DomainMatch matchDomainsFromHostConfig(const nlohmann::json& hostConfig,
                                       const std::set<std::string>& inventory);
DomainMatch matchDomainsFromHostConfig(const nlohmann::json& hostConfig,
                                       HypervisorConnection& conn);

// Union of the included domains minus every excluded one, in name order.
// Disk subsets of a domain matched twice are merged; "every disk" wins.
std::vector<DomainSelection> resolveGroupHosts(const nlohmann::json& hosts,
                                               HypervisorConnection& conn);
