#include "backup/backup_definition.hpp"
#include "common/errors.hpp"
#include "common/file_utils.hpp"
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

const char* const PENDING_LEDGER_SUFFIX = ".json.pending";

namespace {

void identityToJson(const BackupIdentity& identity, json& out) {
    out["compression"] = compressionToJson(identity.compression);
    out["compression_lvl"] = identity.compressionLevel ? json(*identity.compressionLevel) : json(nullptr);
    out["domain_id"] = identity.domainId;
    out["domain_name"] = identity.domainName;
    out["domain_xml"] = identity.domainXml;
    out["version"] = identity.version;
    if (identity.date) {
        out["date"] = std::chrono::duration_cast<std::chrono::seconds>(
            identity.date->time_since_epoch()).count();
    }
}

void identityFromJson(const json& in, BackupIdentity& identity) {
    identity.compression = compressionFromJson(in.value("compression", json("tar")));
    if (in.contains("compression_lvl") && !in["compression_lvl"].is_null()) {
        identity.compressionLevel = in["compression_lvl"].get<int>();
    }
    identity.domainId = in.value("domain_id", -1);
    identity.domainName = in.at("domain_name").get<std::string>();
    identity.domainXml = in.value("domain_xml", std::string());
    identity.version = in.value("version", std::string());
    if (in.contains("date") && !in["date"].is_null()) {
        identity.date = std::chrono::system_clock::time_point(
            std::chrono::seconds(in["date"].get<int64_t>()));
    }
}

} // namespace

json BackupDefinition::toJson() const {
    json out;
    identityToJson(*this, out);
    out["disks"] = json::object();
    for (const auto& disk : disks) {
        out["disks"][disk.first] = disk.second;
    }
    if (archiveFilename) {
        out["tar"] = *archiveFilename;
    }
    return out;
}

BackupDefinition BackupDefinition::fromJson(const json& in) {
    BackupDefinition definition;
    identityFromJson(in, definition);
    if (in.contains("disks")) {
        for (const auto& disk : in["disks"].items()) {
            definition.disks[disk.key()] = disk.value().get<std::string>();
        }
    }
    if (in.contains("tar") && in["tar"].is_string()) {
        definition.archiveFilename = in["tar"].get<std::string>();
    }
    return definition;
}

json PendingLedger::toJson() const {
    json out;
    identityToJson(*this, out);
    out["disks"] = json::object();
    for (const auto& disk : disks) {
        json entry = {
            {"src", disk.second.src},
            {"snapshot", disk.second.snapshot}
        };
        if (disk.second.target) {
            entry["target"] = *disk.second.target;
        }
        out["disks"][disk.first] = entry;
    }
    if (archiveFilename) {
        out["tar"] = *archiveFilename;
    }
    return out;
}

PendingLedger PendingLedger::fromJson(const json& in) {
    PendingLedger ledger;
    identityFromJson(in, ledger);
    if (in.contains("disks")) {
        for (const auto& disk : in["disks"].items()) {
            PendingDisk pending;
            pending.src = disk.value().at("src").get<std::string>();
            pending.snapshot = disk.value().at("snapshot").get<std::string>();
            if (disk.value().contains("target") && disk.value()["target"].is_string()) {
                pending.target = disk.value()["target"].get<std::string>();
            }
            ledger.disks[disk.key()] = pending;
        }
    }
    if (in.contains("tar") && in["tar"].is_string()) {
        ledger.archiveFilename = in["tar"].get<std::string>();
    }
    return ledger;
}

PendingLedger PendingLedger::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("Failed to open pending ledger " + path);
    }
    try {
        json content;
        file >> content;
        return fromJson(content);
    } catch (const json::exception& e) {
        throw ConfigError("Invalid pending ledger " + path + ": " + e.what());
    }
}

void PendingLedger::save(const std::string& path) const {
    file_utils::writeFileAtomically(path, toJson().dump(4));
}

std::string formatBackupName(std::chrono::system_clock::time_point date,
                             int domainId,
                             const std::string& domainName) {
    std::time_t time = std::chrono::system_clock::to_time_t(date);
    std::tm local{};
    localtime_r(&time, &local);

    std::stringstream ss;
    ss << std::put_time(&local, "%Y%m%d-%H%M%S") << "_" << domainId << "_" << domainName;
    return ss.str();
}

std::string formatDiskBackupName(std::chrono::system_clock::time_point date,
                                 int domainId,
                                 const std::string& domainName,
                                 const std::string& devName) {
    return formatBackupName(date, domainId, domainName) + "_" + devName;
}
