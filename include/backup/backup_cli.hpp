#pragma once

#include "backup/job_group.hpp"
#include "common/app_config.hpp"
#include <memory>
#include <string>
#include <vector>

// Parsed command line of the virtbackup executable.
struct CommandLine {
    std::string configPath = "/etc/virtbackup/config.json";
    std::string command;              // "backup", "clean", "help" or "version"
    std::vector<std::string> groups;  // empty: every configured group
};

class BackupCLI {
public:
    BackupCLI() = default;

    // argv[0] is the program name. Returns the process exit code.
    int run(int argc, char* argv[]);

    // Throws ConfigError on unknown options or a missing command.
    static CommandLine parseArguments(int argc, char* argv[]);

    // Entries of groupsConfig named in selected, all of them if selected is
    // empty. Throws ConfigError for a name that is not configured.
    static nlohmann::json selectGroups(const nlohmann::json& groupsConfig,
                                       const std::vector<std::string>& selected);

    static void printUsage();

private:
    int handleBackupCommand(const std::vector<std::shared_ptr<JobGroup>>& groups);
    int handleCleanCommand(const std::vector<std::shared_ptr<JobGroup>>& groups,
                           HypervisorConnection& conn);

    AppConfig config_;
};
