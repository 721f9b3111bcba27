#include "backup/backup_cli.hpp"
#include "backup/group_factory.hpp"
#include "backup/kvm/libvirt_connection.hpp"
#include "backup/kvm/libvirt_snapshot_coordinator.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/version.hpp"
#include <iostream>

using json = nlohmann::json;

void BackupCLI::printUsage() {
    std::cout << "Usage: virtbackup [options] command [group...]\n"
              << "Commands:\n"
              << "  backup    - Back up the given groups, or all of them\n"
              << "  clean     - Roll back interrupted backups of the given groups\n"
              << "\n"
              << "Options:\n"
              << "  -c, --config FILE  Configuration file (default /etc/virtbackup/config.json)\n"
              << "  -h, --help         Show this help message\n"
              << "  -v, --version      Show version information\n";
}

CommandLine BackupCLI::parseArguments(int argc, char* argv[]) {
    CommandLine commandLine;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") {
            commandLine.command = "help";
            return commandLine;
        } else if (arg == "-v" || arg == "--version") {
            commandLine.command = "version";
            return commandLine;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                throw ConfigError(arg + " requires a file");
            }
            commandLine.configPath = argv[++i];
        } else if (!arg.empty() && arg[0] == '-') {
            throw ConfigError("unknown option: " + arg);
        } else if (commandLine.command.empty()) {
            if (arg != "backup" && arg != "clean") {
                throw ConfigError("unknown command: " + arg);
            }
            commandLine.command = arg;
        } else {
            commandLine.groups.push_back(arg);
        }
    }

    if (commandLine.command.empty()) {
        throw ConfigError("no command specified");
    }
    return commandLine;
}

json BackupCLI::selectGroups(const json& groupsConfig, const std::vector<std::string>& selected) {
    if (selected.empty()) {
        return groupsConfig;
    }

    json result = json::object();
    for (const auto& name : selected) {
        if (!groupsConfig.contains(name)) {
            throw ConfigError("no group named " + name + " in the configuration");
        }
        result[name] = groupsConfig[name];
    }
    return result;
}

int BackupCLI::run(int argc, char* argv[]) {
    CommandLine commandLine;
    try {
        commandLine = parseArguments(argc, argv);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        printUsage();
        return 1;
    }

    if (commandLine.command == "help") {
        printUsage();
        return 0;
    }
    if (commandLine.command == "version") {
        std::cout << "virtbackup version " << VIRTBACKUP_VERSION << std::endl;
        return 0;
    }

    try {
        config_ = AppConfig::load(commandLine.configPath);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    if (!Logger::initialize(config_.logPath, config_.logLevel)) {
        std::cerr << "Failed to initialize logger" << std::endl;
        return 1;
    }

    LibvirtConnection conn;
    if (!conn.connect(config_.uri, config_.username, config_.password)) {
        Logger::error("Failed to connect to " + config_.uri + ": " + conn.getLastError());
        Logger::shutdown();
        return 1;
    }

    int result = 1;
    try {
        auto provider = std::make_shared<LibvirtSnapshotProvider>();
        auto groups = buildGroupsFromConfig(selectGroups(config_.groups, commandLine.groups), conn, provider);

        if (commandLine.command == "backup") {
            result = handleBackupCommand(groups);
        } else {
            result = handleCleanCommand(groups, conn);
        }
    } catch (const BackupError& e) {
        Logger::error(e.what());
    } catch (const std::exception& e) {
        Logger::fatal(std::string("Unexpected error: ") + e.what());
    }

    conn.disconnect();
    Logger::shutdown();
    return result;
}

int BackupCLI::handleBackupCommand(const std::vector<std::shared_ptr<JobGroup>>& groups) {
    int result = 0;
    for (const auto& group : groups) {
        try {
            if (config_.threads > 1) {
                group->startConcurrent(config_.threads);
            } else {
                group->start();
            }
        } catch (const GroupBackupFailureError& e) {
            for (const auto& failure : e.failures()) {
                Logger::error(group->getName() + ": " + failure.job->getDomainName() + ": " +
                              describeException(failure.error));
            }
            result = 1;
        }
    }
    return result;
}

int BackupCLI::handleCleanCommand(const std::vector<std::shared_ptr<JobGroup>>& groups,
                                  HypervisorConnection& conn) {
    size_t cleaned = 0;
    for (const auto& group : groups) {
        cleaned += group->cleanAborted(conn);
    }
    Logger::info("Cleaned " + std::to_string(cleaned) + " interrupted backup(s)");
    return 0;
}
