#include "backup/backup_cli.hpp"
#include <exception>
#include <iostream>

int main(int argc, char** argv) {
    try {
        BackupCLI cli;
        return cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        return 1;
    }
}
