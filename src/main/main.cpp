#include "backup/backup_cli.hpp"
#include "common/logger.hpp"
#include <iostream>

int main(int argc, char** argv) {
    int exitCode = 1;
    try {
        BackupCLI cli;
        exitCode = cli.run(argc, argv);
    } catch (const std::exception& e) {
        std::cerr << "Error in main: " << e.what() << std::endl;
        if (Logger::isInitialized()) {
            Logger::error("Error in main: " + std::string(e.what()));
        }
    }

    Logger::shutdown();
    return exitCode;
}
