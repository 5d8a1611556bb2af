#include "main/backup_main.hpp"
#include "main/cli_options.hpp"
#include "main/restore_main.hpp"
#include "common/logger.hpp"
#include <iostream>
#include <string>

namespace {

const char* kVersion = "1.0.0";

void printUsage() {
    std::cout << "Usage: snapshard <command> [options]\n"
              << "\n";
    printBackupUsage();
    std::cout << "\n";
    printRestoreUsage();
    std::cout << "\n"
              << "  snapshard --version      Show version information\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "Error: No command specified" << std::endl;
        printUsage();
        return 1;
    }

    std::string command = argv[1];
    if (command == "--help" || command == "-h" || command == "help") {
        printUsage();
        return 0;
    }
    if (command == "--version") {
        std::cout << "snapshard version " << kVersion << std::endl;
        return 0;
    }

    int status = 1;
    try {
        if (command == "backup" || command == "list" || command == "status" ||
            command == "clean" || command == "verify-stream") {
            status = backupMain(argc - 1, argv + 1);
        } else if (command == "restore") {
            status = restoreMain(argc - 1, argv + 1);
        } else {
            std::cerr << "Error: Unknown command: " << command << std::endl;
            printUsage();
            status = 1;
        }
    } catch (const std::exception& e) {
        if (Logger::isInitialized()) {
            Logger::error(command + " failed: " + e.what());
        } else {
            std::cerr << "Error: " << e.what() << std::endl;
        }
        status = exitCodeFor(e);
    }

    Logger::shutdown();
    return status;
}
