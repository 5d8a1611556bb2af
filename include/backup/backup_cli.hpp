#pragma once

#include <memory>
#include <string>

#include "common/cancellation.hpp"
#include "common/config.hpp"
#include "main/cli_options.hpp"
#include "storage/remote_store_factory.hpp"

class BackupManager;

// Backup-side commands: backup, list, status, clean, verify-stream.
class BackupCLI {
public:
    BackupCLI(const AppConfig& config, CancellationToken& cancel);
    ~BackupCLI();

    // argv[0] is the command name. Returns the process exit status.
    int run(int argc, char* argv[]);
    void printUsage() const;

private:
    int handleBackupCommand(const CliOptions& options);
    int handleListCommand(const CliOptions& options);
    int handleStatusCommand(const CliOptions& options);
    int handleCleanCommand(const CliOptions& options);
    int handleVerifyStreamCommand(const CliOptions& options);

    std::unique_ptr<BackupManager> createManager(const CliOptions& options, bool needsEncoder);
    std::string destinationFor(const CliOptions& options, const std::string& dataset) const;

    AppConfig config_;
    CancellationToken& cancel_;
    RemoteStoreRegistry remotes_;
};
