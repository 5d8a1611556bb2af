#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backup/backup_job.hpp"
#include "backup/completion_detector.hpp"
#include "backup/remote_inventory.hpp"
#include "backup/shard_pipeline.hpp"
#include "backup/snapshot_manager.hpp"
#include "common/config.hpp"

class CancellationToken;

struct BackupRequest {
    std::string dataset;          // dataset, or a file path for file sources
    std::string snapshot;         // short snapshot name; empty to resume or create one
    std::string since;            // explicit incremental base
    bool forceFull = false;
    std::optional<uint64_t> shardSize;
    std::string prefix;           // overrides the derived backup prefix
    std::string destinationPath;  // overrides the derived destination
};

struct BackupReport {
    BackupJob job;
    PipelineResult result;
    CompletionState state = CompletionState::Unknown;
    uint64_t shardSizeTarget = 0;
    bool resumed = false;
    bool snapshotCreated = false;
    int snapshotsPruned = 0;
};

struct BackupSummary {
    std::string prefix;
    uint64_t shardCount = 0;
    uint64_t storedBytes = 0;  // ciphertext
    std::optional<uint64_t> plaintextBytes;
    CompletionState state = CompletionState::Unknown;
    std::string error;         // set when the listing is inconsistent
};

class BackupManager {
public:
    // snapshots may be null for non-ZFS sources.
    BackupManager(const AppConfig& config,
                  std::shared_ptr<RemoteStore> store,
                  std::shared_ptr<StreamSourceFactory> sources,
                  std::shared_ptr<SnapshotManager> snapshots,
                  std::shared_ptr<ShardEncoder> encoder);

    // Takes the dataset lock for the duration of the run.
    BackupReport runBackup(const BackupRequest& request, const CancellationToken* cancel = nullptr);

    // Backup operations
    std::vector<BackupSummary> listBackups(const std::string& destinationPath);
    RemoteShardSet status(const std::string& destinationPath, const std::string& backupPrefix);
    size_t cleanBackup(const std::string& destinationPath, const std::string& backupPrefix);

    // Newest incomplete backup of this dataset whose recorded source is
    // still exportable.
    std::optional<BackupJob> findResumableJob(const std::string& destinationPath, const std::string& dataset);

    void setShardCallback(ShardPipeline::ShardCallback callback) { shardCallback_ = std::move(callback); }

private:
    BackupJob prepareSnapshotJob(const BackupRequest& request, const std::string& destinationPath,
                                 BackupReport& report);
    BackupJob prepareFileJob(const BackupRequest& request, const std::string& destinationPath);
    std::string chooseIncrementalBase(const BackupRequest& request, const std::string& sourceIdentifier,
                                      const std::string& destinationPath);
    bool hasCompleteBackupOf(const std::string& destinationPath, const std::string& snapshotName);
    uint64_t chooseShardTarget(const BackupRequest& request, const BackupJob& job);

    AppConfig config_;
    std::shared_ptr<RemoteStore> store_;
    std::shared_ptr<StreamSourceFactory> sources_;
    std::shared_ptr<SnapshotManager> snapshots_;
    std::shared_ptr<ShardEncoder> encoder_;
    RemoteInventory inventory_;
    ShardPipeline::ShardCallback shardCallback_;
};
