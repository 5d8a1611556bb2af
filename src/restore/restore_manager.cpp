#include "restore/restore_manager.hpp"
#include "backup/backup_job.hpp"
#include "common/errors.hpp"
#include "common/file_lock.hpp"
#include "common/logger.hpp"

RestoreManager::RestoreManager(const AppConfig& config,
                               std::shared_ptr<RemoteStore> store,
                               std::shared_ptr<StreamSinkFactory> sinks,
                               std::shared_ptr<SnapshotManager> snapshots,
                               std::shared_ptr<ShardDecoder> decoder)
    : config_(config)
    , store_(store)
    , sinks_(std::move(sinks))
    , snapshots_(std::move(snapshots))
    , decoder_(std::move(decoder))
    , inventory_(store) {
}

std::string RestoreManager::defaultTarget(const std::string& destinationPath, const std::string& backupPrefix) {
    std::optional<ShardMetadata> first = inventory_.loadMetadata(destinationPath, backupPrefix, 1);
    if (first && !first->sourceIdentifier.empty()) {
        std::string dataset;
        std::string snapshot;
        splitSnapshotIdentifier(first->sourceIdentifier, dataset, snapshot);
        return dataset + "-restored";
    }
    return destinationPath + "-restored";
}

void RestoreManager::prepareTarget(const RestoreRequest& request, const std::string& target) {
    if (!snapshots_ || !snapshots_->datasetExists(target)) {
        return;
    }
    if (!request.force) {
        throw SinkFailure("Target dataset " + target + " already exists; use --force to replace it");
    }
    snapshots_->destroyDataset(target);
}

RestoreResult RestoreManager::restore(const RestoreRequest& request, const CancellationToken* cancel) {
    if (request.destinationPath.empty() || request.backupPrefix.empty()) {
        throw ConfigurationError("Restore needs a destination path and a backup prefix");
    }

    std::string target = request.target.empty()
        ? defaultTarget(request.destinationPath, request.backupPrefix)
        : request.target;

    FileLock lock(config_.lockDir, target);
    if (!lock.tryLock()) {
        throw ResourceBusy("Another operation holds the lock on " + target + " (" + lock.path() + ")");
    }

    Logger::info("Restoring " + request.backupPrefix + " from " + store_->name() + ":" +
                 request.destinationPath + " into " + target);

    // Reject incomplete or damaged backups before the target is touched.
    RemoteShardSet set = inventory_.scan(request.destinationPath, request.backupPrefix);
    ReconstructionPipeline::validate(set, request.backupPrefix);

    prepareTarget(request, target);

    std::unique_ptr<ByteSink> sink = sinks_->openImport(target);
    ReconstructionPipeline pipeline(store_, decoder_, config_.tempDir);
    return pipeline.run(request.destinationPath, request.backupPrefix, *sink, cancel);
}
