#include "backup/backup_manager.hpp"
#include "backup/shard_planner.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/file_lock.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <ctime>
#include <filesystem>

namespace {

std::string snapshotPart(const std::string& identifier) {
    size_t at = identifier.find('@');
    return at == std::string::npos ? identifier : identifier.substr(at + 1);
}

} // namespace

BackupManager::BackupManager(const AppConfig& config,
                             std::shared_ptr<RemoteStore> store,
                             std::shared_ptr<StreamSourceFactory> sources,
                             std::shared_ptr<SnapshotManager> snapshots,
                             std::shared_ptr<ShardEncoder> encoder)
    : config_(config)
    , store_(store)
    , sources_(std::move(sources))
    , snapshots_(std::move(snapshots))
    , encoder_(std::move(encoder))
    , inventory_(store) {
}

std::optional<BackupJob> BackupManager::findResumableJob(const std::string& destinationPath,
                                                         const std::string& dataset) {
    std::optional<BackupJob> candidate;
    for (const auto& prefix : inventory_.listBackupPrefixes(destinationPath)) {
        RemoteShardSet set;
        try {
            set = inventory_.scan(destinationPath, prefix);
        } catch (const InconsistentRemoteState& e) {
            Logger::warning("Skipping " + prefix + " while looking for a resumable backup: " + e.what());
            continue;
        }
        if (!set.lastMetadata ||
            CompletionDetector::evaluate(set.shards) != CompletionState::InProgress) {
            continue;
        }

        const ShardMetadata& metadata = *set.lastMetadata;
        std::string sourceDataset;
        std::string snapshot;
        splitSnapshotIdentifier(metadata.sourceIdentifier, sourceDataset, snapshot);
        if (sourceDataset != dataset || snapshot.empty()) {
            continue;
        }
        if (snapshots_ && !snapshots_->snapshotExists(metadata.sourceIdentifier)) {
            Logger::warning("Incomplete backup " + prefix + " cannot resume: " +
                            metadata.sourceIdentifier + " no longer exists");
            continue;
        }

        if (!candidate || snapshotPart(candidate->sourceIdentifier) < snapshot) {
            BackupJob job;
            job.sourceIdentifier = metadata.sourceIdentifier;
            job.sinceIdentifier = metadata.sinceIdentifier;
            job.backupPrefix = prefix;
            job.destinationPath = destinationPath;
            candidate = job;
        }
    }
    return candidate;
}

bool BackupManager::hasCompleteBackupOf(const std::string& destinationPath, const std::string& snapshotName) {
    for (bool incremental : {false, true}) {
        std::string prefix = makeBackupPrefix(snapshotName, incremental);
        RemoteShardSet set = inventory_.scan(destinationPath, prefix);
        if (CompletionDetector::isComplete(set.shards)) {
            return true;
        }
    }
    return false;
}

std::string BackupManager::chooseIncrementalBase(const BackupRequest& request, const std::string& sourceIdentifier,
                                                 const std::string& destinationPath) {
    if (request.forceFull) {
        return "";
    }
    if (!request.since.empty()) {
        return request.since.find('@') == std::string::npos ? request.dataset + "@" + request.since : request.since;
    }
    if (!config_.snapshots.incremental) {
        return "";
    }

    std::optional<std::string> previous = snapshots_->previousSnapshot(request.dataset, sourceIdentifier);
    if (!previous) {
        Logger::info("No previous snapshot of " + request.dataset + ", sending a full stream");
        return "";
    }
    if (!hasCompleteBackupOf(destinationPath, snapshotPart(*previous))) {
        Logger::info("Previous snapshot " + *previous + " has no complete remote backup, sending a full stream");
        return "";
    }
    return *previous;
}

BackupJob BackupManager::prepareSnapshotJob(const BackupRequest& request, const std::string& destinationPath,
                                            BackupReport& report) {
    BackupJob job;
    job.destinationPath = destinationPath;

    if (!request.snapshot.empty()) {
        job.sourceIdentifier = request.dataset + "@" + request.snapshot;
        if (!snapshots_->snapshotExists(job.sourceIdentifier)) {
            throw SourceUnavailable("Snapshot does not exist: " + job.sourceIdentifier);
        }
    } else if (request.prefix.empty()) {
        if (auto resumable = findResumableJob(destinationPath, request.dataset)) {
            Logger::info("Resuming incomplete backup " + resumable->backupPrefix + " of " +
                         resumable->sourceIdentifier);
            report.resumed = true;
            return *resumable;
        }
    }

    if (job.sourceIdentifier.empty()) {
        job.sourceIdentifier = snapshots_->createSnapshot(request.dataset);
        report.snapshotCreated = true;
    }

    job.sinceIdentifier = chooseIncrementalBase(request, job.sourceIdentifier, destinationPath);
    job.backupPrefix = request.prefix.empty()
        ? makeBackupPrefix(snapshotPart(job.sourceIdentifier), job.isIncremental())
        : request.prefix;
    return job;
}

BackupJob BackupManager::prepareFileJob(const BackupRequest& request, const std::string& destinationPath) {
    if (!request.since.empty()) {
        throw ConfigurationError("--since is only supported for ZFS sources");
    }
    BackupJob job;
    job.sourceIdentifier = request.dataset;
    job.destinationPath = destinationPath;
    job.backupPrefix = request.prefix.empty()
        ? makeBackupPrefix(std::filesystem::path(request.dataset).filename().string(), false)
        : request.prefix;
    return job;
}

uint64_t BackupManager::chooseShardTarget(const BackupRequest& request, const BackupJob& job) {
    if (request.shardSize) {
        return *request.shardSize;
    }

    RemoteShardSet existing = inventory_.scan(job.destinationPath, job.backupPrefix);
    if (existing.lastMetadata && existing.lastMetadata->shardSizeTarget > 0) {
        Logger::info("Reusing shard size " + std::to_string(existing.lastMetadata->shardSizeTarget) +
                     " recorded by existing shards");
        return existing.lastMetadata->shardSizeTarget;
    }

    ShardPlanner planner(config_.shard.minSize, config_.shard.maxSize, config_.shard.defaultSize);
    std::optional<uint64_t> configured;
    if (config_.shard.size > 0) {
        configured = config_.shard.size;
    }
    std::optional<uint64_t> used;
    if (!configured) {
        if (snapshots_) {
            used = snapshots_->datasetUsedBytes(request.dataset);
        } else {
            std::error_code ec;
            uint64_t size = std::filesystem::file_size(request.dataset, ec);
            if (!ec) {
                used = size;
            }
        }
    }
    return planner.plan(used, configured);
}

BackupReport BackupManager::runBackup(const BackupRequest& request, const CancellationToken* cancel) {
    if (request.dataset.empty()) {
        throw ConfigurationError("No dataset given");
    }

    FileLock lock(config_.lockDir, request.dataset);
    if (!lock.tryLock()) {
        throw ResourceBusy("Another operation holds the lock on " + request.dataset +
                                      " (" + lock.path() + ")");
    }

    std::string destinationPath = request.destinationPath.empty()
        ? destinationPathFor(request.dataset)
        : request.destinationPath;

    BackupReport report;
    report.job = snapshots_ ? prepareSnapshotJob(request, destinationPath, report)
                            : prepareFileJob(request, destinationPath);
    report.shardSizeTarget = chooseShardTarget(request, report.job);

    Logger::info("Backing up " + report.job.sourceIdentifier +
                 (report.job.isIncremental() ? " since " + report.job.sinceIdentifier : std::string(" (full)")) +
                 " to " + store_->name() + ":" + destinationPath + " as " + report.job.backupPrefix +
                 " with shard size " + std::to_string(report.shardSizeTarget));

    ShardPipeline pipeline(store_, sources_, encoder_, config_.tempDir, config_.shard.extension);
    if (shardCallback_) {
        pipeline.setShardCallback(shardCallback_);
    }
    report.result = pipeline.run(report.job, report.shardSizeTarget, cancel);

    RemoteShardSet set = inventory_.scan(destinationPath, report.job.backupPrefix);
    report.state = CompletionDetector::evaluate(set.shards, report.shardSizeTarget);
    Logger::info("Backup " + report.job.backupPrefix + " is " + completionStateToString(report.state) +
                 " with " + std::to_string(set.shards.size()) + " shards");

    if (report.snapshotCreated && report.state == CompletionState::Complete && config_.snapshots.retentionDays > 0) {
        report.snapshotsPruned = snapshots_->pruneSnapshots(request.dataset, config_.snapshots.retentionDays,
                                                            std::time(nullptr));
    }
    return report;
}

std::vector<BackupSummary> BackupManager::listBackups(const std::string& destinationPath) {
    std::vector<BackupSummary> summaries;
    for (const auto& prefix : inventory_.listBackupPrefixes(destinationPath)) {
        BackupSummary summary;
        summary.prefix = prefix;
        try {
            RemoteShardSet set = inventory_.scan(destinationPath, prefix);
            summary.shardCount = set.shards.size();
            for (const auto& shard : set.shards) {
                summary.storedBytes += shard.ciphertextSize;
            }
            summary.plaintextBytes = set.storedBytes();
            summary.state = CompletionDetector::evaluate(set.shards);
        } catch (const InconsistentRemoteState& e) {
            summary.error = e.what();
        }
        summaries.push_back(summary);
    }
    return summaries;
}

RemoteShardSet BackupManager::status(const std::string& destinationPath, const std::string& backupPrefix) {
    return inventory_.scan(destinationPath, backupPrefix);
}

size_t BackupManager::cleanBackup(const std::string& destinationPath, const std::string& backupPrefix) {
    std::vector<std::string> names = inventory_.listBackupObjects(destinationPath, backupPrefix);
    for (const auto& name : names) {
        try {
            store_->remove(remoteJoin(destinationPath, name));
        } catch (const StorageError& e) {
            throw UploadFailure("Cannot delete " + name + ": " + e.what());
        }
        Logger::info("Deleted " + name);
    }
    return names.size();
}
