#include "backup/backup_cli.hpp"
#include "backup/backup_manager.hpp"
#include "backup/stream_source.hpp"
#include "backup/stream_verifier.hpp"
#include "common/errors.hpp"
#include "common/file_lock.hpp"
#include "common/logger.hpp"
#include "main/backup_main.hpp"
#include <iomanip>
#include <iostream>
#include <sstream>

namespace {

std::string formatBytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    std::ostringstream out;
    out << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << value << " " << units[unit];
    return out.str();
}

} // namespace

BackupCLI::BackupCLI(const AppConfig& config, CancellationToken& cancel)
    : config_(config)
    , cancel_(cancel)
    , remotes_(config) {
}

BackupCLI::~BackupCLI() = default;

int BackupCLI::run(int argc, char* argv[]) {
    if (argc < 1) {
        printUsage();
        return 1;
    }

    std::string command = argv[0];
    CliOptions options = parseCliOptions(argc - 1, argv + 1);
    if (options.help) {
        printUsage();
        return 0;
    }

    if (command == "backup") {
        return handleBackupCommand(options);
    } else if (command == "list") {
        return handleListCommand(options);
    } else if (command == "status") {
        return handleStatusCommand(options);
    } else if (command == "clean") {
        return handleCleanCommand(options);
    } else if (command == "verify-stream") {
        return handleVerifyStreamCommand(options);
    }

    std::cerr << "Unknown command: " << command << std::endl;
    printUsage();
    return 1;
}

void BackupCLI::printUsage() const {
    printBackupUsage();
}

std::string BackupCLI::destinationFor(const CliOptions& options, const std::string& dataset) const {
    return options.destinationPath.empty() ? destinationPathFor(dataset) : options.destinationPath;
}

std::unique_ptr<BackupManager> BackupCLI::createManager(const CliOptions& options, bool needsEncoder) {
    std::shared_ptr<StreamSourceFactory> sources;
    std::shared_ptr<SnapshotManager> snapshots;
    if (options.sourceType == "file") {
        sources = std::make_shared<FileStreamSourceFactory>();
    } else {
        sources = std::make_shared<ZfsStreamSourceFactory>();
        snapshots = std::make_shared<SnapshotManager>(config_.snapshots.prefix);
    }

    std::shared_ptr<ShardEncoder> encoder;
    if (needsEncoder) {
        if (config_.encryption.recipientKeyFile.empty()) {
            throw ConfigurationError("No recipient key configured (encryption.recipientKeyFile or SNAPSHARD_RECIPIENT_KEY)");
        }
        try {
            encoder = std::make_shared<ShardEncoder>(RecipientKey::loadPem(config_.encryption.recipientKeyFile),
                                                     config_.shard.compressionLevel);
        } catch (const CodecError& e) {
            throw ConfigurationError(e.what());
        }
    }

    return std::make_unique<BackupManager>(config_, remotes_.get(options.remote), sources, snapshots, encoder);
}

int BackupCLI::handleBackupCommand(const CliOptions& options) {
    if (options.positional.size() != 1) {
        std::cerr << "Usage: snapshard backup <dataset[@snapshot]> [options]" << std::endl;
        return 1;
    }

    BackupRequest request;
    if (options.sourceType == "file") {
        request.dataset = options.positional[0];
    } else {
        splitSnapshotIdentifier(options.positional[0], request.dataset, request.snapshot);
    }
    request.since = options.since;
    request.forceFull = options.full;
    request.shardSize = options.shardSize;
    request.prefix = options.prefix;
    request.destinationPath = options.destinationPath;

    std::unique_ptr<BackupManager> manager = createManager(options, true);
    manager->setShardCallback([](const ShardMetadata& shard) {
        std::cout << "  shard " << shard.index << ": " << formatBytes(shard.plaintextSize) << " -> "
                  << formatBytes(shard.ciphertextSize) << (shard.isFinal ? " (final)" : "") << std::endl;
    });

    BackupReport report = manager->runBackup(request, &cancel_);

    std::cout << "Backup " << report.job.backupPrefix << " of " << report.job.sourceIdentifier
              << (report.resumed ? " (resumed)" : "") << "\n"
              << "  destination:   " << report.job.destinationPath << "\n"
              << "  shard size:    " << formatBytes(report.shardSizeTarget) << "\n"
              << "  uploaded:      " << report.result.shardsUploaded << " shards, "
              << formatBytes(report.result.bytesStreamed) << "\n"
              << "  total shards:  " << report.result.totalShards << "\n"
              << "  state:         " << completionStateToString(report.state) << std::endl;
    if (report.snapshotsPruned > 0) {
        std::cout << "  pruned " << report.snapshotsPruned << " old snapshots" << std::endl;
    }
    return report.state == CompletionState::Complete ? 0 : 1;
}

int BackupCLI::handleListCommand(const CliOptions& options) {
    if (options.positional.size() != 1) {
        std::cerr << "Usage: snapshard list <dataset> [options]" << std::endl;
        return 1;
    }

    std::string destination = destinationFor(options, options.positional[0]);
    std::unique_ptr<BackupManager> manager = createManager(options, false);
    std::vector<BackupSummary> backups = manager->listBackups(destination);
    if (backups.empty()) {
        std::cout << "No backups under " << destination << std::endl;
        return 0;
    }

    std::cout << std::left << std::setw(48) << "PREFIX" << std::setw(8) << "SHARDS"
              << std::setw(14) << "STORED" << "STATE" << std::endl;
    for (const auto& backup : backups) {
        std::cout << std::left << std::setw(48) << backup.prefix << std::setw(8) << backup.shardCount
                  << std::setw(14) << formatBytes(backup.storedBytes)
                  << (backup.error.empty() ? completionStateToString(backup.state) : "inconsistent: " + backup.error)
                  << std::endl;
    }
    return 0;
}

int BackupCLI::handleStatusCommand(const CliOptions& options) {
    if (options.positional.size() != 2) {
        std::cerr << "Usage: snapshard status <dataset> <backupPrefix> [options]" << std::endl;
        return 1;
    }

    std::string destination = destinationFor(options, options.positional[0]);
    std::unique_ptr<BackupManager> manager = createManager(options, false);
    RemoteShardSet set = manager->status(destination, options.positional[1]);

    for (const auto& shard : set.shards) {
        std::cout << std::left << std::setw(64) << shard.objectName
                  << std::right << std::setw(14) << shard.byteOffset
                  << std::setw(14) << (shard.plaintextSize ? std::to_string(*shard.plaintextSize) : "?")
                  << std::setw(14) << shard.ciphertextSize
                  << (shard.isFinal && *shard.isFinal ? "  final" : "") << std::endl;
    }

    CompletionState state = CompletionDetector::evaluate(set.shards);
    std::cout << set.shards.size() << " shards, " << completionStateToString(state);
    if (auto gap = RemoteInventory::firstGap(set.shards)) {
        std::cout << ", first missing shard " << *gap;
    }
    if (auto bytes = set.storedBytes()) {
        std::cout << ", " << formatBytes(*bytes) << " of stream stored";
    }
    std::cout << std::endl;
    return state == CompletionState::Complete ? 0 : 1;
}

int BackupCLI::handleCleanCommand(const CliOptions& options) {
    if (options.positional.size() != 2) {
        std::cerr << "Usage: snapshard clean <dataset> <backupPrefix> --yes [options]" << std::endl;
        return 1;
    }

    const std::string& dataset = options.positional[0];
    std::string destination = destinationFor(options, dataset);
    if (!options.yes) {
        std::cerr << "Refusing to delete " << options.positional[1] << " under " << destination
                  << " without --yes" << std::endl;
        return 1;
    }

    FileLock lock(config_.lockDir, dataset);
    if (!lock.tryLock()) {
        throw ResourceBusy("Another operation holds the lock on " + dataset);
    }

    std::unique_ptr<BackupManager> manager = createManager(options, false);
    size_t removed = manager->cleanBackup(destination, options.positional[1]);
    std::cout << "Deleted " << removed << " objects of " << options.positional[1] << std::endl;
    return 0;
}

int BackupCLI::handleVerifyStreamCommand(const CliOptions& options) {
    if (options.positional.size() != 1) {
        std::cerr << "Usage: snapshard verify-stream <dataset@snapshot> [--since <snapshot>]" << std::endl;
        return 1;
    }

    std::shared_ptr<StreamSourceFactory> sources;
    if (options.sourceType == "file") {
        sources = std::make_shared<FileStreamSourceFactory>();
    } else {
        sources = std::make_shared<ZfsStreamSourceFactory>();
    }

    StreamVerifier verifier(sources);
    VerificationResult result = verifier.verify(options.positional[0], options.since, &cancel_);

    std::cout << "pass 1: " << result.firstLength << " bytes, sha256 " << result.firstDigest << "\n"
              << "pass 2: " << result.secondLength << " bytes, sha256 " << result.secondDigest << std::endl;
    if (!result.success) {
        std::cout << "Export is NOT deterministic: " << result.errorMessage << std::endl;
        return 1;
    }
    std::cout << "Export is deterministic" << std::endl;
    return 0;
}
