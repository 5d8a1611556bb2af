#include "restore/reconstruction_pipeline.hpp"
#include "backup/completion_detector.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/temp_file.hpp"
#include <fstream>
#include <vector>

std::string restoreStateToString(RestoreState state) {
    switch (state) {
        case RestoreState::Discover:     return "DISCOVER";
        case RestoreState::Validate:     return "VALIDATE";
        case RestoreState::StreamDecode: return "STREAM_DECODE";
        case RestoreState::Sink:         return "SINK";
        case RestoreState::Done:         return "DONE";
        case RestoreState::Aborted:      return "ABORTED";
        default:                         return "UNKNOWN";
    }
}

ReconstructionPipeline::ReconstructionPipeline(std::shared_ptr<RemoteStore> store,
                                               std::shared_ptr<ShardDecoder> decoder,
                                               const std::string& tempDir)
    : store_(store)
    , decoder_(std::move(decoder))
    , inventory_(store)
    , tempDir_(tempDir)
    , state_(RestoreState::Discover) {
}

void ReconstructionPipeline::transition(RestoreState next) {
    state_ = next;
    Logger::debug("Reconstruction state: " + restoreStateToString(next));
    if (stateCallback_) {
        stateCallback_(next);
    }
}

RemoteShardSet ReconstructionPipeline::discover(const std::string& destinationPath,
                                                const std::string& backupPrefix) {
    RemoteShardSet set = inventory_.scan(destinationPath, backupPrefix);
    Logger::info("Found " + std::to_string(set.shards.size()) + " shards for " + backupPrefix +
                 " under " + destinationPath);
    return set;
}

void ReconstructionPipeline::validate(const RemoteShardSet& set, const std::string& backupPrefix) {
    if (set.empty()) {
        throw MissingShard(1, "No shards found for backup " + backupPrefix);
    }
    if (auto gap = RemoteInventory::firstGap(set.shards)) {
        throw MissingShard(*gap, "Backup " + backupPrefix + " is missing shard " + std::to_string(*gap));
    }
    RemoteInventory::verifyOffsets(set);
    RemoteInventory::verifyLastShardSize(set);

    const ShardDescriptor& last = set.shards.back();
    switch (CompletionDetector::evaluate(set.shards)) {
        case CompletionState::Complete:
            return;
        case CompletionState::InProgress:
            throw MissingShard(last.index + 1, "Backup " + backupPrefix + " is incomplete: shard " +
                                                   std::to_string(last.index) + " is not the final shard");
        default:
            throw InconsistentRemoteState("Cannot confirm that " + last.objectName +
                                          " is the final shard of " + backupPrefix + ": its sidecar is missing");
    }
}

std::unique_ptr<TempFile> ReconstructionPipeline::stage(const std::string& tag) const {
    try {
        return std::make_unique<TempFile>(tempDir_, tag);
    } catch (const std::runtime_error& e) {
        throw DownloadFailure(std::string("Cannot stage shard: ") + e.what());
    }
}

void ReconstructionPipeline::restoreShard(const std::string& destinationPath, const std::string& backupPrefix,
                                          const ShardDescriptor& shard, ByteSink& sink, RestoreResult& result,
                                          const CancellationToken* cancel) {
    transition(RestoreState::StreamDecode);

    std::optional<ShardMetadata> recorded = inventory_.loadMetadata(destinationPath, backupPrefix, shard.index);
    if (recorded && recorded->ciphertextSize != shard.ciphertextSize) {
        throw CorruptShard(shard.index, shard.objectName + " holds " + std::to_string(shard.ciphertextSize) +
                                            " bytes, its sidecar records " +
                                            std::to_string(recorded->ciphertextSize));
    }

    std::unique_ptr<TempFile> ciphertext = stage("download");
    try {
        store_->getFile(remoteJoin(destinationPath, shard.objectName), ciphertext->path(), cancel);
    } catch (const StorageError& e) {
        throw DownloadFailure("Download of " + shard.objectName + " failed: " + e.what());
    }
    if (ciphertext->size() != shard.ciphertextSize) {
        throw CorruptShard(shard.index, "Downloaded " + std::to_string(ciphertext->size()) + " bytes of " +
                                            shard.objectName + ", expected " + std::to_string(shard.ciphertextSize));
    }

    std::unique_ptr<TempFile> plaintext = stage("plain");
    uint64_t decoded;
    try {
        decoded = decoder_->decodeToFile(ciphertext->path(), plaintext->path(), cancel);
    } catch (const CodecError& e) {
        throw CorruptShard(shard.index, "Cannot decode " + shard.objectName + ": " + e.what());
    }
    ciphertext->remove();

    if (shard.plaintextSize && decoded != *shard.plaintextSize) {
        throw CorruptShard(shard.index, shard.objectName + " decoded to " + std::to_string(decoded) +
                                            " bytes, expected " + std::to_string(*shard.plaintextSize));
    }

    transition(RestoreState::Sink);
    std::ifstream in(plaintext->path(), std::ios::binary);
    if (!in) {
        throw SinkFailure("Cannot reopen decoded shard " + plaintext->path());
    }
    std::vector<char> buffer(1024 * 1024);
    while (in) {
        if (cancel) {
            cancel->throwIfCancelled("restore of " + shard.objectName);
        }
        in.read(buffer.data(), buffer.size());
        if (in.gcount() > 0) {
            sink.write(buffer.data(), static_cast<size_t>(in.gcount()));
        }
    }
    if (in.bad()) {
        throw SinkFailure("Read error on decoded shard " + plaintext->path());
    }

    result.bytesRestored += decoded;
    ++result.shardsRestored;
}

RestoreResult ReconstructionPipeline::run(const std::string& destinationPath, const std::string& backupPrefix,
                                          ByteSink& sink, const CancellationToken* cancel) {
    RestoreResult result;
    try {
        transition(RestoreState::Discover);
        RemoteShardSet set = discover(destinationPath, backupPrefix);

        transition(RestoreState::Validate);
        validate(set, backupPrefix);

        for (const auto& shard : set.shards) {
            if (cancel) {
                cancel->throwIfCancelled("restore of " + backupPrefix);
            }
            restoreShard(destinationPath, backupPrefix, shard, sink, result, cancel);
            Logger::info("Restored shard " + std::to_string(shard.index) + "/" +
                         std::to_string(set.shards.size()) + " (" + shard.objectName + ")");
            if (shardCallback_) {
                shardCallback_(shard, set.shards.size());
            }
        }

        sink.commit();
        transition(RestoreState::Done);
        Logger::info("Restore of " + backupPrefix + " complete: " + std::to_string(result.bytesRestored) + " bytes");
        return result;
    } catch (...) {
        sink.abort();
        transition(RestoreState::Aborted);
        throw;
    }
}
