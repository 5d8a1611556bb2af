#include "backup/shard_pipeline.hpp"
#include "common/cancellation.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include "common/temp_file.hpp"

std::string pipelineStateToString(PipelineState state) {
    switch (state) {
        case PipelineState::Planning:        return "PLANNING";
        case PipelineState::Resuming:        return "RESUMING";
        case PipelineState::Streaming:       return "STREAMING";
        case PipelineState::Buffering:       return "BUFFERING";
        case PipelineState::FinalizingShard: return "FINALIZING_SHARD";
        case PipelineState::Uploading:       return "UPLOADING";
        case PipelineState::Done:            return "DONE";
        case PipelineState::Aborted:         return "ABORTED";
        default:                             return "UNKNOWN";
    }
}

namespace {

std::string describeStream(const std::string& source, const std::string& since) {
    return since.empty() ? source : since + ".." + source;
}

} // namespace

ShardPipeline::ShardPipeline(std::shared_ptr<RemoteStore> store,
                             std::shared_ptr<StreamSourceFactory> sources,
                             std::shared_ptr<ShardEncoder> encoder,
                             const std::string& tempDir,
                             const std::string& extension)
    : store_(store)
    , sources_(std::move(sources))
    , encoder_(std::move(encoder))
    , inventory_(store)
    , tempDir_(tempDir)
    , extension_(extension)
    , state_(PipelineState::Planning) {
}

void ShardPipeline::transition(PipelineState next) {
    state_ = next;
    Logger::debug("Shard pipeline state: " + pipelineStateToString(next));
    if (stateCallback_) {
        stateCallback_(next);
    }
}

ShardPipeline::ResumePoint ShardPipeline::resume(const BackupJob& job) {
    ResumePoint point;
    RemoteShardSet set = inventory_.scan(job.destinationPath, job.backupPrefix);
    if (set.empty()) {
        Logger::info("No existing shards for " + job.backupPrefix + ", starting from offset 0");
        return point;
    }

    if (auto gap = RemoteInventory::firstGap(set.shards)) {
        throw InconsistentRemoteState("Backup " + job.backupPrefix + " is missing shard " +
                                      std::to_string(*gap) + " of " +
                                      std::to_string(set.shards.back().index));
    }
    RemoteInventory::verifyOffsets(set);

    const ShardDescriptor& last = set.shards.back();
    if (!set.lastMetadata) {
        throw InconsistentRemoteState("Shard " + last.objectName +
                                      " has no metadata sidecar; cannot determine its plaintext size");
    }

    const ShardMetadata& recorded = *set.lastMetadata;
    if (recorded.sourceIdentifier != job.sourceIdentifier || recorded.sinceIdentifier != job.sinceIdentifier) {
        throw InconsistentRemoteState("Backup " + job.backupPrefix + " holds a stream of " +
                                      describeStream(recorded.sourceIdentifier, recorded.sinceIdentifier) +
                                      ", not " + describeStream(job.sourceIdentifier, job.sinceIdentifier));
    }
    RemoteInventory::verifyLastShardSize(set);

    point.existingShards = set.shards.size();
    point.nextIndex = last.index + 1;
    point.lastMetadata = set.lastMetadata;
    if (last.isFinal && *last.isFinal) {
        point.alreadyComplete = true;
        return point;
    }

    point.bytesToSkip = last.byteOffset + *last.plaintextSize;
    Logger::info("Resuming " + job.backupPrefix + " at shard " + std::to_string(point.nextIndex) +
                 ", skipping " + std::to_string(point.bytesToSkip) + " bytes");
    return point;
}

std::unique_ptr<ByteSource> ShardPipeline::openSource(const BackupJob& job) {
    try {
        return sources_->openExport(job.sourceIdentifier, job.sinceIdentifier);
    } catch (const PipelineError&) {
        throw;
    } catch (const std::runtime_error& e) {
        throw SourceUnavailable("Cannot open export of " + job.sourceIdentifier + ": " + e.what());
    }
}

void ShardPipeline::uploadShard(const BackupJob& job, const ShardMetadata& metadata,
                                const TempFile& ciphertext, const CancellationToken* cancel) {
    std::string shardName = formatShardName(job.backupPrefix, metadata.index, metadata.byteOffset, extension_);
    std::string shardPath = remoteJoin(job.destinationPath, shardName);
    std::string sidecarPath = remoteJoin(job.destinationPath, formatMetadataName(job.backupPrefix, metadata.index));

    std::optional<uint64_t> storedSize;
    try {
        store_->putObject(sidecarPath, metadata.toJson());
        store_->putFile(shardPath, ciphertext.path(), cancel);
        storedSize = store_->objectSize(shardPath);
    } catch (const StorageError& e) {
        throw UploadFailure("Upload of " + shardName + " to " + store_->name() + " failed: " + e.what());
    }

    if (!storedSize || *storedSize != metadata.ciphertextSize) {
        throw UploadFailure("Upload of " + shardName + " not confirmed: expected " +
                            std::to_string(metadata.ciphertextSize) + " bytes, found " +
                            (storedSize ? std::to_string(*storedSize) : std::string("nothing")));
    }
    Logger::info("Uploaded " + shardName + " (" + std::to_string(metadata.plaintextSize) + " -> " +
                 std::to_string(metadata.ciphertextSize) + " bytes" + (metadata.isFinal ? ", final)" : ")"));
}

void ShardPipeline::markFinal(const BackupJob& job, ShardMetadata metadata) {
    metadata.isFinal = true;
    std::string sidecarPath = remoteJoin(job.destinationPath, formatMetadataName(job.backupPrefix, metadata.index));
    try {
        store_->putObject(sidecarPath, metadata.toJson());
    } catch (const StorageError& e) {
        throw UploadFailure("Cannot update " + sidecarPath + ": " + e.what());
    }
}

PipelineResult ShardPipeline::run(const BackupJob& job, uint64_t shardSizeTarget,
                                  const CancellationToken* cancel) {
    PipelineResult result;
    try {
        transition(PipelineState::Planning);
        if (shardSizeTarget == 0) {
            throw ConfigurationError("Shard size target must be positive");
        }

        transition(PipelineState::Resuming);
        ResumePoint point = resume(job);
        result.totalShards = point.existingShards;
        result.bytesSkipped = point.bytesToSkip;
        if (point.alreadyComplete) {
            Logger::info("Backup " + job.backupPrefix + " is already complete with " +
                         std::to_string(point.existingShards) + " shards");
            result.complete = true;
            transition(PipelineState::Done);
            return result;
        }
        if (point.lastMetadata && point.lastMetadata->shardSizeTarget != shardSizeTarget) {
            Logger::warning("Shard size target changed from " + std::to_string(point.lastMetadata->shardSizeTarget) +
                            " to " + std::to_string(shardSizeTarget) + " for " + job.backupPrefix);
        }

        std::unique_ptr<ByteSource> source = openSource(job);
        SourceReader reader(*source);

        transition(PipelineState::Streaming);
        uint64_t skipped = reader.discard(point.bytesToSkip);
        if (skipped < point.bytesToSkip) {
            throw SourceUnavailable("Export of " + job.sourceIdentifier + " ended at byte " +
                                    std::to_string(skipped) + ", before the resume point " +
                                    std::to_string(point.bytesToSkip));
        }

        uint64_t byteOffset = point.bytesToSkip;
        uint64_t index = point.nextIndex;
        while (true) {
            if (cancel) {
                cancel->throwIfCancelled("backup of " + job.backupPrefix);
            }

            transition(PipelineState::Buffering);
            if (reader.atEnd()) {
                source->close();
                if (point.lastMetadata) {
                    // Stored shards already cover the whole stream.
                    Logger::warning("Export ended exactly after shard " + std::to_string(index - 1) +
                                    ", marking it final");
                    markFinal(job, *point.lastMetadata);
                    result.complete = true;
                } else {
                    Logger::warning("Export of " + job.sourceIdentifier + " is empty, nothing to upload");
                }
                break;
            }

            std::unique_ptr<TempFile> ciphertext;
            try {
                ciphertext = std::make_unique<TempFile>(tempDir_, "shard");
            } catch (const std::runtime_error& e) {
                throw ShardTransformFailure("Cannot stage shard " + std::to_string(index) + ": " + e.what());
            }
            EncodedShard encoded;
            try {
                encoded = encoder_->encode(reader, shardSizeTarget, ciphertext->path(), cancel);
            } catch (const CodecError& e) {
                throw ShardTransformFailure("Encoding shard " + std::to_string(index) + " failed: " + e.what());
            }

            transition(PipelineState::FinalizingShard);
            ShardMetadata metadata;
            metadata.index = index;
            metadata.byteOffset = byteOffset;
            metadata.plaintextSize = encoded.plaintextSize;
            metadata.isFinal = encoded.plaintextSize < shardSizeTarget || reader.atEnd();
            metadata.shardSizeTarget = shardSizeTarget;
            metadata.ciphertextSize = encoded.ciphertextSize;
            metadata.extension = extension_;
            metadata.sourceIdentifier = job.sourceIdentifier;
            metadata.sinceIdentifier = job.sinceIdentifier;

            if (metadata.isFinal) {
                // A failed export would otherwise pass for a short final shard.
                source->close();
            }

            transition(PipelineState::Uploading);
            uploadShard(job, metadata, *ciphertext, cancel);
            ciphertext->remove();

            byteOffset += metadata.plaintextSize;
            result.bytesStreamed += metadata.plaintextSize;
            ++result.shardsUploaded;
            ++result.totalShards;
            if (shardCallback_) {
                shardCallback_(metadata);
            }

            if (metadata.isFinal) {
                result.complete = true;
                break;
            }
            ++index;
        }

        transition(PipelineState::Done);
        Logger::info("Backup " + job.backupPrefix + ": uploaded " + std::to_string(result.shardsUploaded) +
                     " shards, " + std::to_string(result.totalShards) + " total");
        return result;
    } catch (...) {
        transition(PipelineState::Aborted);
        throw;
    }
}
