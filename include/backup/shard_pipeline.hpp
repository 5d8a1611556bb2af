#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "backup/backup_job.hpp"
#include "backup/remote_inventory.hpp"
#include "codec/shard_codec.hpp"
#include "common/byte_stream.hpp"
#include "storage/remote_store.hpp"

class CancellationToken;
class TempFile;

enum class PipelineState {
    Planning,
    Resuming,
    Streaming,
    Buffering,
    FinalizingShard,
    Uploading,
    Done,
    Aborted
};

std::string pipelineStateToString(PipelineState state);

struct PipelineResult {
    uint64_t shardsUploaded = 0;   // by this run
    uint64_t totalShards = 0;      // remote count after this run
    uint64_t bytesSkipped = 0;     // already stored before this run
    uint64_t bytesStreamed = 0;    // plaintext uploaded by this run
    bool complete = false;
};

// Splits one export stream into shards, encodes each and uploads it,
// resuming after the last shard already stored under the job's prefix.
class ShardPipeline {
public:
    using StateCallback = std::function<void(PipelineState)>;
    using ShardCallback = std::function<void(const ShardMetadata&)>;

    ShardPipeline(std::shared_ptr<RemoteStore> store,
                  std::shared_ptr<StreamSourceFactory> sources,
                  std::shared_ptr<ShardEncoder> encoder,
                  const std::string& tempDir,
                  const std::string& extension);

    void setStateCallback(StateCallback callback) { stateCallback_ = std::move(callback); }
    void setShardCallback(ShardCallback callback) { shardCallback_ = std::move(callback); }

    // Throws a PipelineError subclass on failure; remote state then holds
    // only whole shards, so calling run() again resumes correctly.
    PipelineResult run(const BackupJob& job, uint64_t shardSizeTarget,
                       const CancellationToken* cancel = nullptr);

    PipelineState state() const { return state_; }

private:
    struct ResumePoint {
        uint64_t nextIndex = 1;
        uint64_t bytesToSkip = 0;
        uint64_t existingShards = 0;
        bool alreadyComplete = false;
        std::optional<ShardMetadata> lastMetadata;
    };

    void transition(PipelineState next);
    ResumePoint resume(const BackupJob& job);
    std::unique_ptr<ByteSource> openSource(const BackupJob& job);
    void uploadShard(const BackupJob& job, const ShardMetadata& metadata,
                     const TempFile& ciphertext, const CancellationToken* cancel);
    void markFinal(const BackupJob& job, ShardMetadata metadata);

    std::shared_ptr<RemoteStore> store_;
    std::shared_ptr<StreamSourceFactory> sources_;
    std::shared_ptr<ShardEncoder> encoder_;
    RemoteInventory inventory_;
    std::string tempDir_;
    std::string extension_;
    PipelineState state_;
    StateCallback stateCallback_;
    ShardCallback shardCallback_;
};
