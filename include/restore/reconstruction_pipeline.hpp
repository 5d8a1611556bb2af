#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "backup/remote_inventory.hpp"
#include "codec/shard_codec.hpp"
#include "common/byte_stream.hpp"
#include "storage/remote_store.hpp"

class CancellationToken;
class TempFile;

enum class RestoreState {
    Discover,
    Validate,
    StreamDecode,
    Sink,
    Done,
    Aborted
};

std::string restoreStateToString(RestoreState state);

struct RestoreResult {
    uint64_t shardsRestored = 0;
    uint64_t bytesRestored = 0;
};

// Downloads the shards of one backup in index order, decodes each one
// completely and checks its length before any of its bytes reach the sink.
class ReconstructionPipeline {
public:
    using StateCallback = std::function<void(RestoreState)>;
    using ShardCallback = std::function<void(const ShardDescriptor&, uint64_t totalShards)>;

    ReconstructionPipeline(std::shared_ptr<RemoteStore> store,
                           std::shared_ptr<ShardDecoder> decoder,
                           const std::string& tempDir);

    void setStateCallback(StateCallback callback) { stateCallback_ = std::move(callback); }
    void setShardCallback(ShardCallback callback) { shardCallback_ = std::move(callback); }

    // Commits the sink on success and aborts it on any failure.
    RestoreResult run(const std::string& destinationPath, const std::string& backupPrefix,
                      ByteSink& sink, const CancellationToken* cancel = nullptr);

    RestoreState state() const { return state_; }

    // Accepts only an unbroken run whose last shard is known to be final.
    // Throws MissingShard or InconsistentRemoteState otherwise.
    static void validate(const RemoteShardSet& set, const std::string& backupPrefix);

private:
    void transition(RestoreState next);
    RemoteShardSet discover(const std::string& destinationPath, const std::string& backupPrefix);
    std::unique_ptr<TempFile> stage(const std::string& tag) const;
    void restoreShard(const std::string& destinationPath, const std::string& backupPrefix,
                      const ShardDescriptor& shard, ByteSink& sink, RestoreResult& result,
                      const CancellationToken* cancel);

    std::shared_ptr<RemoteStore> store_;
    std::shared_ptr<ShardDecoder> decoder_;
    RemoteInventory inventory_;
    std::string tempDir_;
    RestoreState state_;
    StateCallback stateCallback_;
    ShardCallback shardCallback_;
};
