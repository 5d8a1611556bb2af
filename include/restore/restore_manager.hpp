#pragma once

#include <memory>
#include <string>

#include "backup/remote_inventory.hpp"
#include "backup/snapshot_manager.hpp"
#include "codec/shard_codec.hpp"
#include "common/byte_stream.hpp"
#include "common/config.hpp"
#include "restore/reconstruction_pipeline.hpp"

class CancellationToken;

struct RestoreRequest {
    std::string destinationPath;
    std::string backupPrefix;
    std::string target;  // empty: "<source dataset>-restored"
    bool force = false;  // replace an existing target dataset
};

class RestoreManager {
public:
    // snapshots may be null when restoring into something other than ZFS.
    RestoreManager(const AppConfig& config,
                   std::shared_ptr<RemoteStore> store,
                   std::shared_ptr<StreamSinkFactory> sinks,
                   std::shared_ptr<SnapshotManager> snapshots,
                   std::shared_ptr<ShardDecoder> decoder);

    // Takes the target lock for the duration of the run.
    RestoreResult restore(const RestoreRequest& request, const CancellationToken* cancel = nullptr);

    std::string defaultTarget(const std::string& destinationPath, const std::string& backupPrefix);

private:
    void prepareTarget(const RestoreRequest& request, const std::string& target);

    AppConfig config_;
    std::shared_ptr<RemoteStore> store_;
    std::shared_ptr<StreamSinkFactory> sinks_;
    std::shared_ptr<SnapshotManager> snapshots_;
    std::shared_ptr<ShardDecoder> decoder_;
    RemoteInventory inventory_;
};
