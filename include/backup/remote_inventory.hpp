#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "backup/shard_naming.hpp"
#include "storage/remote_store.hpp"

struct RemoteShardSet {
    std::vector<ShardDescriptor> shards;  // ascending by index
    std::optional<ShardMetadata> lastMetadata;

    bool empty() const { return shards.empty(); }
    // Plaintext bytes covered by the shards, when the last size is known.
    std::optional<uint64_t> storedBytes() const;
};

class RemoteInventory {
public:
    explicit RemoteInventory(std::shared_ptr<RemoteStore> store);

    // Shards of one backup sorted by index, sizes as listed. Unrelated
    // objects are ignored; duplicate indices and malformed names raise
    // InconsistentRemoteState.
    std::vector<ShardDescriptor> list(const std::string& destinationPath,
                                      const std::string& backupPrefix) const;

    // list() plus plaintext sizes derived from successor offsets and the
    // last shard's sidecar.
    RemoteShardSet scan(const std::string& destinationPath, const std::string& backupPrefix) const;

    std::optional<ShardMetadata> loadMetadata(const std::string& destinationPath,
                                              const std::string& backupPrefix, uint64_t index) const;

    // Distinct backup prefixes with at least one shard, sorted.
    std::vector<std::string> listBackupPrefixes(const std::string& destinationPath) const;

    // Object names (shards and sidecars) belonging to a backup.
    std::vector<std::string> listBackupObjects(const std::string& destinationPath,
                                               const std::string& backupPrefix) const;

    // First index missing from 1..N, if any.
    static std::optional<uint64_t> firstGap(const std::vector<ShardDescriptor>& shards);

    // Offsets must start at 0 and strictly increase along an unbroken run.
    static void verifyOffsets(const RemoteShardSet& set);

    // The last shard's listed size must match the ciphertext size its
    // sidecar recorded; a mismatch means the object was cut short.
    static void verifyLastShardSize(const RemoteShardSet& set);

private:
    std::vector<RemoteObject> listObjects(const std::string& destinationPath) const;

    std::shared_ptr<RemoteStore> store_;
};
