#include "backup/remote_inventory.hpp"
#include "common/errors.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <map>
#include <set>

std::optional<uint64_t> RemoteShardSet::storedBytes() const {
    if (shards.empty()) {
        return 0;
    }
    const ShardDescriptor& last = shards.back();
    if (!last.plaintextSize) {
        return std::nullopt;
    }
    return last.byteOffset + *last.plaintextSize;
}

RemoteInventory::RemoteInventory(std::shared_ptr<RemoteStore> store)
    : store_(std::move(store)) {
}

std::vector<RemoteObject> RemoteInventory::listObjects(const std::string& destinationPath) const {
    try {
        return store_->list(destinationPath);
    } catch (const StorageError& e) {
        throw DownloadFailure("Cannot list " + destinationPath + " on " + store_->name() + ": " + e.what());
    }
}

std::vector<ShardDescriptor> RemoteInventory::list(const std::string& destinationPath,
                                                   const std::string& backupPrefix) const {
    std::map<uint64_t, ShardDescriptor> byIndex;

    for (const auto& object : listObjects(destinationPath)) {
        ParsedName parsed;
        NameMatch match = parseObjectName(backupPrefix, object.name, parsed);
        if (match == NameMatch::Malformed) {
            throw InconsistentRemoteState("Malformed shard name under " + destinationPath + ": " + object.name);
        }
        if (match != NameMatch::Shard) {
            continue;
        }

        ShardDescriptor shard;
        shard.index = parsed.index;
        shard.byteOffset = parsed.byteOffset;
        shard.objectName = object.name;
        shard.ciphertextSize = object.size;

        auto inserted = byIndex.emplace(shard.index, shard);
        if (!inserted.second) {
            throw InconsistentRemoteState("Duplicate shard index " + std::to_string(shard.index) + ": " +
                                          inserted.first->second.objectName + " and " + object.name);
        }
    }

    std::vector<ShardDescriptor> shards;
    shards.reserve(byIndex.size());
    for (auto& entry : byIndex) {
        shards.push_back(std::move(entry.second));
    }
    return shards;
}

std::optional<ShardMetadata> RemoteInventory::loadMetadata(const std::string& destinationPath,
                                                           const std::string& backupPrefix,
                                                           uint64_t index) const {
    std::string path = remoteJoin(destinationPath, formatMetadataName(backupPrefix, index));
    std::string text;
    try {
        if (!store_->objectSize(path)) {
            return std::nullopt;
        }
        text = store_->getObject(path);
    } catch (const StorageError& e) {
        throw DownloadFailure("Cannot read " + path + ": " + e.what());
    }

    try {
        return ShardMetadata::fromJson(text);
    } catch (const std::runtime_error& e) {
        throw InconsistentRemoteState(path + ": " + e.what());
    }
}

RemoteShardSet RemoteInventory::scan(const std::string& destinationPath, const std::string& backupPrefix) const {
    RemoteShardSet set;
    set.shards = list(destinationPath, backupPrefix);
    if (set.shards.empty()) {
        return set;
    }

    for (size_t i = 0; i + 1 < set.shards.size(); ++i) {
        ShardDescriptor& shard = set.shards[i];
        const ShardDescriptor& next = set.shards[i + 1];
        if (next.index == shard.index + 1 && next.byteOffset > shard.byteOffset) {
            shard.plaintextSize = next.byteOffset - shard.byteOffset;
            shard.isFinal = false;
        }
    }

    ShardDescriptor& last = set.shards.back();
    set.lastMetadata = loadMetadata(destinationPath, backupPrefix, last.index);
    if (set.lastMetadata) {
        const ShardMetadata& metadata = *set.lastMetadata;
        if (metadata.index != last.index || metadata.byteOffset != last.byteOffset) {
            throw InconsistentRemoteState("Sidecar of " + last.objectName + " describes shard " +
                                          std::to_string(metadata.index) + " at offset " +
                                          std::to_string(metadata.byteOffset));
        }
        last.plaintextSize = metadata.plaintextSize;
        last.isFinal = metadata.isFinal;
        last.shardSizeTarget = metadata.shardSizeTarget;
    } else {
        Logger::warning("No sidecar for " + last.objectName);
    }
    return set;
}

std::vector<std::string> RemoteInventory::listBackupPrefixes(const std::string& destinationPath) const {
    std::set<std::string> prefixes;
    for (const auto& object : listObjects(destinationPath)) {
        std::string prefix = shardNamePrefix(object.name);
        if (!prefix.empty()) {
            prefixes.insert(prefix);
        }
    }
    return std::vector<std::string>(prefixes.begin(), prefixes.end());
}

std::vector<std::string> RemoteInventory::listBackupObjects(const std::string& destinationPath,
                                                            const std::string& backupPrefix) const {
    std::vector<std::string> names;
    for (const auto& object : listObjects(destinationPath)) {
        ParsedName parsed;
        if (parseObjectName(backupPrefix, object.name, parsed) != NameMatch::Unrelated) {
            names.push_back(object.name);
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

std::optional<uint64_t> RemoteInventory::firstGap(const std::vector<ShardDescriptor>& shards) {
    uint64_t expected = 1;
    for (const auto& shard : shards) {
        if (shard.index != expected) {
            return expected;
        }
        ++expected;
    }
    return std::nullopt;
}

void RemoteInventory::verifyOffsets(const RemoteShardSet& set) {
    if (set.shards.empty()) {
        return;
    }
    if (set.shards.front().byteOffset != 0) {
        throw InconsistentRemoteState("First shard " + set.shards.front().objectName + " does not start at offset 0");
    }
    for (size_t i = 1; i < set.shards.size(); ++i) {
        if (set.shards[i].byteOffset <= set.shards[i - 1].byteOffset) {
            throw InconsistentRemoteState("Shard offsets do not increase at " + set.shards[i].objectName);
        }
    }
}

void RemoteInventory::verifyLastShardSize(const RemoteShardSet& set) {
    if (set.shards.empty() || !set.lastMetadata) {
        return;
    }
    const ShardDescriptor& last = set.shards.back();
    if (last.ciphertextSize != set.lastMetadata->ciphertextSize) {
        throw InconsistentRemoteState("Shard " + last.objectName + " holds " + std::to_string(last.ciphertextSize) +
                                      " bytes but its sidecar records " +
                                      std::to_string(set.lastMetadata->ciphertextSize));
    }
}
