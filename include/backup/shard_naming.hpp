#pragma once

#include <cstdint>
#include <optional>
#include <string>

// What the inventory knows about one remote shard. Index and offset come
// from the object name; the optional fields are derived or read from the
// shard's metadata sidecar.
struct ShardDescriptor {
    uint64_t index = 0;
    uint64_t byteOffset = 0;
    std::string objectName;
    uint64_t ciphertextSize = 0;
    std::optional<uint64_t> plaintextSize;
    std::optional<bool> isFinal;
    std::optional<uint64_t> shardSizeTarget;
};

// Sidecar written next to every shard, before the shard itself.
struct ShardMetadata {
    uint64_t index = 0;
    uint64_t byteOffset = 0;
    uint64_t plaintextSize = 0;
    bool isFinal = false;
    uint64_t shardSizeTarget = 0;
    uint64_t ciphertextSize = 0;
    std::string extension;
    std::string sourceIdentifier;
    std::string sinceIdentifier;

    std::string toJson() const;
    // Throws std::runtime_error on malformed documents.
    static ShardMetadata fromJson(const std::string& text);
};

enum class NameMatch {
    Unrelated,
    Shard,
    Metadata,
    Malformed
};

struct ParsedName {
    uint64_t index = 0;
    uint64_t byteOffset = 0;
    std::string extension;
};

// <prefix>-s<index:03d>-b<offset:010d>.<ext>, wider when the value needs it.
std::string formatShardName(const std::string& prefix, uint64_t index, uint64_t byteOffset,
                            const std::string& extension);
// <prefix>-m<index:03d>.json
std::string formatMetadataName(const std::string& prefix, uint64_t index);

// Names that start with "<prefix>-s<digit>" but do not parse are Malformed.
NameMatch parseObjectName(const std::string& prefix, const std::string& name, ParsedName& parsed);

// Backup prefix of any well-formed shard name, or empty.
std::string shardNamePrefix(const std::string& name);
