#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "backup/shard_naming.hpp"

enum class CompletionState {
    Empty,
    Gap,
    InProgress,
    Complete,
    Unknown   // last shard has no recorded plaintext size or finality
};

std::string completionStateToString(CompletionState state);

class CompletionDetector {
public:
    // shardSizeTarget is used when the last shard carries a plaintext size
    // but no recorded target or finality flag.
    static CompletionState evaluate(const std::vector<ShardDescriptor>& shards,
                                    std::optional<uint64_t> shardSizeTarget = std::nullopt);

    static bool isComplete(const std::vector<ShardDescriptor>& shards,
                           std::optional<uint64_t> shardSizeTarget = std::nullopt);
};
