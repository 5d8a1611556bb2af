#pragma once

#include <cstdint>
#include <optional>

class ShardPlanner {
public:
    static constexpr uint64_t kMiB = 1024ULL * 1024;
    static constexpr uint64_t kGiB = 1024ULL * kMiB;
    static constexpr uint64_t kDefaultMinSize = 10 * kMiB;
    static constexpr uint64_t kDefaultMaxSize = 50 * kGiB;
    static constexpr uint64_t kDefaultFallback = kGiB;
    // Aim for about this many shards per stream.
    static constexpr uint64_t kTargetShardCount = 100;

    ShardPlanner(uint64_t minSize = kDefaultMinSize,
                 uint64_t maxSize = kDefaultMaxSize,
                 uint64_t fallbackSize = kDefaultFallback);

    // Target plaintext bytes per shard. An explicit size always wins.
    uint64_t plan(std::optional<uint64_t> datasetUsedBytes,
                  std::optional<uint64_t> configuredShardSize) const;

private:
    uint64_t minSize_;
    uint64_t maxSize_;
    uint64_t fallbackSize_;
};
