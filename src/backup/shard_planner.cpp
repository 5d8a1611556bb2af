#include "backup/shard_planner.hpp"
#include "common/logger.hpp"
#include <algorithm>
#include <stdexcept>

ShardPlanner::ShardPlanner(uint64_t minSize, uint64_t maxSize, uint64_t fallbackSize)
    : minSize_(minSize)
    , maxSize_(maxSize)
    , fallbackSize_(fallbackSize) {
    if (minSize_ == 0 || minSize_ > maxSize_ || fallbackSize_ == 0) {
        throw std::invalid_argument("Invalid shard size bounds");
    }
}

uint64_t ShardPlanner::plan(std::optional<uint64_t> datasetUsedBytes,
                            std::optional<uint64_t> configuredShardSize) const {
    if (configuredShardSize && *configuredShardSize > 0) {
        Logger::debug("Using configured shard size " + std::to_string(*configuredShardSize));
        return *configuredShardSize;
    }

    if (!datasetUsedBytes) {
        Logger::info("Dataset size unavailable, using default shard size " + std::to_string(fallbackSize_));
        return fallbackSize_;
    }

    uint64_t size = std::clamp(*datasetUsedBytes / kTargetShardCount, minSize_, maxSize_);
    Logger::debug("Planned shard size " + std::to_string(size) + " for " +
                  std::to_string(*datasetUsedBytes) + " used bytes");
    return size;
}
