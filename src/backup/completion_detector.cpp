#include "backup/completion_detector.hpp"
#include "backup/remote_inventory.hpp"

std::string completionStateToString(CompletionState state) {
    switch (state) {
        case CompletionState::Empty:      return "empty";
        case CompletionState::Gap:        return "gap";
        case CompletionState::InProgress: return "in-progress";
        case CompletionState::Complete:   return "complete";
        case CompletionState::Unknown:    return "unknown";
        default:                          return "unknown";
    }
}

CompletionState CompletionDetector::evaluate(const std::vector<ShardDescriptor>& shards,
                                             std::optional<uint64_t> shardSizeTarget) {
    if (shards.empty()) {
        return CompletionState::Empty;
    }
    if (RemoteInventory::firstGap(shards)) {
        return CompletionState::Gap;
    }

    const ShardDescriptor& last = shards.back();
    if (last.isFinal) {
        return *last.isFinal ? CompletionState::Complete : CompletionState::InProgress;
    }

    std::optional<uint64_t> target = last.shardSizeTarget ? last.shardSizeTarget : shardSizeTarget;
    if (last.plaintextSize && target && *target > 0) {
        return *last.plaintextSize < *target ? CompletionState::Complete : CompletionState::InProgress;
    }
    return CompletionState::Unknown;
}

bool CompletionDetector::isComplete(const std::vector<ShardDescriptor>& shards,
                                    std::optional<uint64_t> shardSizeTarget) {
    return evaluate(shards, shardSizeTarget) == CompletionState::Complete;
}
