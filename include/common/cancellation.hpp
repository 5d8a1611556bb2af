#pragma once

#include <atomic>
#include <string>

#include "common/errors.hpp"

// Shared flag polled by the pipelines at every blocking point.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    bool isCancelled() const { return cancelled_.load(std::memory_order_relaxed); }

    void throwIfCancelled(const std::string& where) const {
        if (isCancelled()) {
            throw OperationCancelled("Operation cancelled during " + where);
        }
    }

private:
    std::atomic<bool> cancelled_{false};
};
