#pragma once

#include <atomic>
#include <memory>

// Stop request shared between the pipeline and a bounded worker. A null flag never fires.
using CancellationFlag = std::shared_ptr<std::atomic<bool>>;

inline bool cancellationRequested(const CancellationFlag& flag) noexcept {
    return flag && flag->load(std::memory_order_relaxed);
}
