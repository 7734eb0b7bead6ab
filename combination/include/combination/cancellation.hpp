#pragma once

#include <atomic>

namespace combination {

// Shared stop flag for one run. Set from any thread, polled by every worker
// at the top of each recursive call and before each candidate value.
// Cooperative only: nothing is interrupted from the outside.
class CancellationFlag {
public:
    void request() { stop_.store(true, std::memory_order_release); }
    void reset() { stop_.store(false, std::memory_order_relaxed); }

    // Relaxed load: polled in the innermost loop
    bool requested() const { return stop_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> stop_{false};
};

}  // namespace combination
