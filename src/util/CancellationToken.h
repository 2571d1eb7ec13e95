#pragma once

#include <atomic>

// Cooperative stop flag shared between the thread requesting a stop and the
// worker polling it at frame and task boundaries.
class CancellationToken {
public:
    void cancel() { m_cancelled.store(true, std::memory_order_release); }
    void reset() { m_cancelled.store(false, std::memory_order_release); }
    bool isCancelled() const { return m_cancelled.load(std::memory_order_acquire); }

private:
    std::atomic<bool> m_cancelled{false};
};
