#pragma once

#include <atomic>

namespace lintel {

// Cooperative cancellation flag. The driver owns it; the resolver and the
// dispatcher only poll it.
class CancellationToken {
public:
    void cancel() { canceled_.store(true, std::memory_order_relaxed); }
    void reset() { canceled_.store(false, std::memory_order_relaxed); }
    bool isCanceled() const { return canceled_.load(std::memory_order_relaxed); }

private:
    std::atomic<bool> canceled_{false};
};

} // namespace lintel
