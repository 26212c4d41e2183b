#pragma once

#include <atomic>

namespace workflow_tracker {

// ---------------------------------------------------------------------------
// CancellationToken: cooperative stop flag shared between the caller and a
// running scan. The scan checks it before each file and between phases.
// ---------------------------------------------------------------------------
class CancellationToken {
public:
    void RequestCancel() noexcept { cancelled_.store(true, std::memory_order_relaxed); }
    [[nodiscard]] bool IsCancelled() const noexcept {
        return cancelled_.load(std::memory_order_relaxed);
    }

private:
    std::atomic<bool> cancelled_{false};
};

/// Null-safe check used by code that accepts an optional token.
[[nodiscard]] inline bool IsCancelled(const CancellationToken* token) noexcept {
    return token != nullptr && token->IsCancelled();
}

} // namespace workflow_tracker
