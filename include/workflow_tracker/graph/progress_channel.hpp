#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace workflow_tracker {

struct ProgressEvent {
    int current = 0;
    int total = 0;
    std::string message;
    std::string phase;
    std::size_t files_scanned = 0;
    std::size_t nodes_found = 0;
};

using ProgressCallback = std::function<void(const ProgressEvent&)>;

// ---------------------------------------------------------------------------
// ProgressChannel: hand-off between the scanning thread and whatever
// consumes progress. Producers Push from any thread and never block; the
// consumer drains on its own schedule.
//
// The queue is bounded. When full, the oldest event is dropped and counted;
// Latest() always holds the most recent event so a late consumer can
// resynchronize.
// ---------------------------------------------------------------------------
class ProgressChannel {
public:
    explicit ProgressChannel(std::size_t capacity = 256);

    ProgressChannel(const ProgressChannel&) = delete;
    ProgressChannel& operator=(const ProgressChannel&) = delete;

    /// Ignored after Close().
    void Push(ProgressEvent event);

    std::optional<ProgressEvent> TryPop();

    /// Blocks until an event arrives, the channel is closed, or `timeout`
    /// expires. Returns nullopt in the last two cases.
    std::optional<ProgressEvent> WaitPop(std::chrono::milliseconds timeout);

    std::vector<ProgressEvent> Drain();

    /// Wakes all waiters. Events already queued can still be popped.
    void Close();

    [[nodiscard]] bool IsClosed() const;
    [[nodiscard]] std::optional<ProgressEvent> Latest() const;
    [[nodiscard]] std::size_t Dropped() const;
    [[nodiscard]] std::size_t Size() const;

    /// A callback that pushes into this channel. The channel must outlive it.
    ProgressCallback Callback();

private:
    const std::size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ProgressEvent> queue_;
    std::optional<ProgressEvent> latest_;
    std::size_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace workflow_tracker
