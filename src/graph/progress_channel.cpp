#include <workflow_tracker/graph/progress_channel.hpp>

#include <iterator>
#include <utility>

namespace workflow_tracker {

ProgressChannel::ProgressChannel(std::size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {}

void ProgressChannel::Push(ProgressEvent event) {
    {
        std::lock_guard lock(mutex_);
        if (closed_) {
            return;
        }
        latest_ = event;
        if (queue_.size() >= capacity_) {
            queue_.pop_front();
            ++dropped_;
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::TryPop() {
    std::lock_guard lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::optional<ProgressEvent> ProgressChannel::WaitPop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    cv_.wait_for(lock, timeout, [&] { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    ProgressEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::vector<ProgressEvent> ProgressChannel::Drain() {
    std::lock_guard lock(mutex_);
    std::vector<ProgressEvent> events(std::make_move_iterator(queue_.begin()),
                                      std::make_move_iterator(queue_.end()));
    queue_.clear();
    return events;
}

void ProgressChannel::Close() {
    {
        std::lock_guard lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool ProgressChannel::IsClosed() const {
    std::lock_guard lock(mutex_);
    return closed_;
}

std::optional<ProgressEvent> ProgressChannel::Latest() const {
    std::lock_guard lock(mutex_);
    return latest_;
}

std::size_t ProgressChannel::Dropped() const {
    std::lock_guard lock(mutex_);
    return dropped_;
}

std::size_t ProgressChannel::Size() const {
    std::lock_guard lock(mutex_);
    return queue_.size();
}

ProgressCallback ProgressChannel::Callback() {
    return [this](const ProgressEvent& event) { Push(event); };
}

} // namespace workflow_tracker
