#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace tilekeep {

/// Foreground change observed by the sampler.
struct FocusEvent
{
    std::string process_name;
    std::string title;
    double timestamp = 0.0; // Unix seconds
};

/**
 * @brief FIFO hand-off from the focus sampler to the tracker.
 *
 * One producer sends, one consumer drains. Once closed, send() refuses new
 * events so the producer knows to stop.
 */
class FocusChannel
{
public:
    /// @return false if the channel is closed
    bool send(FocusEvent event)
    {
        std::lock_guard lock(mutex_);
        if (closed_)
            return false;
        queue_.push_back(std::move(event));
        return true;
    }

    std::optional<FocusEvent> try_receive()
    {
        std::lock_guard lock(mutex_);
        if (queue_.empty())
            return std::nullopt;
        FocusEvent event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    void close()
    {
        {
            std::lock_guard lock(mutex_);
            closed_ = true;
        }
        closed_cv_.notify_all();
    }

    bool closed() const
    {
        std::lock_guard lock(mutex_);
        return closed_;
    }

    /// Sleep up to timeout; returns true as soon as the channel is closed.
    bool wait_closed_for(std::chrono::milliseconds timeout)
    {
        std::unique_lock lock(mutex_);
        return closed_cv_.wait_for(lock, timeout, [this] { return closed_; });
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable closed_cv_;
    std::deque<FocusEvent> queue_;
    bool closed_ = false;
};

} // namespace tilekeep
