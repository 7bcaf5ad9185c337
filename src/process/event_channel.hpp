#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "protocol/event_contract.hpp"

namespace usbide::process {

struct ProcessEvent {
    enum class Kind {
        Line,
        Exit
    };

    Kind kind = Kind::Line;
    protocol::RawLine line;   // Kind::Line
    int exit_code = -1;       // Kind::Exit; 128 + signal when killed
    bool cancelled = false;   // Kind::Exit
};

// Ordered hand-off from the reader thread to the consumer.
class EventChannel {
public:
    void push(ProcessEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            queue_.push_back(std::move(event));
        }
        ready_.notify_one();
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        ready_.notify_all();
    }

    // Waits up to `timeout`; nothing means "no event yet" or "drained".
    std::optional<ProcessEvent> pop(const std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        ready_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
        if (queue_.empty()) {
            return std::nullopt;
        }
        ProcessEvent event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    bool drained() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_ && queue_.empty();
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::deque<ProcessEvent> queue_;
    bool closed_ = false;
};

}  // namespace usbide::process
