#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace inkbridge::engine {

enum class ReaderEventKind {
    Line,   // one complete line, terminator stripped
    Eof,
    Error   // payload holds the read failure
};

struct ReaderEvent {
    ReaderEventKind kind = ReaderEventKind::Line;
    std::string payload;
};

// Single-producer/single-consumer hand-off from the stdout reader thread to
// the protocol loop. Pushes after close() are dropped.
class LineChannel {
public:
    void push(ReaderEvent event) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (closed_) {
                return;
            }
            queue_.push_back(std::move(event));
        }
        cv_.notify_one();
    }

    // nullopt when nothing arrived within `timeout`.
    std::optional<ReaderEvent> wait_pop(const std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, timeout, [this] { return !queue_.empty(); });
        if (queue_.empty()) {
            return std::nullopt;
        }
        ReaderEvent event = std::move(queue_.front());
        queue_.pop_front();
        return event;
    }

    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        cv_.notify_all();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<ReaderEvent> queue_;
    bool closed_ = false;
};

}  // namespace inkbridge::engine
