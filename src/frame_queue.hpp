// =============================================================================
// mirrorhub - Bounded Delivery Queue
// =============================================================================
// Per-subscriber, per-kind queue between the router and a delivery thread.
//   DropOldest: a full queue discards its oldest frame to make room (video/audio)
//   Block:      the producer waits up to a timeout for room (control)
// Terminal markers bypass the capacity and are never dropped.
// =============================================================================
#pragma once
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "helper_protocol.hpp"
#include "mirrorhub_types.hpp"

namespace mirrorhub {

struct TerminalNotice {
    SessionId session_id = 0;
    std::string serial;
    TerminalCause cause = TerminalCause::SessionStopped;
    std::string reason;
};

struct Delivery {
    enum class Type { Frame, Terminal };
    Type type = Type::Frame;
    Frame frame;
    uint64_t epoch = 0;     // terminal markers only
};

enum class OverflowPolicy { DropOldest, Block };

enum class PushStatus { Queued, DroppedOldest, TimedOut, Closed };

class FrameQueue {
public:
    FrameQueue(size_t capacity, OverflowPolicy policy)
        : capacity_(capacity == 0 ? 1 : capacity), policy_(policy) {}

    PushStatus push(Delivery item, std::chrono::milliseconds block_timeout = std::chrono::milliseconds(0)) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closed_) return PushStatus::Closed;

        PushStatus status = PushStatus::Queued;
        if (items_.size() >= capacity_) {
            if (policy_ == OverflowPolicy::DropOldest) {
                for (auto it = items_.begin(); it != items_.end(); ++it) {
                    if (it->type == Delivery::Type::Frame) {
                        items_.erase(it);
                        dropped_++;
                        status = PushStatus::DroppedOldest;
                        break;
                    }
                }
            } else {
                bool room = not_full_.wait_for(lock, block_timeout, [this] {
                    return closed_ || items_.size() < capacity_;
                });
                if (closed_) return PushStatus::Closed;
                if (!room) return PushStatus::TimedOut;
            }
        }
        items_.push_back(std::move(item));
        not_empty_.notify_one();
        return status;
    }

    void pushTerminal(Delivery item) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        item.type = Delivery::Type::Terminal;
        items_.push_back(std::move(item));
        not_empty_.notify_one();
    }

    // nullopt on timeout or once closed
    std::optional<Delivery> pop(std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!not_empty_.wait_for(lock, timeout, [this] { return closed_ || !items_.empty(); })) {
            return std::nullopt;
        }
        if (closed_) return std::nullopt;
        Delivery d = std::move(items_.front());
        items_.pop_front();
        not_full_.notify_one();
        return d;
    }

    // Discards everything queued and wakes producers and the consumer
    void close() {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        items_.clear();
        not_empty_.notify_all();
        not_full_.notify_all();
    }

    bool isClosed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return items_.size();
    }

    uint64_t dropped() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return dropped_;
    }

    size_t capacity() const { return capacity_; }

private:
    const size_t capacity_;
    const OverflowPolicy policy_;

    mutable std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable not_full_;
    std::deque<Delivery> items_;
    uint64_t dropped_ = 0;
    bool closed_ = false;
};

} // namespace mirrorhub
