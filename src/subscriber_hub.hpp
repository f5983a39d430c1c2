// =============================================================================
// mirrorhub - Subscriber Hub
// =============================================================================
// Owns subscribers and their delivery threads. Each attached stream kind gets
// its own bounded queue and thread, so a slow video consumer never delays
// control messages and one subscriber never delays another.
//
// Callbacks run on the delivery threads (one per kind), so a subscriber's
// callbacks must tolerate being called from several threads.
// =============================================================================
#pragma once
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "config_loader.hpp"
#include "frame_queue.hpp"
#include "mirrorhub_types.hpp"

namespace mirrorhub {

struct SubscriberCallbacks {
    // Returning false (or throwing) reports a transport failure; the
    // subscriber is then detached
    std::function<bool(const Frame&)> on_frame;
    std::function<void(const TerminalNotice&)> on_terminal;
};

struct SubscriberInfo {
    SubscriberId id = 0;
    SessionId session_id = 0;
    StreamKindMask kinds = 0;
    std::chrono::system_clock::time_point attached_at;
    std::array<uint64_t, STREAM_KIND_COUNT> delivered{};
    std::array<uint64_t, STREAM_KIND_COUNT> dropped{};
    size_t queued = 0;
};

class SubscriberHub {
public:
    // Called when the hub itself detached a subscriber (transport failure,
    // control backpressure)
    using RemovedCallback = std::function<void(SubscriberId, SessionId, const std::string& reason)>;

    explicit SubscriberHub(config::FanoutConfig cfg);
    ~SubscriberHub();

    SubscriberHub(const SubscriberHub&) = delete;
    SubscriberHub& operator=(const SubscriberHub&) = delete;

    SubscriberId add(SessionId session, StreamKindMask kinds, SubscriberCallbacks callbacks);

    // Releases the subscriber's queues and threads. false if unknown.
    bool remove(SubscriberId id);
    void removeAll();

    // No-op for unknown/detached subscribers or kinds they did not attach
    void deliver(SubscriberId id, const Frame& frame);
    void broadcast(const std::vector<SubscriberId>& ids, const Frame& frame);

    // Queues a terminal marker behind already queued frames on every lane;
    // on_terminal fires once all lanes reached it
    void notifyTerminal(const std::vector<SubscriberId>& ids, const TerminalNotice& notice);
    // true if every listed subscriber got (or can no longer get) its latest notice in time
    bool awaitTerminal(const std::vector<SubscriberId>& ids, std::chrono::milliseconds timeout);

    std::optional<SubscriberInfo> info(SubscriberId id) const;
    size_t count() const;

    void setRemovedCallback(RemovedCallback cb);

private:
    struct Lane {
        Lane(StreamKind k, size_t capacity, OverflowPolicy policy) : kind(k), queue(capacity, policy) {}
        StreamKind kind;
        FrameQueue queue;
        std::thread worker;
        std::atomic<uint64_t> delivered{0};
    };

    struct Subscriber {
        SubscriberId id = 0;
        SessionId session = 0;
        StreamKindMask kinds = 0;
        SubscriberCallbacks callbacks;
        std::chrono::system_clock::time_point attached_at;
        std::array<std::unique_ptr<Lane>, STREAM_KIND_COUNT> lanes;
        std::atomic<bool> detached{false};

        std::mutex terminal_mutex;
        std::condition_variable terminal_cv;
        uint64_t terminal_epoch = 0;
        uint64_t terminal_delivered = 0;
        int terminal_pending = 0;
        TerminalNotice terminal_notice;
    };

    std::shared_ptr<Subscriber> find(SubscriberId id) const;
    void laneLoop(std::shared_ptr<Subscriber> sub, Lane* lane);
    void handleTerminalMarker(Subscriber& sub, uint64_t epoch);
    void failSubscriber(SubscriberId id, const std::string& reason);
    bool removeInternal(SubscriberId id, const std::optional<TerminalNotice>& final_notice,
                        bool notify_owner, const std::string& reason);
    void shutdownSubscriber(Subscriber& sub);

    config::FanoutConfig cfg_;

    mutable std::mutex mutex_;
    std::unordered_map<SubscriberId, std::shared_ptr<Subscriber>> subscribers_;
    RemovedCallback removed_cb_;
    std::atomic<SubscriberId> next_id_{1};

    std::mutex inflight_mutex_;
    std::condition_variable inflight_cv_;
    int inflight_failures_ = 0;
};

} // namespace mirrorhub
