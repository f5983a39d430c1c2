// =============================================================================
// mirrorhub - Subscriber Hub
// =============================================================================
#include "subscriber_hub.hpp"
#include "mirrorhub_log.hpp"

namespace mirrorhub {

static constexpr const char* TAG = "SubHub";
static constexpr int LANE_POLL_MS = 100;

SubscriberHub::SubscriberHub(config::FanoutConfig cfg) : cfg_(std::move(cfg)) {}

SubscriberHub::~SubscriberHub() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        removed_cb_ = nullptr;
    }
    removeAll();
    // A lane thread may still be unwinding out of its own removal
    std::unique_lock<std::mutex> lock(inflight_mutex_);
    inflight_cv_.wait(lock, [this] { return inflight_failures_ == 0; });
}

SubscriberId SubscriberHub::add(SessionId session, StreamKindMask kinds, SubscriberCallbacks callbacks) {
    auto sub = std::make_shared<Subscriber>();
    sub->id = next_id_.fetch_add(1);
    sub->session = session;
    sub->kinds = kinds;
    sub->callbacks = std::move(callbacks);
    sub->attached_at = std::chrono::system_clock::now();

    for (StreamKind k : {StreamKind::Video, StreamKind::Audio, StreamKind::Control}) {
        if (!hasKind(kinds, k)) continue;
        size_t capacity = cfg_.video_queue;
        OverflowPolicy policy = OverflowPolicy::DropOldest;
        if (k == StreamKind::Audio) {
            capacity = cfg_.audio_queue;
        } else if (k == StreamKind::Control) {
            capacity = cfg_.control_queue;
            policy = OverflowPolicy::Block;
        }
        sub->lanes[kindIndex(k)] = std::make_unique<Lane>(k, capacity, policy);
    }

    // Threads are assigned before the subscriber becomes visible to removeAll()
    for (auto& lane : sub->lanes) {
        if (lane) lane->worker = std::thread(&SubscriberHub::laneLoop, this, sub, lane.get());
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        subscribers_[sub->id] = sub;
    }

    MHLOG_INFO(TAG, "Subscriber %llu added: session=%llu kinds=0x%02x",
               (unsigned long long)sub->id, (unsigned long long)session, kinds);
    return sub->id;
}

std::shared_ptr<SubscriberHub::Subscriber> SubscriberHub::find(SubscriberId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = subscribers_.find(id);
    return it == subscribers_.end() ? nullptr : it->second;
}

bool SubscriberHub::remove(SubscriberId id) {
    return removeInternal(id, std::nullopt, false, "detached");
}

void SubscriberHub::removeAll() {
    std::vector<std::shared_ptr<Subscriber>> subs;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, sub] : subscribers_) subs.push_back(sub);
        subscribers_.clear();
    }
    for (auto& sub : subs) shutdownSubscriber(*sub);
}

bool SubscriberHub::removeInternal(SubscriberId id, const std::optional<TerminalNotice>& final_notice,
                                   bool notify_owner, const std::string& reason) {
    std::shared_ptr<Subscriber> sub;
    RemovedCallback removed_cb;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) return false;
        sub = it->second;
        subscribers_.erase(it);
        removed_cb = removed_cb_;
    }

    shutdownSubscriber(*sub);

    if (final_notice && sub->callbacks.on_terminal) {
        try {
            sub->callbacks.on_terminal(*final_notice);
        } catch (const std::exception& e) {
            MHLOG_WARN(TAG, "Subscriber %llu terminal callback threw: %s",
                       (unsigned long long)id, e.what());
        }
    }
    if (notify_owner && removed_cb) removed_cb(sub->id, sub->session, reason);

    MHLOG_INFO(TAG, "Subscriber %llu removed (%s)", (unsigned long long)id, reason.c_str());
    return true;
}

void SubscriberHub::shutdownSubscriber(Subscriber& sub) {
    sub.detached = true;
    for (auto& lane : sub.lanes) {
        if (lane) lane->queue.close();
    }
    for (auto& lane : sub.lanes) {
        if (!lane || !lane->worker.joinable()) continue;
        if (lane->worker.get_id() == std::this_thread::get_id()) {
            lane->worker.detach();
        } else {
            lane->worker.join();
        }
    }
    // Release anyone waiting for a terminal notice that will never come
    {
        std::lock_guard<std::mutex> lock(sub.terminal_mutex);
        sub.terminal_delivered = sub.terminal_epoch;
    }
    sub.terminal_cv.notify_all();
}

void SubscriberHub::failSubscriber(SubscriberId id, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(inflight_mutex_);
        inflight_failures_++;
    }

    std::shared_ptr<Subscriber> sub = find(id);
    if (sub) {
        TerminalNotice notice;
        notice.session_id = sub->session;
        notice.cause = TerminalCause::AttachmentFailed;
        notice.reason = reason;
        MHLOG_WARN(TAG, "Subscriber %llu failed: %s", (unsigned long long)id, reason.c_str());
        removeInternal(id, notice, true, reason);
    }

    std::lock_guard<std::mutex> lock(inflight_mutex_);
    inflight_failures_--;
    inflight_cv_.notify_all();
}

void SubscriberHub::deliver(SubscriberId id, const Frame& frame) {
    std::shared_ptr<Subscriber> sub = find(id);
    if (!sub || sub->detached) return;
    Lane* lane = sub->lanes[kindIndex(frame.kind)].get();
    if (!lane) return;

    Delivery d;
    d.frame = frame;
    if (frame.kind == StreamKind::Control) {
        PushStatus st = lane->queue.push(std::move(d),
                                         std::chrono::milliseconds(cfg_.control_block_ms));
        if (st == PushStatus::TimedOut) {
            failSubscriber(id, "control queue full");
        }
        return;
    }
    if (lane->queue.push(std::move(d)) == PushStatus::DroppedOldest) {
        MHLOG_TRACE(TAG, "Subscriber %llu %s queue full, dropped oldest",
                    (unsigned long long)id, streamKindName(frame.kind));
    }
}

void SubscriberHub::broadcast(const std::vector<SubscriberId>& ids, const Frame& frame) {
    for (SubscriberId id : ids) deliver(id, frame);
}

void SubscriberHub::notifyTerminal(const std::vector<SubscriberId>& ids, const TerminalNotice& notice) {
    for (SubscriberId id : ids) {
        std::shared_ptr<Subscriber> sub = find(id);
        if (!sub || sub->detached) continue;

        uint64_t epoch = 0;
        int lanes = 0;
        for (auto& lane : sub->lanes) if (lane) lanes++;
        {
            std::lock_guard<std::mutex> lock(sub->terminal_mutex);
            epoch = ++sub->terminal_epoch;
            sub->terminal_pending = lanes;
            sub->terminal_notice = notice;
        }
        for (auto& lane : sub->lanes) {
            if (!lane) continue;
            Delivery d;
            d.type = Delivery::Type::Terminal;
            d.epoch = epoch;
            lane->queue.pushTerminal(std::move(d));
        }
    }
}

void SubscriberHub::handleTerminalMarker(Subscriber& sub, uint64_t epoch) {
    TerminalNotice notice;
    {
        std::lock_guard<std::mutex> lock(sub.terminal_mutex);
        if (epoch != sub.terminal_epoch) return;   // superseded by a newer notice
        if (--sub.terminal_pending > 0) return;
        notice = sub.terminal_notice;
    }

    if (!sub.detached && sub.callbacks.on_terminal) {
        try {
            sub.callbacks.on_terminal(notice);
        } catch (const std::exception& e) {
            MHLOG_WARN(TAG, "Subscriber %llu terminal callback threw: %s",
                       (unsigned long long)sub.id, e.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(sub.terminal_mutex);
        if (sub.terminal_delivered < epoch) sub.terminal_delivered = epoch;
    }
    sub.terminal_cv.notify_all();
}

bool SubscriberHub::awaitTerminal(const std::vector<SubscriberId>& ids, std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool all = true;
    for (SubscriberId id : ids) {
        std::shared_ptr<Subscriber> sub = find(id);
        if (!sub) continue;
        std::unique_lock<std::mutex> lock(sub->terminal_mutex);
        bool done = sub->terminal_cv.wait_until(lock, deadline, [&] {
            return sub->terminal_delivered >= sub->terminal_epoch;
        });
        if (!done) {
            MHLOG_WARN(TAG, "Subscriber %llu did not drain its terminal notice in time",
                       (unsigned long long)id);
            all = false;
        }
    }
    return all;
}

void SubscriberHub::laneLoop(std::shared_ptr<Subscriber> sub, Lane* lane) {
    while (true) {
        auto item = lane->queue.pop(std::chrono::milliseconds(LANE_POLL_MS));
        if (!item) {
            if (lane->queue.isClosed()) break;
            continue;
        }

        if (item->type == Delivery::Type::Terminal) {
            handleTerminalMarker(*sub, item->epoch);
            continue;
        }
        if (sub->detached) continue;

        bool ok = true;
        if (sub->callbacks.on_frame) {
            try {
                ok = sub->callbacks.on_frame(item->frame);
            } catch (const std::exception& e) {
                MHLOG_WARN(TAG, "Subscriber %llu %s callback threw: %s",
                           (unsigned long long)sub->id, streamKindName(lane->kind), e.what());
                ok = false;
            }
        }
        if (!ok) {
            failSubscriber(sub->id, std::string(streamKindName(lane->kind)) + " delivery failed");
            break;
        }
        lane->delivered++;
    }
}

std::optional<SubscriberInfo> SubscriberHub::info(SubscriberId id) const {
    std::shared_ptr<Subscriber> sub = find(id);
    if (!sub) return std::nullopt;

    SubscriberInfo out;
    out.id = sub->id;
    out.session_id = sub->session;
    out.kinds = sub->kinds;
    out.attached_at = sub->attached_at;
    for (size_t i = 0; i < STREAM_KIND_COUNT; i++) {
        const Lane* lane = sub->lanes[i].get();
        if (!lane) continue;
        out.delivered[i] = lane->delivered.load();
        out.dropped[i] = lane->queue.dropped();
        out.queued += lane->queue.size();
    }
    return out;
}

size_t SubscriberHub::count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

void SubscriberHub::setRemovedCallback(RemovedCallback cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    removed_cb_ = std::move(cb);
}

} // namespace mirrorhub
