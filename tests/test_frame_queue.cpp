// =============================================================================
// Unit tests for FrameQueue (bounded per-subscriber delivery queue)
// =============================================================================
#include <gtest/gtest.h>
#include <thread>
#include "frame_queue.hpp"

using namespace mirrorhub;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static Delivery frameItem(uint64_t seq, StreamKind kind = StreamKind::Video) {
    Delivery d;
    d.frame = makeFrame(kind, {static_cast<uint8_t>(seq)});
    d.frame.sequence = seq;
    return d;
}

static Delivery terminalItem(uint64_t epoch) {
    Delivery d;
    d.type = Delivery::Type::Terminal;
    d.epoch = epoch;
    return d;
}

TEST(FrameQueueTest, FifoOrder) {
    FrameQueue q(8, OverflowPolicy::DropOldest);
    for (uint64_t i = 0; i < 5; i++) EXPECT_EQ(q.push(frameItem(i)), PushStatus::Queued);
    for (uint64_t i = 0; i < 5; i++) {
        auto d = q.pop(std::chrono::milliseconds(10));
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d->frame.sequence, i);
    }
    EXPECT_FALSE(q.pop(std::chrono::milliseconds(10)).has_value());
}

// ---------------------------------------------------------------------------
// Drop-oldest keeps the newest `capacity` frames, in order
// ---------------------------------------------------------------------------
TEST(FrameQueueTest, DropOldestKeepsNewest) {
    FrameQueue q(3, OverflowPolicy::DropOldest);
    int dropped = 0;
    for (uint64_t i = 0; i < 10; i++) {
        if (q.push(frameItem(i)) == PushStatus::DroppedOldest) dropped++;
    }
    EXPECT_EQ(dropped, 7);
    EXPECT_EQ(q.dropped(), 7u);
    EXPECT_EQ(q.size(), 3u);

    for (uint64_t expected : {7u, 8u, 9u}) {
        auto d = q.pop(std::chrono::milliseconds(10));
        ASSERT_TRUE(d.has_value());
        EXPECT_EQ(d->frame.sequence, expected);
    }
}

TEST(FrameQueueTest, TerminalMarkerIsNeverDropped) {
    FrameQueue q(2, OverflowPolicy::DropOldest);
    q.push(frameItem(0));
    q.pushTerminal(terminalItem(1));
    q.push(frameItem(1));
    q.push(frameItem(2));   // full: drops frame 0, not the marker

    auto first = q.pop(std::chrono::milliseconds(10));
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->type, Delivery::Type::Terminal);
    EXPECT_EQ(first->epoch, 1u);
}

TEST(FrameQueueTest, TerminalBypassesCapacity) {
    FrameQueue q(1, OverflowPolicy::Block);
    EXPECT_EQ(q.push(frameItem(0), std::chrono::milliseconds(0)), PushStatus::Queued);
    q.pushTerminal(terminalItem(1));
    EXPECT_EQ(q.size(), 2u);
}

// ---------------------------------------------------------------------------
// Block policy
// ---------------------------------------------------------------------------
TEST(FrameQueueTest, BlockTimesOutWhenFull) {
    FrameQueue q(2, OverflowPolicy::Block);
    EXPECT_EQ(q.push(frameItem(0, StreamKind::Control)), PushStatus::Queued);
    EXPECT_EQ(q.push(frameItem(1, StreamKind::Control)), PushStatus::Queued);

    auto start = std::chrono::steady_clock::now();
    EXPECT_EQ(q.push(frameItem(2, StreamKind::Control), std::chrono::milliseconds(50)),
              PushStatus::TimedOut);
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));
    EXPECT_EQ(q.dropped(), 0u);
}

TEST(FrameQueueTest, BlockResumesWhenConsumerPops) {
    FrameQueue q(1, OverflowPolicy::Block);
    q.push(frameItem(0, StreamKind::Control));

    std::thread consumer([&q] {
        std::this_thread::sleep_for(std::chrono::milliseconds(30));
        q.pop(std::chrono::milliseconds(100));
    });
    EXPECT_EQ(q.push(frameItem(1, StreamKind::Control), std::chrono::milliseconds(2000)),
              PushStatus::Queued);
    consumer.join();

    auto d = q.pop(std::chrono::milliseconds(10));
    ASSERT_TRUE(d.has_value());
    EXPECT_EQ(d->frame.sequence, 1u);
}

// ---------------------------------------------------------------------------
// close()
// ---------------------------------------------------------------------------
TEST(FrameQueueTest, CloseWakesBlockedProducer) {
    FrameQueue q(1, OverflowPolicy::Block);
    q.push(frameItem(0));

    PushStatus st = PushStatus::Queued;
    std::thread producer([&] { st = q.push(frameItem(1), std::chrono::milliseconds(5000)); });
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    q.close();
    producer.join();

    EXPECT_EQ(st, PushStatus::Closed);
}

TEST(FrameQueueTest, CloseDiscardsAndRejects) {
    FrameQueue q(4, OverflowPolicy::DropOldest);
    q.push(frameItem(0));
    q.close();

    EXPECT_TRUE(q.isClosed());
    EXPECT_EQ(q.size(), 0u);
    EXPECT_FALSE(q.pop(std::chrono::milliseconds(10)).has_value());
    EXPECT_EQ(q.push(frameItem(1)), PushStatus::Closed);
}

TEST(FrameQueueTest, ZeroCapacityBecomesOne) {
    FrameQueue q(0, OverflowPolicy::DropOldest);
    EXPECT_EQ(q.capacity(), 1u);
}
