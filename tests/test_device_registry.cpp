// =============================================================================
// Unit tests for DeviceRegistry (connect dedup, health, discovery)
// =============================================================================
#include <gtest/gtest.h>
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>
#include "device_registry.hpp"
#include "fake_transport.hpp"

using namespace mirrorhub;
using namespace mirrorhub::fake;

// ---------------------------------------------------------------------------
// Fixture
// ---------------------------------------------------------------------------
class DeviceRegistryTest : public ::testing::Test {
protected:
    DeviceRegistryTest() : factory_(std::make_shared<FakeTransportFactory>()) {
        discovery_.enabled = false;
        discovery_.vanish_grace_ms = 1000;
        discovery_.remove_after_ms = 5000;
        registry_ = std::make_unique<DeviceRegistry>(factory_, fastConfig().link, discovery_, bus_);
    }

    std::vector<DeviceStateEvent> events() {
        std::lock_guard<std::mutex> lock(events_mutex_);
        return events_;
    }

    void recordEvents() {
        handle_ = bus_.subscribe<DeviceStateEvent>([this](const DeviceStateEvent& e) {
            std::lock_guard<std::mutex> lock(events_mutex_);
            events_.push_back(e);
        });
    }

    std::mutex events_mutex_;
    std::vector<DeviceStateEvent> events_;
    EventBus bus_;
    SubscriptionHandle handle_;
    std::shared_ptr<FakeTransportFactory> factory_;
    config::DiscoveryConfig discovery_;
    std::unique_ptr<DeviceRegistry> registry_;
};

// ---------------------------------------------------------------------------
// getOrConnect
// ---------------------------------------------------------------------------
TEST_F(DeviceRegistryTest, ConnectFillsProperties) {
    factory_->addDevice("SER1");
    auto link = registry_->getOrConnect("SER1");
    ASSERT_TRUE(link.is_ok()) << link.error().describe();

    auto dev = registry_->findDevice("SER1");
    ASSERT_TRUE(dev.has_value());
    EXPECT_EQ(dev->state, LinkState::Connected);
    EXPECT_TRUE(dev->has_link);
    EXPECT_EQ(dev->model, "Pixel 7");
    EXPECT_EQ(dev->manufacturer, "Google");
    EXPECT_EQ(dev->sdk_level, 34);
    EXPECT_EQ(dev->screen_width, 1080);
    EXPECT_EQ(dev->screen_height, 2400);
    EXPECT_EQ(registry_->connectedCount(), 1u);
    EXPECT_EQ(registry_->findLink("SER1"), link.value());
}

TEST_F(DeviceRegistryTest, SecondCallReusesLink) {
    auto dev = factory_->addDevice("SER1");
    auto a = registry_->getOrConnect("SER1");
    auto b = registry_->getOrConnect("SER1");
    ASSERT_TRUE(a.is_ok());
    ASSERT_TRUE(b.is_ok());
    EXPECT_EQ(a.value(), b.value());
    EXPECT_EQ(dev->connect_count.load(), 1);
}

// Racing callers share one connect attempt and one link
TEST_F(DeviceRegistryTest, ConcurrentConnectsConverge) {
    auto dev = factory_->addDevice("SER1");
    dev->connect_delay_ms = 100;

    constexpr int THREADS = 8;
    std::vector<std::shared_ptr<DeviceLink>> links(THREADS);
    std::vector<std::thread> threads;
    for (int i = 0; i < THREADS; i++) {
        threads.emplace_back([&, i] {
            auto r = registry_->getOrConnect("SER1");
            if (r.is_ok()) links[i] = r.value();
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(dev->connect_count.load(), 1);
    for (int i = 0; i < THREADS; i++) {
        ASSERT_NE(links[i], nullptr);
        EXPECT_EQ(links[i], links[0]);
    }
}

TEST_F(DeviceRegistryTest, UnauthorizedDevice) {
    auto dev = factory_->addDevice("SER1");
    dev->setReportedState("unauthorized");
    auto r = registry_->getOrConnect("SER1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::DeviceUnauthorized);
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Unauthorized);
    EXPECT_EQ(registry_->connectedCount(), 0u);
}

TEST_F(DeviceRegistryTest, OfflineDevice) {
    auto dev = factory_->addDevice("SER1");
    dev->setReportedState("offline");
    auto r = registry_->getOrConnect("SER1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::DeviceOffline);
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Offline);
}

TEST_F(DeviceRegistryTest, UnknownAndInvalidSerials) {
    auto unknown = registry_->getOrConnect("NOPE");
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.error().code, ErrorCode::DeviceNotFound);

    auto invalid = registry_->getOrConnect("SER1; rm -rf /");
    ASSERT_TRUE(invalid.is_err());
    EXPECT_EQ(invalid.error().code, ErrorCode::DeviceNotFound);
    EXPECT_FALSE(registry_->findDevice("SER1; rm -rf /").has_value());
}

TEST_F(DeviceRegistryTest, TimeoutIsRetriedWithBackoff) {
    auto dev = factory_->addDevice("SER1");
    dev->setConnectError(ErrorCode::Timeout);
    auto r = registry_->getOrConnect("SER1");
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::Timeout);
    EXPECT_EQ(dev->connect_count.load(), fastConfig().link.retry_attempts);

    // The next call starts a fresh attempt
    dev->setConnectError(std::nullopt);
    EXPECT_TRUE(registry_->getOrConnect("SER1").is_ok());
}

TEST_F(DeviceRegistryTest, ConnectPublishesStateEvents) {
    recordEvents();
    factory_->addDevice("SER1");
    ASSERT_TRUE(registry_->getOrConnect("SER1").is_ok());

    auto evs = events();
    ASSERT_EQ(evs.size(), 2u);
    EXPECT_EQ(evs[0].new_state, LinkState::Connecting);
    EXPECT_EQ(evs[1].old_state, LinkState::Connecting);
    EXPECT_EQ(evs[1].new_state, LinkState::Connected);
}

// ---------------------------------------------------------------------------
// disconnect
// ---------------------------------------------------------------------------
TEST_F(DeviceRegistryTest, DisconnectFiresCallbackAndForgets) {
    factory_->addDevice("SER1");
    auto link = registry_->getOrConnect("SER1");
    ASSERT_TRUE(link.is_ok());

    std::vector<DeviceRegistry::LinkEvent> seen;
    bool link_open_in_callback = false;
    registry_->setLinkEventCallback([&](const std::string& serial, DeviceRegistry::LinkEvent ev,
                                        const std::string&) {
        EXPECT_EQ(serial, "SER1");
        seen.push_back(ev);
        link_open_in_callback = link.value()->isOpen();
    });

    ASSERT_TRUE(registry_->disconnect("SER1").is_ok());
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], DeviceRegistry::LinkEvent::Disconnected);
    EXPECT_TRUE(link_open_in_callback);
    EXPECT_FALSE(link.value()->isOpen());
    EXPECT_FALSE(registry_->findDevice("SER1").has_value());

    auto again = registry_->disconnect("SER1");
    ASSERT_TRUE(again.is_err());
    EXPECT_EQ(again.error().code, ErrorCode::DeviceNotFound);
}

// ---------------------------------------------------------------------------
// Health checks
// ---------------------------------------------------------------------------
TEST_F(DeviceRegistryTest, HealthFailuresInvalidateLink) {
    auto dev = factory_->addDevice("SER1");
    auto link = registry_->getOrConnect("SER1");
    ASSERT_TRUE(link.is_ok());

    std::atomic<int> lost{0};
    registry_->setLinkEventCallback([&](const std::string&, DeviceRegistry::LinkEvent ev,
                                        const std::string&) {
        if (ev == DeviceRegistry::LinkEvent::Lost) lost++;
    });

    registry_->healthCheckOnce();
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Connected);

    dev->healthy = false;
    int threshold = fastConfig().link.health_failure_threshold;
    for (int i = 0; i < threshold - 1; i++) registry_->healthCheckOnce();
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Connected);
    EXPECT_EQ(lost.load(), 0);

    registry_->healthCheckOnce();
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Offline);
    EXPECT_EQ(lost.load(), 1);
    EXPECT_EQ(registry_->findLink("SER1"), nullptr);
    EXPECT_FALSE(link.value()->isOpen());

    // A recovered device gets a new link on demand
    dev->healthy = true;
    auto again = registry_->getOrConnect("SER1");
    ASSERT_TRUE(again.is_ok());
    EXPECT_NE(again.value(), link.value());
}

TEST_F(DeviceRegistryTest, SuccessfulCheckResetsFailureCount) {
    auto dev = factory_->addDevice("SER1");
    ASSERT_TRUE(registry_->getOrConnect("SER1").is_ok());
    int threshold = fastConfig().link.health_failure_threshold;

    dev->healthy = false;
    for (int i = 0; i < threshold - 1; i++) registry_->healthCheckOnce();
    dev->healthy = true;
    registry_->healthCheckOnce();
    dev->healthy = false;
    for (int i = 0; i < threshold - 1; i++) registry_->healthCheckOnce();

    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Connected);
}

// ---------------------------------------------------------------------------
// Discovery
// ---------------------------------------------------------------------------
TEST_F(DeviceRegistryTest, PollReflectsReportedStates) {
    factory_->addDevice("SER1");
    factory_->addDevice("SER2")->setReportedState("unauthorized");
    factory_->addDevice("192.168.1.20:5555")->setReportedState("offline");

    registry_->pollOnce(std::chrono::steady_clock::now());

    EXPECT_EQ(registry_->listDevices().size(), 3u);
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Discovered);
    EXPECT_EQ(registry_->findDevice("SER2")->state, LinkState::Unauthorized);
    auto net = registry_->findDevice("192.168.1.20:5555");
    ASSERT_TRUE(net.has_value());
    EXPECT_EQ(net->state, LinkState::Offline);
    EXPECT_EQ(net->transport, TransportKind::Network);
}

TEST_F(DeviceRegistryTest, VanishedDeviceGraceThenRemoval) {
    recordEvents();
    auto dev = factory_->addDevice("SER1");
    auto t0 = std::chrono::steady_clock::now();
    registry_->pollOnce(t0);

    dev->listed = false;
    registry_->pollOnce(t0 + std::chrono::milliseconds(100));
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Discovered);

    registry_->pollOnce(t0 + std::chrono::milliseconds(1200));
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Disconnected);

    registry_->pollOnce(t0 + std::chrono::milliseconds(7000));
    EXPECT_FALSE(registry_->findDevice("SER1").has_value());

    auto evs = events();
    ASSERT_FALSE(evs.empty());
    EXPECT_TRUE(evs.back().removed);
}

TEST_F(DeviceRegistryTest, ReturningDeviceCancelsRemoval) {
    auto dev = factory_->addDevice("SER1");
    auto t0 = std::chrono::steady_clock::now();
    registry_->pollOnce(t0);

    dev->listed = false;
    registry_->pollOnce(t0 + std::chrono::milliseconds(100));
    registry_->pollOnce(t0 + std::chrono::milliseconds(1200));
    dev->listed = true;
    registry_->pollOnce(t0 + std::chrono::milliseconds(1300));
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Discovered);

    registry_->pollOnce(t0 + std::chrono::milliseconds(9000));
    EXPECT_TRUE(registry_->findDevice("SER1").has_value());
}

TEST_F(DeviceRegistryTest, ConnectedDeviceIsNotDropped) {
    auto dev = factory_->addDevice("SER1");
    ASSERT_TRUE(registry_->getOrConnect("SER1").is_ok());

    dev->listed = false;
    auto t0 = std::chrono::steady_clock::now();
    registry_->pollOnce(t0);
    registry_->pollOnce(t0 + std::chrono::milliseconds(60000));
    EXPECT_EQ(registry_->findDevice("SER1")->state, LinkState::Connected);
}
