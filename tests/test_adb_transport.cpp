// =============================================================================
// Unit tests for adb client output parsing (src/adb_transport.cpp)
// =============================================================================
#include <gtest/gtest.h>
#include "adb_transport.hpp"

using namespace mirrorhub;

// ---------------------------------------------------------------------------
// adb devices
// ---------------------------------------------------------------------------
TEST(AdbParseTest, DevicesOutput) {
    std::string out =
        "* daemon not running; starting now at tcp:5037\n"
        "* daemon started successfully\n"
        "List of devices attached\n"
        "R58M123ABC\tdevice\n"
        "192.168.0.5:5555\tunauthorized\r\n"
        "emulator-5554\toffline\n"
        "\n";
    auto devices = adb::parseDevicesOutput(out);
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].serial, "R58M123ABC");
    EXPECT_EQ(devices[0].state, "device");
    EXPECT_EQ(devices[1].serial, "192.168.0.5:5555");
    EXPECT_EQ(devices[1].state, "unauthorized");
    EXPECT_EQ(devices[2].state, "offline");
}

TEST(AdbParseTest, DevicesOutputSkipsMdnsAndMalformed) {
    std::string out =
        "List of devices attached\n"
        "adb-R58M123ABC-xyz._adb-tls-connect._tcp\tdevice\n"
        "bad serial;rm\tdevice\n"
        "no-tab-line\n"
        "GOOD01\tdevice\n";
    auto devices = adb::parseDevicesOutput(out);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].serial, "GOOD01");
}

TEST(AdbParseTest, EmptyDeviceList) {
    EXPECT_TRUE(adb::parseDevicesOutput("List of devices attached\n\n").empty());
    EXPECT_TRUE(adb::parseDevicesOutput("").empty());
}

// ---------------------------------------------------------------------------
// adb forward tcp:0
// ---------------------------------------------------------------------------
TEST(AdbParseTest, ForwardPort) {
    EXPECT_EQ(adb::parseForwardPort("38211\n"), 38211);
    EXPECT_EQ(adb::parseForwardPort("5555"), 5555);
    EXPECT_EQ(adb::parseForwardPort(""), 0);
    EXPECT_EQ(adb::parseForwardPort("error: closed"), 0);
    EXPECT_EQ(adb::parseForwardPort("70000"), 0);
    EXPECT_EQ(adb::parseForwardPort("1234567"), 0);
}

// ---------------------------------------------------------------------------
// Error classification
// ---------------------------------------------------------------------------
TEST(AdbParseTest, ClassifyError) {
    EXPECT_EQ(adb::classifyError("error: device unauthorized.\nThis adb server's $ADB_VENDOR_KEYS..."),
              ErrorCode::DeviceUnauthorized);
    EXPECT_EQ(adb::classifyError("error: device offline"), ErrorCode::DeviceOffline);
    EXPECT_EQ(adb::classifyError("error: device 'XYZ' not found"), ErrorCode::DeviceNotFound);
    EXPECT_EQ(adb::classifyError("error: no devices/emulators found"), ErrorCode::DeviceNotFound);
    EXPECT_EQ(adb::classifyError("adb: error: failed to copy: Permission denied"),
              ErrorCode::PermissionDenied);
    EXPECT_EQ(adb::classifyError("error: closed"), ErrorCode::Disconnected);
    EXPECT_EQ(adb::classifyError("something else entirely"), ErrorCode::IoError);
}

// ---------------------------------------------------------------------------
// wm size
// ---------------------------------------------------------------------------
TEST(AdbParseTest, ScreenSizePhysical) {
    int w = 0, h = 0;
    ASSERT_TRUE(adb::parseScreenSize("Physical size: 1080x2400\n", w, h));
    EXPECT_EQ(w, 1080);
    EXPECT_EQ(h, 2400);
}

TEST(AdbParseTest, ScreenSizePrefersOverride) {
    int w = 0, h = 0;
    ASSERT_TRUE(adb::parseScreenSize("Physical size: 1440x3200\nOverride size: 1080x2400\n", w, h));
    EXPECT_EQ(w, 1080);
    EXPECT_EQ(h, 2400);
}

TEST(AdbParseTest, ScreenSizeGarbage) {
    int w = 0, h = 0;
    EXPECT_FALSE(adb::parseScreenSize("wm: not found", w, h));
    EXPECT_EQ(w, 0);
}

TEST(AdbParseTest, TrimRight) {
    EXPECT_EQ(adb::trimRight("Pixel 7\r\n"), "Pixel 7");
    EXPECT_EQ(adb::trimRight("  x \t"), "  x");
    EXPECT_EQ(adb::trimRight(""), "");
}

TEST(AdbParseTest, BaseArgsUseConfiguredServer) {
    config::AdbConfig cfg;
    cfg.adb_path = "/usr/bin/adb";
    cfg.server_port = 5038;
    auto args = adbBaseArgs(cfg);
    ASSERT_EQ(args.size(), 5u);
    EXPECT_EQ(args[0], "/usr/bin/adb");
    EXPECT_EQ(args[2], "127.0.0.1");
    EXPECT_EQ(args[4], "5038");
}

TEST(AdbTransportTest, ConnectRejectsInvalidSerial) {
    config::AdbConfig cfg;
    cfg.adb_path = "/nonexistent/adb";
    AdbTransportFactory factory(cfg);
    auto r = factory.connect("bad;serial", 1000);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().code, ErrorCode::DeviceNotFound);
}

// Network serials go through "adb connect" first; /bin/echo stands in for adb
TEST(AdbTransportTest, NetworkSerialRunsAdbConnect) {
    config::AdbConfig cfg;
    cfg.adb_path = "/bin/echo";
    AdbTransportFactory factory(cfg);

    auto net = factory.connect("192.168.1.20:5555", 2000);
    ASSERT_TRUE(net.is_err());
    EXPECT_EQ(net.error().code, ErrorCode::DeviceOffline);
    EXPECT_NE(net.error().message.find("adb connect"), std::string::npos);

    auto usb = factory.connect("R58M123ABC", 2000);
    ASSERT_TRUE(usb.is_err());
    EXPECT_EQ(usb.error().code, ErrorCode::DeviceOffline);
    EXPECT_NE(usb.error().message.find("device state"), std::string::npos);
}
