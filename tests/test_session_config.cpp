// =============================================================================
// Unit tests for SessionConfig (validation, overrides, helper command line)
// =============================================================================
#include <gtest/gtest.h>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "session_config.hpp"

using namespace mirrorhub;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static HelperCapabilities modernCaps() {
    HelperCapabilities caps;
    caps.helper_version = "2.6.1";
    caps.device_sdk = 34;
    return caps;
}

static bool hasArg(const std::vector<std::string>& args, const std::string& a) {
    return std::find(args.begin(), args.end(), a) != args.end();
}

TEST(SessionConfigTest, DefaultsAreValid) {
    auto cfg = SessionConfig::build(StreamParams{}, ConfigOverrides{}, modernCaps());
    ASSERT_TRUE(cfg.is_ok()) << cfg.error().describe();
    EXPECT_EQ(cfg.value().enabledKinds(), ALL_STREAM_KINDS);
    EXPECT_EQ(cfg.value().helperVersion(), "2.6.1");
}

TEST(SessionConfigTest, OverridesReplaceDefaults) {
    ConfigOverrides o;
    o.max_size = 1024;
    o.max_fps = 30;
    o.audio = false;
    auto cfg = SessionConfig::build(StreamParams{}, o, modernCaps());
    ASSERT_TRUE(cfg.is_ok());
    EXPECT_EQ(cfg.value().params().max_size, 1024);
    EXPECT_EQ(cfg.value().params().max_fps, 30);
    EXPECT_FALSE(cfg.value().isEnabled(StreamKind::Audio));
    EXPECT_TRUE(cfg.value().isEnabled(StreamKind::Video));
}

// ---------------------------------------------------------------------------
// Field validation
// ---------------------------------------------------------------------------
TEST(SessionConfigTest, RejectsOutOfRangeFields) {
    struct Case {
        ConfigOverrides o;
        const char* field;
    };
    std::vector<Case> cases(6);
    cases[0].o.max_size = 1;                    cases[0].field = "max_size";
    cases[1].o.video_bit_rate = 10;             cases[1].field = "video_bit_rate";
    cases[2].o.max_fps = 0;                     cases[2].field = "max_fps";
    cases[3].o.audio_bit_rate = 1;              cases[3].field = "audio_bit_rate";
    cases[4].o.crop = std::string("10:10");     cases[4].field = "crop";
    cases[5].o.lock_video_orientation = 4;      cases[5].field = "lock_video_orientation";

    for (const auto& c : cases) {
        auto cfg = SessionConfig::build(StreamParams{}, c.o, modernCaps());
        ASSERT_TRUE(cfg.is_err()) << c.field;
        EXPECT_EQ(cfg.error().code, ErrorCode::ValidationError);
        EXPECT_EQ(cfg.error().field, c.field);
    }
}

TEST(SessionConfigTest, FirstViolationWins) {
    ConfigOverrides o;
    o.max_fps = 1000;
    o.lock_video_orientation = 9;
    auto cfg = SessionConfig::build(StreamParams{}, o, modernCaps());
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().field, "max_fps");
}

TEST(SessionConfigTest, ReverseTunnelIsRejected) {
    ConfigOverrides o;
    o.tunnel_forward = false;
    auto cfg = SessionConfig::build(StreamParams{}, o, modernCaps());
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(cfg.error().field, "tunnel_forward");

    // Same through the JSON overrides
    auto parsed = parseOverrides(nlohmann::json::parse(R"({"tunnel_forward": false})"));
    ASSERT_TRUE(parsed.is_ok());
    auto from_json = SessionConfig::build(StreamParams{}, parsed.value(), modernCaps());
    ASSERT_TRUE(from_json.is_err());
    EXPECT_EQ(from_json.error().field, "tunnel_forward");

    StreamParams defaults;
    defaults.tunnel_forward = false;
    auto from_defaults = SessionConfig::build(defaults, ConfigOverrides{}, modernCaps());
    ASSERT_TRUE(from_defaults.is_err());
    EXPECT_EQ(from_defaults.error().field, "tunnel_forward");
}

TEST(SessionConfigTest, MaxSizeZeroMeansUncapped) {
    ConfigOverrides o;
    o.max_size = 0;
    EXPECT_TRUE(SessionConfig::build(StreamParams{}, o, modernCaps()).is_ok());
}

TEST(SessionConfigTest, AllStreamsDisabledIsRejected) {
    ConfigOverrides o;
    o.video = false;
    o.audio = false;
    o.control = false;
    auto cfg = SessionConfig::build(StreamParams{}, o, modernCaps());
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().code, ErrorCode::ValidationError);
}

// ---------------------------------------------------------------------------
// Capability checks
// ---------------------------------------------------------------------------
TEST(SessionConfigTest, AudioNeedsAndroid11) {
    HelperCapabilities caps = modernCaps();
    caps.device_sdk = 29;
    auto cfg = SessionConfig::build(StreamParams{}, ConfigOverrides{}, caps);
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().field, "audio");

    ConfigOverrides no_audio;
    no_audio.audio = false;
    EXPECT_TRUE(SessionConfig::build(StreamParams{}, no_audio, caps).is_ok());
}

TEST(SessionConfigTest, OldHelperRejectsAudioAndH265) {
    HelperCapabilities caps;
    caps.helper_version = "1.25";
    caps.device_sdk = 34;

    ConfigOverrides o;
    o.audio = false;
    o.video_codec = VideoCodec::H265;
    auto cfg = SessionConfig::build(StreamParams{}, o, caps);
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().field, "video_codec");

    auto with_audio = SessionConfig::build(StreamParams{}, ConfigOverrides{}, caps);
    ASSERT_TRUE(with_audio.is_err());
    EXPECT_EQ(with_audio.error().field, "audio");
}

TEST(SessionConfigTest, UnsafeHelperVersionRejected) {
    HelperCapabilities caps = modernCaps();
    caps.helper_version = "2.6; reboot";
    auto cfg = SessionConfig::build(StreamParams{}, ConfigOverrides{}, caps);
    ASSERT_TRUE(cfg.is_err());
    EXPECT_EQ(cfg.error().field, "helper_version");
}

TEST(SessionConfigTest, CompareVersions) {
    EXPECT_EQ(compareVersions("2.6.1", "2.6.1"), 0);
    EXPECT_LT(compareVersions("1.25", "2.0"), 0);
    EXPECT_GT(compareVersions("2.10", "2.9"), 0);
    EXPECT_EQ(compareVersions("2.0", "2"), 0);
}

// ---------------------------------------------------------------------------
// Defaults from the config file and JSON overrides
// ---------------------------------------------------------------------------
TEST(SessionConfigTest, DefaultsFromConfigRejectsUnknownCodec) {
    config::StreamDefaults d;
    d.video_codec = "vp9";
    auto r = defaultsFromConfig(d);
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error().field, "video_codec");

    d.video_codec = "h265";
    auto ok = defaultsFromConfig(d);
    ASSERT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value().video_codec, VideoCodec::H265);
}

TEST(SessionConfigTest, ParseOverridesFromJson) {
    auto j = nlohmann::json::parse(R"({"max_size": 800, "audio": false, "video_codec": "av1",
                                       "crop": "100:200:0:0", "bit_rate": 4000000})");
    auto r = parseOverrides(j);
    ASSERT_TRUE(r.is_ok()) << r.error().describe();
    const ConfigOverrides& o = r.value();
    EXPECT_EQ(*o.max_size, 800);
    EXPECT_FALSE(*o.audio);
    EXPECT_EQ(*o.video_codec, VideoCodec::AV1);
    EXPECT_EQ(*o.crop, "100:200:0:0");
    EXPECT_EQ(*o.video_bit_rate, 4000000);
    EXPECT_FALSE(o.max_fps.has_value());
}

TEST(SessionConfigTest, ParseOverridesErrorsNameTheField) {
    auto unknown = parseOverrides(nlohmann::json::parse(R"({"maxsize": 800})"));
    ASSERT_TRUE(unknown.is_err());
    EXPECT_EQ(unknown.error().field, "maxsize");

    auto wrong_type = parseOverrides(nlohmann::json::parse(R"({"max_fps": "sixty"})"));
    ASSERT_TRUE(wrong_type.is_err());
    EXPECT_EQ(wrong_type.error().field, "max_fps");

    auto bad_codec = parseOverrides(nlohmann::json::parse(R"({"audio_codec": "mp3"})"));
    ASSERT_TRUE(bad_codec.is_err());
    EXPECT_EQ(bad_codec.error().field, "audio_codec");

    auto not_object = parseOverrides(nlohmann::json::parse("[1, 2]"));
    ASSERT_TRUE(not_object.is_err());
}

// ---------------------------------------------------------------------------
// Helper command line
// ---------------------------------------------------------------------------
TEST(SessionConfigTest, ServerArgsReflectConfig) {
    ConfigOverrides o;
    o.audio = false;
    o.display_id = 2;
    auto cfg = SessionConfig::build(StreamParams{}, o, modernCaps());
    ASSERT_TRUE(cfg.is_ok());

    auto args = buildServerArgs(cfg.value(), 0x1a2b3c);
    EXPECT_EQ(args.front(), "scid=001a2b3c");
    EXPECT_TRUE(hasArg(args, "video=true"));
    EXPECT_TRUE(hasArg(args, "audio=false"));
    EXPECT_TRUE(hasArg(args, "control=true"));
    EXPECT_TRUE(hasArg(args, "video_codec=h264"));
    EXPECT_TRUE(hasArg(args, "display_id=2"));
    EXPECT_TRUE(hasArg(args, "send_dummy_byte=false"));
    EXPECT_FALSE(hasArg(args, "audio_codec=opus"));
}

TEST(SessionConfigTest, CommandAndSocketName) {
    auto cfg = SessionConfig::build(StreamParams{}, ConfigOverrides{}, modernCaps());
    ASSERT_TRUE(cfg.is_ok());
    std::string cmd = buildCommand(cfg.value(), "/data/local/tmp/scrcpy-server.jar", 0xdeadbeef);
    EXPECT_EQ(cmd.rfind("CLASSPATH=/data/local/tmp/scrcpy-server.jar app_process / "
                        "com.genymobile.scrcpy.Server 2.6.1 scid=deadbeef", 0), 0u);
    EXPECT_EQ(socketName(0xdeadbeef), "scrcpy_deadbeef");
}
