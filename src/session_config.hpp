// =============================================================================
// mirrorhub - Session Configuration
// =============================================================================
// Streaming parameters for one helper run. Defaults come from the `stream`
// config section, overrides from the caller; the merged result is validated
// field by field (first violation wins) against what the helper version and
// the device can actually do.
// =============================================================================
#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "config_loader.hpp"
#include "mirrorhub_types.hpp"
#include "result.hpp"

namespace mirrorhub {

enum class VideoCodec : uint8_t { H264, H265, AV1 };
enum class AudioCodec : uint8_t { Opus, Aac, Flac, Raw };

const char* videoCodecName(VideoCodec c);
const char* audioCodecName(AudioCodec c);
std::optional<VideoCodec> parseVideoCodec(const std::string& name);
std::optional<AudioCodec> parseAudioCodec(const std::string& name);

static constexpr int MAX_SIZE_LIMIT = 8192;
static constexpr int MIN_VIDEO_BIT_RATE = 100000;
static constexpr int MAX_VIDEO_BIT_RATE = 200000000;
static constexpr int MAX_FPS_LIMIT = 240;
static constexpr int MIN_AUDIO_BIT_RATE = 8000;
static constexpr int MAX_AUDIO_BIT_RATE = 1000000;
static constexpr int AUDIO_MIN_SDK = 30;    // Android 11
static constexpr const char* HELPER_CLASS = "com.genymobile.scrcpy.Server";

struct StreamParams {
    int max_size = 1920;            // 0 = no cap
    int video_bit_rate = 8000000;
    int max_fps = 60;
    VideoCodec video_codec = VideoCodec::H264;
    AudioCodec audio_codec = AudioCodec::Opus;
    int audio_bit_rate = 128000;
    bool video = true;
    bool audio = true;
    bool control = true;
    std::optional<int> display_id;
    std::optional<std::string> crop;                 // W:H:X:Y
    std::optional<int> lock_video_orientation;       // 0..3
    bool tunnel_forward = true;
    bool power_off_on_close = false;
};

// Every field optional; set fields replace the default
struct ConfigOverrides {
    std::optional<int> max_size;
    std::optional<int> video_bit_rate;
    std::optional<int> max_fps;
    std::optional<VideoCodec> video_codec;
    std::optional<AudioCodec> audio_codec;
    std::optional<int> audio_bit_rate;
    std::optional<bool> video;
    std::optional<bool> audio;
    std::optional<bool> control;
    std::optional<int> display_id;
    std::optional<std::string> crop;
    std::optional<int> lock_video_orientation;
    std::optional<bool> tunnel_forward;
    std::optional<bool> power_off_on_close;
};

// What the deployed helper and the device support
struct HelperCapabilities {
    std::string helper_version;
    int device_sdk = 0;     // 0 = unknown

    bool supportsAudio() const;
    bool supportsVideoCodec(VideoCodec c) const;
};

// "2.6.1" vs "2.0" -> <0, 0, >0
int compareVersions(const std::string& a, const std::string& b);

class SessionConfig {
public:
    static Result<SessionConfig> build(const StreamParams& defaults,
                                       const ConfigOverrides& overrides,
                                       const HelperCapabilities& caps);

    const StreamParams& params() const { return params_; }
    const std::string& helperVersion() const { return helper_version_; }

    StreamKindMask enabledKinds() const;
    bool isEnabled(StreamKind k) const { return hasKind(enabledKinds(), k); }

private:
    SessionConfig(StreamParams params, std::string helper_version)
        : params_(std::move(params)), helper_version_(std::move(helper_version)) {}

    StreamParams params_;
    std::string helper_version_;
};

// Defaults from the `stream` config section. Errors: ValidationError (codec names).
Result<StreamParams> defaultsFromConfig(const config::StreamDefaults& cfg);

// Reads overrides from a JSON object. Errors: ValidationError{field}.
Result<ConfigOverrides> parseOverrides(const nlohmann::json& j);

// key=value arguments following the version on the helper command line
std::vector<std::string> buildServerArgs(const SessionConfig& config, uint32_t scid);

// Full shell command that starts the helper
std::string buildCommand(const SessionConfig& config, const std::string& remote_path, uint32_t scid);

// Device-local abstract socket the helper listens on
std::string socketName(uint32_t scid);

} // namespace mirrorhub
