// =============================================================================
// mirrorhub - Session Configuration
// =============================================================================
#include "session_config.hpp"
#include "adb_security.hpp"
#include "mirrorhub_log.hpp"

#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <regex>
#include <sstream>
#include <nlohmann/json.hpp>

namespace mirrorhub {

const char* videoCodecName(VideoCodec c) {
    switch (c) {
        case VideoCodec::H264: return "h264";
        case VideoCodec::H265: return "h265";
        case VideoCodec::AV1:  return "av1";
    }
    return "?";
}

const char* audioCodecName(AudioCodec c) {
    switch (c) {
        case AudioCodec::Opus: return "opus";
        case AudioCodec::Aac:  return "aac";
        case AudioCodec::Flac: return "flac";
        case AudioCodec::Raw:  return "raw";
    }
    return "?";
}

std::optional<VideoCodec> parseVideoCodec(const std::string& name) {
    if (name == "h264") return VideoCodec::H264;
    if (name == "h265") return VideoCodec::H265;
    if (name == "av1")  return VideoCodec::AV1;
    return std::nullopt;
}

std::optional<AudioCodec> parseAudioCodec(const std::string& name) {
    if (name == "opus") return AudioCodec::Opus;
    if (name == "aac")  return AudioCodec::Aac;
    if (name == "flac") return AudioCodec::Flac;
    if (name == "raw")  return AudioCodec::Raw;
    return std::nullopt;
}

int compareVersions(const std::string& a, const std::string& b) {
    std::istringstream sa(a), sb(b);
    std::string pa, pb;
    for (;;) {
        bool ha = static_cast<bool>(std::getline(sa, pa, '.'));
        bool hb = static_cast<bool>(std::getline(sb, pb, '.'));
        if (!ha && !hb) return 0;
        int va = ha ? std::atoi(pa.c_str()) : 0;
        int vb = hb ? std::atoi(pb.c_str()) : 0;
        if (va != vb) return va < vb ? -1 : 1;
    }
}

// Audio forwarding and the h265/av1 encoders arrived with helper 2.0
bool HelperCapabilities::supportsAudio() const {
    if (compareVersions(helper_version, "2.0") < 0) return false;
    return device_sdk == 0 || device_sdk >= AUDIO_MIN_SDK;
}

bool HelperCapabilities::supportsVideoCodec(VideoCodec c) const {
    if (c == VideoCodec::H264) return true;
    return compareVersions(helper_version, "2.0") >= 0;
}

StreamKindMask SessionConfig::enabledKinds() const {
    StreamKindMask m = 0;
    if (params_.video) m |= kindBit(StreamKind::Video);
    if (params_.audio) m |= kindBit(StreamKind::Audio);
    if (params_.control) m |= kindBit(StreamKind::Control);
    return m;
}

namespace {

Error invalid(const char* field, const std::string& reason) {
    return Error(ErrorCode::ValidationError, reason, field);
}

bool validCrop(const std::string& crop) {
    static const std::regex pattern(R"(^(\d{1,5}):(\d{1,5}):(\d{1,5}):(\d{1,5})$)");
    std::smatch m;
    if (!std::regex_match(crop, m, pattern)) return false;
    return std::atoi(m[1].str().c_str()) > 0 && std::atoi(m[2].str().c_str()) > 0;
}

} // namespace

Result<SessionConfig> SessionConfig::build(const StreamParams& defaults,
                                           const ConfigOverrides& o,
                                           const HelperCapabilities& caps) {
    StreamParams p = defaults;
    if (o.max_size) p.max_size = *o.max_size;
    if (o.video_bit_rate) p.video_bit_rate = *o.video_bit_rate;
    if (o.max_fps) p.max_fps = *o.max_fps;
    if (o.video_codec) p.video_codec = *o.video_codec;
    if (o.audio_codec) p.audio_codec = *o.audio_codec;
    if (o.audio_bit_rate) p.audio_bit_rate = *o.audio_bit_rate;
    if (o.video) p.video = *o.video;
    if (o.audio) p.audio = *o.audio;
    if (o.control) p.control = *o.control;
    if (o.display_id) p.display_id = o.display_id;
    if (o.crop) p.crop = o.crop;
    if (o.lock_video_orientation) p.lock_video_orientation = o.lock_video_orientation;
    if (o.tunnel_forward) p.tunnel_forward = *o.tunnel_forward;
    if (o.power_off_on_close) p.power_off_on_close = *o.power_off_on_close;

    if (!security::isSafeToken(caps.helper_version)) {
        return invalid("helper_version", "invalid helper version string");
    }
    // Declaration order; the first violation is reported
    if (p.max_size != 0 && (p.max_size < 2 || p.max_size > MAX_SIZE_LIMIT)) {
        return invalid("max_size", "must be 0 or between 2 and " + std::to_string(MAX_SIZE_LIMIT));
    }
    if (p.video_bit_rate < MIN_VIDEO_BIT_RATE || p.video_bit_rate > MAX_VIDEO_BIT_RATE) {
        return invalid("video_bit_rate", "out of range");
    }
    if (p.max_fps < 1 || p.max_fps > MAX_FPS_LIMIT) {
        return invalid("max_fps", "must be between 1 and " + std::to_string(MAX_FPS_LIMIT));
    }
    if (p.video && !caps.supportsVideoCodec(p.video_codec)) {
        return invalid("video_codec", std::string(videoCodecName(p.video_codec)) +
                       " unsupported by helper " + caps.helper_version);
    }
    if (p.audio && (p.audio_bit_rate < MIN_AUDIO_BIT_RATE || p.audio_bit_rate > MAX_AUDIO_BIT_RATE)) {
        return invalid("audio_bit_rate", "out of range");
    }
    if (!p.video && !p.audio && !p.control) {
        return invalid("video", "at least one of video, audio, control must be enabled");
    }
    if (p.audio && !caps.supportsAudio()) {
        if (compareVersions(caps.helper_version, "2.0") < 0) {
            return invalid("audio", "audio unsupported by helper " + caps.helper_version);
        }
        return invalid("audio", "audio requires Android 11 (SDK " + std::to_string(AUDIO_MIN_SDK) +
                       "), device reports SDK " + std::to_string(caps.device_sdk));
    }
    if (p.display_id && *p.display_id < 0) {
        return invalid("display_id", "must be >= 0");
    }
    if (p.crop && !validCrop(*p.crop)) {
        return invalid("crop", "expected W:H:X:Y");
    }
    if (p.lock_video_orientation &&
        (*p.lock_video_orientation < 0 || *p.lock_video_orientation > 3)) {
        return invalid("lock_video_orientation", "must be between 0 and 3");
    }
    // Sockets are only reached through "adb forward"; a reverse tunnel is never set up
    if (!p.tunnel_forward) {
        return invalid("tunnel_forward", "only forward tunnels are supported");
    }

    return SessionConfig(std::move(p), caps.helper_version);
}

Result<StreamParams> defaultsFromConfig(const config::StreamDefaults& cfg) {
    StreamParams p;
    p.max_size = cfg.max_size;
    p.video_bit_rate = cfg.video_bit_rate;
    p.max_fps = cfg.max_fps;
    auto vc = parseVideoCodec(cfg.video_codec);
    if (!vc) return Err<StreamParams>(ErrorCode::ValidationError, "unknown codec " + cfg.video_codec, "video_codec");
    p.video_codec = *vc;
    auto ac = parseAudioCodec(cfg.audio_codec);
    if (!ac) return Err<StreamParams>(ErrorCode::ValidationError, "unknown codec " + cfg.audio_codec, "audio_codec");
    p.audio_codec = *ac;
    p.audio_bit_rate = cfg.audio_bit_rate;
    p.video = cfg.video;
    p.audio = cfg.audio;
    p.control = cfg.control;
    p.tunnel_forward = cfg.tunnel_forward;
    p.power_off_on_close = cfg.power_off_on_close;
    return Ok(std::move(p));
}

// -----------------------------------------------------------------------------
// JSON overrides
// -----------------------------------------------------------------------------
namespace {

Result<std::optional<int>> readInt(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::optional<int>{};
    if (!it->is_number_integer()) {
        return Err<std::optional<int>>(ErrorCode::ValidationError, "expected integer", key);
    }
    auto v = it->get<long long>();
    if (v < INT32_MIN || v > INT32_MAX) {
        return Err<std::optional<int>>(ErrorCode::ValidationError, "out of range", key);
    }
    return std::optional<int>(static_cast<int>(v));
}

Result<std::optional<bool>> readBool(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::optional<bool>{};
    if (!it->is_boolean()) {
        return Err<std::optional<bool>>(ErrorCode::ValidationError, "expected boolean", key);
    }
    return std::optional<bool>(it->get<bool>());
}

Result<std::optional<std::string>> readString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return std::optional<std::string>{};
    if (!it->is_string()) {
        return Err<std::optional<std::string>>(ErrorCode::ValidationError, "expected string", key);
    }
    return std::optional<std::string>(it->get<std::string>());
}

const char* const KNOWN_KEYS[] = {
    "max_size", "video_bit_rate", "bit_rate", "max_fps", "video_codec", "audio_codec",
    "audio_bit_rate", "video", "audio", "control", "display_id", "crop",
    "lock_video_orientation", "tunnel_forward", "power_off_on_close",
};

} // namespace

Result<ConfigOverrides> parseOverrides(const nlohmann::json& j) {
    ConfigOverrides o;
    if (j.is_null()) return Ok(std::move(o));
    if (!j.is_object()) {
        return Err<ConfigOverrides>(ErrorCode::ValidationError, "overrides must be an object", "config");
    }
    for (auto it = j.begin(); it != j.end(); ++it) {
        bool known = false;
        for (const char* k : KNOWN_KEYS) {
            if (it.key() == k) { known = true; break; }
        }
        if (!known) {
            return Err<ConfigOverrides>(ErrorCode::ValidationError, "unknown field", it.key());
        }
    }

    o.max_size = MIRRORHUB_TRY(readInt(j, "max_size"));
    o.video_bit_rate = MIRRORHUB_TRY(readInt(j, "video_bit_rate"));
    if (!o.video_bit_rate) o.video_bit_rate = MIRRORHUB_TRY(readInt(j, "bit_rate"));
    o.max_fps = MIRRORHUB_TRY(readInt(j, "max_fps"));

    auto vc = MIRRORHUB_TRY(readString(j, "video_codec"));
    if (vc) {
        o.video_codec = parseVideoCodec(*vc);
        if (!o.video_codec) {
            return Err<ConfigOverrides>(ErrorCode::ValidationError, "unknown codec " + *vc, "video_codec");
        }
    }
    auto ac = MIRRORHUB_TRY(readString(j, "audio_codec"));
    if (ac) {
        o.audio_codec = parseAudioCodec(*ac);
        if (!o.audio_codec) {
            return Err<ConfigOverrides>(ErrorCode::ValidationError, "unknown codec " + *ac, "audio_codec");
        }
    }

    o.audio_bit_rate = MIRRORHUB_TRY(readInt(j, "audio_bit_rate"));
    o.video = MIRRORHUB_TRY(readBool(j, "video"));
    o.audio = MIRRORHUB_TRY(readBool(j, "audio"));
    o.control = MIRRORHUB_TRY(readBool(j, "control"));
    o.display_id = MIRRORHUB_TRY(readInt(j, "display_id"));
    o.crop = MIRRORHUB_TRY(readString(j, "crop"));
    o.lock_video_orientation = MIRRORHUB_TRY(readInt(j, "lock_video_orientation"));
    o.tunnel_forward = MIRRORHUB_TRY(readBool(j, "tunnel_forward"));
    o.power_off_on_close = MIRRORHUB_TRY(readBool(j, "power_off_on_close"));
    return Ok(std::move(o));
}

// -----------------------------------------------------------------------------
// Command line
// -----------------------------------------------------------------------------
static std::string hex8(uint32_t v) {
    char buf[16];
    snprintf(buf, sizeof(buf), "%08x", v);
    return buf;
}

static const char* boolStr(bool b) { return b ? "true" : "false"; }

std::string socketName(uint32_t scid) {
    return "scrcpy_" + hex8(scid);
}

std::vector<std::string> buildServerArgs(const SessionConfig& config, uint32_t scid) {
    const StreamParams& p = config.params();
    std::vector<std::string> args;

    args.push_back("scid=" + hex8(scid));
    args.push_back("log_level=info");
    args.push_back(std::string("video=") + boolStr(p.video));
    args.push_back(std::string("audio=") + boolStr(p.audio));
    args.push_back(std::string("control=") + boolStr(p.control));

    if (p.video) {
        args.push_back(std::string("video_codec=") + videoCodecName(p.video_codec));
        args.push_back("video_bit_rate=" + std::to_string(p.video_bit_rate));
        args.push_back("max_size=" + std::to_string(p.max_size));
        args.push_back("max_fps=" + std::to_string(p.max_fps));
    }
    if (p.audio) {
        args.push_back(std::string("audio_codec=") + audioCodecName(p.audio_codec));
        args.push_back("audio_bit_rate=" + std::to_string(p.audio_bit_rate));
    }

    if (p.display_id) args.push_back("display_id=" + std::to_string(*p.display_id));
    if (p.crop) args.push_back("crop=" + *p.crop);
    if (p.lock_video_orientation) {
        args.push_back("lock_video_orientation=" + std::to_string(*p.lock_video_orientation));
    }

    args.push_back(std::string("tunnel_forward=") + boolStr(p.tunnel_forward));
    args.push_back("send_device_meta=true");
    args.push_back("send_frame_meta=true");
    args.push_back("send_codec_meta=true");
    args.push_back("send_dummy_byte=false");
    args.push_back("downsize_on_error=false");
    args.push_back("cleanup=true");
    args.push_back(std::string("power_off_on_close=") + boolStr(p.power_off_on_close));
    return args;
}

std::string buildCommand(const SessionConfig& config, const std::string& remote_path, uint32_t scid) {
    std::string cmd = "CLASSPATH=" + remote_path + " app_process / " + HELPER_CLASS + " " +
                      config.helperVersion();
    for (const auto& a : buildServerArgs(config, scid)) {
        cmd += ' ';
        cmd += a;
    }
    return cmd;
}

} // namespace mirrorhub
