#pragma once
// =============================================================================
// mirrorhub - Config Loader
// =============================================================================
// Loads engine settings from mirrorhub.json with nlohmann/json.
// Missing file or keys fall back to the defaults below.
// =============================================================================

#include <string>
#include <fstream>
#include <cstddef>
#include <nlohmann/json.hpp>
#include "mirrorhub_log.hpp"

namespace mirrorhub {
namespace config {

struct AdbConfig {
    std::string adb_path = "adb";
    std::string server_host = "127.0.0.1";
    int server_port = 5037;
};

struct HelperConfig {
    std::string local_path = "scrcpy-server.jar";
    std::string version = "2.6.1";
    std::string remote_path = "/data/local/tmp/scrcpy-server.jar";
};

struct LinkConfig {
    int connect_timeout_ms = 10000;
    int shell_timeout_ms = 8000;
    int push_timeout_ms = 30000;
    int retry_attempts = 3;
    int retry_base_ms = 200;
    int retry_max_ms = 2000;
    int health_interval_ms = 2000;
    int health_timeout_ms = 3000;
    int health_failure_threshold = 3;
};

struct DiscoveryConfig {
    bool enabled = true;
    int poll_interval_ms = 2000;
    int vanish_grace_ms = 3000;
    int remove_after_ms = 30000;
};

struct SessionTiming {
    int socket_connect_timeout_ms = 5000;   // per socket, includes retries
    int connect_retry_interval_ms = 100;
    int handshake_timeout_ms = 5000;        // device meta on the first socket
    int stop_grace_ms = 2000;
    int monitor_interval_ms = 500;
};

struct FanoutConfig {
    size_t video_queue = 30;
    size_t audio_queue = 64;
    size_t control_queue = 256;
    int control_block_ms = 500;
    int terminal_drain_ms = 1000;
};

// Defaults for SessionConfig; codec names are validated when a session is built
struct StreamDefaults {
    int max_size = 1920;
    int video_bit_rate = 8000000;
    int max_fps = 60;
    std::string video_codec = "h264";
    std::string audio_codec = "opus";
    int audio_bit_rate = 128000;
    bool video = true;
    bool audio = true;
    bool control = true;
    bool tunnel_forward = true;
    bool power_off_on_close = false;
};

struct LogConfig {
    std::string log_path = "mirrorhub.log";
    std::string level = "info";
};

struct AppConfig {
    AdbConfig adb;
    HelperConfig helper;
    LinkConfig link;
    DiscoveryConfig discovery;
    SessionTiming session;
    FanoutConfig fanout;
    StreamDefaults stream;
    LogConfig log;
};

// Safe JSON accessor with section/key and default value
template<typename T>
T jsonGet(const nlohmann::json& j, const std::string& section,
          const std::string& key, const T& def) {
    try {
        if (j.contains(section) && j[section].contains(key)) {
            return j[section][key].get<T>();
        }
    } catch (const nlohmann::json::exception& e) {
        MHLOG_WARN("config", "%s.%s: %s (using default)", section.c_str(), key.c_str(), e.what());
    }
    return def;
}

inline AppConfig parseConfig(const nlohmann::json& j) {
    AppConfig config;
    const AppConfig d;

    config.adb.adb_path    = jsonGet<std::string>(j, "adb", "adb_path", d.adb.adb_path);
    config.adb.server_host = jsonGet<std::string>(j, "adb", "server_host", d.adb.server_host);
    config.adb.server_port = jsonGet<int>(j, "adb", "server_port", d.adb.server_port);

    config.helper.local_path  = jsonGet<std::string>(j, "helper", "local_path", d.helper.local_path);
    config.helper.version     = jsonGet<std::string>(j, "helper", "version", d.helper.version);
    config.helper.remote_path = jsonGet<std::string>(j, "helper", "remote_path", d.helper.remote_path);

    config.link.connect_timeout_ms = jsonGet<int>(j, "link", "connect_timeout_ms", d.link.connect_timeout_ms);
    config.link.shell_timeout_ms   = jsonGet<int>(j, "link", "shell_timeout_ms", d.link.shell_timeout_ms);
    config.link.push_timeout_ms    = jsonGet<int>(j, "link", "push_timeout_ms", d.link.push_timeout_ms);
    config.link.retry_attempts     = jsonGet<int>(j, "link", "retry_attempts", d.link.retry_attempts);
    config.link.retry_base_ms      = jsonGet<int>(j, "link", "retry_base_ms", d.link.retry_base_ms);
    config.link.retry_max_ms       = jsonGet<int>(j, "link", "retry_max_ms", d.link.retry_max_ms);
    config.link.health_interval_ms = jsonGet<int>(j, "link", "health_interval_ms", d.link.health_interval_ms);
    config.link.health_timeout_ms  = jsonGet<int>(j, "link", "health_timeout_ms", d.link.health_timeout_ms);
    config.link.health_failure_threshold =
        jsonGet<int>(j, "link", "health_failure_threshold", d.link.health_failure_threshold);

    config.discovery.enabled          = jsonGet<bool>(j, "discovery", "enabled", d.discovery.enabled);
    config.discovery.poll_interval_ms = jsonGet<int>(j, "discovery", "poll_interval_ms", d.discovery.poll_interval_ms);
    config.discovery.vanish_grace_ms  = jsonGet<int>(j, "discovery", "vanish_grace_ms", d.discovery.vanish_grace_ms);
    config.discovery.remove_after_ms  = jsonGet<int>(j, "discovery", "remove_after_ms", d.discovery.remove_after_ms);

    config.session.socket_connect_timeout_ms =
        jsonGet<int>(j, "session", "socket_connect_timeout_ms", d.session.socket_connect_timeout_ms);
    config.session.connect_retry_interval_ms =
        jsonGet<int>(j, "session", "connect_retry_interval_ms", d.session.connect_retry_interval_ms);
    config.session.handshake_timeout_ms =
        jsonGet<int>(j, "session", "handshake_timeout_ms", d.session.handshake_timeout_ms);
    config.session.stop_grace_ms       = jsonGet<int>(j, "session", "stop_grace_ms", d.session.stop_grace_ms);
    config.session.monitor_interval_ms = jsonGet<int>(j, "session", "monitor_interval_ms", d.session.monitor_interval_ms);

    config.fanout.video_queue       = jsonGet<size_t>(j, "fanout", "video_queue", d.fanout.video_queue);
    config.fanout.audio_queue       = jsonGet<size_t>(j, "fanout", "audio_queue", d.fanout.audio_queue);
    config.fanout.control_queue     = jsonGet<size_t>(j, "fanout", "control_queue", d.fanout.control_queue);
    config.fanout.control_block_ms  = jsonGet<int>(j, "fanout", "control_block_ms", d.fanout.control_block_ms);
    config.fanout.terminal_drain_ms = jsonGet<int>(j, "fanout", "terminal_drain_ms", d.fanout.terminal_drain_ms);

    config.stream.max_size       = jsonGet<int>(j, "stream", "max_size", d.stream.max_size);
    config.stream.video_bit_rate = jsonGet<int>(j, "stream", "video_bit_rate", d.stream.video_bit_rate);
    config.stream.max_fps        = jsonGet<int>(j, "stream", "max_fps", d.stream.max_fps);
    config.stream.video_codec    = jsonGet<std::string>(j, "stream", "video_codec", d.stream.video_codec);
    config.stream.audio_codec    = jsonGet<std::string>(j, "stream", "audio_codec", d.stream.audio_codec);
    config.stream.audio_bit_rate = jsonGet<int>(j, "stream", "audio_bit_rate", d.stream.audio_bit_rate);
    config.stream.video          = jsonGet<bool>(j, "stream", "video", d.stream.video);
    config.stream.audio          = jsonGet<bool>(j, "stream", "audio", d.stream.audio);
    config.stream.control        = jsonGet<bool>(j, "stream", "control", d.stream.control);
    config.stream.tunnel_forward = jsonGet<bool>(j, "stream", "tunnel_forward", d.stream.tunnel_forward);
    config.stream.power_off_on_close =
        jsonGet<bool>(j, "stream", "power_off_on_close", d.stream.power_off_on_close);

    config.log.log_path = jsonGet<std::string>(j, "log", "log_path", d.log.log_path);
    config.log.level    = jsonGet<std::string>(j, "log", "level", d.log.level);

    return config;
}

// @param configPath  Path to config file
// @param strict      If true, only try the exact path (no fallback search)
inline AppConfig loadConfig(const std::string& configPath = "mirrorhub.json",
                            bool strict = false) {
    AppConfig config;

    std::ifstream file(configPath);
    if (!file.is_open() && !strict) {
        file.open("mirrorhub.json");
        if (!file.is_open()) {
            file.open("/etc/mirrorhub/mirrorhub.json");
        }
    }
    if (!file.is_open()) {
        MHLOG_WARN("config", "%s not found, using defaults", configPath.c_str());
        return config;
    }

    try {
        nlohmann::json j = nlohmann::json::parse(file);
        config = parseConfig(j);
    } catch (const nlohmann::json::exception& e) {
        MHLOG_ERROR("config", "JSON parse error: %s", e.what());
        return AppConfig{};
    }

    MHLOG_INFO("config", "Loaded: adb=%s helper=%s v%s discovery=%s",
               config.adb.adb_path.c_str(),
               config.helper.local_path.c_str(),
               config.helper.version.c_str(),
               config.discovery.enabled ? "on" : "off");

    return config;
}

} // namespace config
} // namespace mirrorhub
