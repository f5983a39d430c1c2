// =============================================================================
// mirrorhubd - device mirroring daemon
// =============================================================================
// Usage:
//   mirrorhubd [--config mirrorhub.json] [--list]
//   mirrorhubd --serial <serial> [--record out.h264] [--no-audio]
//
// --record writes the video stream exactly as the helper sent it
// (codec meta, then per packet a 12-byte header and the payload).
// =============================================================================
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <mutex>
#include <string>
#include <thread>

#include <signal.h>

#include "adb_transport.hpp"
#include "config_loader.hpp"
#include "deployer.hpp"
#include "mirror_engine.hpp"
#include "mirrorhub_log.hpp"

using namespace mirrorhub;

static std::atomic<bool> g_stop{false};

static void onSignal(int) {
    g_stop = true;
}

static void usage(const char* prog) {
    fprintf(stderr,
            "Usage: %s [--config <file>] [--list] [--serial <serial>] [--record <file>] [--no-audio]\n",
            prog);
}

int main(int argc, char** argv) {
    std::string config_path = "mirrorhub.json";
    std::string serial;
    std::string record_path;
    bool list_only = false;
    bool no_audio = false;

    for (int i = 1; i < argc; i++) {
        if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_path = argv[++i];
        } else if (strcmp(argv[i], "--serial") == 0 && i + 1 < argc) {
            serial = argv[++i];
        } else if (strcmp(argv[i], "--record") == 0 && i + 1 < argc) {
            record_path = argv[++i];
        } else if (strcmp(argv[i], "--list") == 0) {
            list_only = true;
        } else if (strcmp(argv[i], "--no-audio") == 0) {
            no_audio = true;
        } else {
            usage(argv[0]);
            return 2;
        }
    }

    config::AppConfig cfg = config::loadConfig(config_path);
    mirrorhub::log::setLogLevel(mirrorhub::log::parseLevel(cfg.log.level));
    if (!cfg.log.log_path.empty() && !mirrorhub::log::openLogFile(cfg.log.log_path.c_str())) {
        MHLOG_WARN("main", "Cannot open log file %s", cfg.log.log_path.c_str());
    }

    struct sigaction sa;
    memset(&sa, 0, sizeof(sa));
    sa.sa_handler = onSignal;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);
    signal(SIGPIPE, SIG_IGN);

    auto artifact = loadArtifact(cfg.helper.local_path, cfg.helper.version, cfg.helper.remote_path);
    if (artifact.is_err()) {
        MHLOG_FATAL("main", "%s", artifact.error().describe().c_str());
        mirrorhub::log::closeLogFile();
        return 1;
    }

    auto factory = std::make_shared<AdbTransportFactory>(cfg.adb);
    MirrorEngine engine(cfg, factory, artifact.value());

    auto device_sub = engine.events().subscribe<DeviceStateEvent>([](const DeviceStateEvent& e) {
        printf("device %-24s %s%s\n", e.serial.c_str(), linkStateName(e.new_state),
               e.removed ? " (removed)" : "");
        fflush(stdout);
    });
    auto session_sub = engine.events().subscribe<SessionStateEvent>([](const SessionStateEvent& e) {
        printf("session %llu %s -> %s %s\n", (unsigned long long)e.session_id,
               sessionStateName(e.old_state), sessionStateName(e.new_state), e.reason.c_str());
        fflush(stdout);
    });

    engine.init();

    if (list_only) {
        // One discovery round
        std::this_thread::sleep_for(std::chrono::milliseconds(cfg.discovery.poll_interval_ms / 2 + 500));
        for (const auto& d : engine.listDevices()) {
            printf("%-24s %-8s %s\n", d.serial.c_str(), transportKindName(d.transport), linkStateName(d.state));
        }
        engine.shutdown();
        mirrorhub::log::closeLogFile();
        return 0;
    }

    FILE* record = nullptr;
    std::mutex record_mutex;
    if (!serial.empty()) {
        ConfigOverrides overrides;
        if (no_audio) overrides.audio = false;
        auto session = engine.startSession(serial, overrides);
        if (session.is_err()) {
            MHLOG_ERROR("main", "Cannot start session on %s: %s", serial.c_str(),
                        session.error().describe().c_str());
            engine.shutdown();
            mirrorhub::log::closeLogFile();
            return 1;
        }

        if (!record_path.empty()) {
            record = fopen(record_path.c_str(), "wb");
            if (!record) {
                MHLOG_ERROR("main", "Cannot open %s for writing", record_path.c_str());
            }
        }

        SubscriberCallbacks cb;
        cb.on_frame = [&](const Frame& f) {
            std::lock_guard<std::mutex> lock(record_mutex);
            if (record && f.data) {
                if (fwrite(f.data->data(), 1, f.data->size(), record) != f.data->size()) return false;
            }
            return true;
        };
        cb.on_terminal = [](const TerminalNotice& n) {
            MHLOG_WARN("main", "Session %llu ended: %s (%s)", (unsigned long long)n.session_id,
                       terminalCauseName(n.cause), n.reason.c_str());
        };
        auto sub = engine.attachSubscriber(session.value(), kindBit(StreamKind::Video), cb);
        if (sub.is_err()) {
            MHLOG_ERROR("main", "Attach failed: %s", sub.error().describe().c_str());
        }
    }

    MHLOG_INFO("main", "Running, press Ctrl+C to stop");
    while (!g_stop) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    engine.shutdown();
    {
        std::lock_guard<std::mutex> lock(record_mutex);
        if (record) fclose(record);
        record = nullptr;
    }
    mirrorhub::log::closeLogFile();
    return 0;
}
