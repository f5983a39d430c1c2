// =============================================================================
// mirrorhub - Helper Deployer
// =============================================================================
#include "deployer.hpp"
#include <cstdio>
#include <cstdlib>
#include <sstream>
#include "adb_security.hpp"
#include "mirrorhub_log.hpp"

namespace mirrorhub {

static constexpr const char* TAG = "Deploy";

Result<std::shared_ptr<const HelperArtifact>> loadArtifact(const std::string& local_path,
                                                           const std::string& version,
                                                           const std::string& remote_path) {
    using ArtifactResult = Result<std::shared_ptr<const HelperArtifact>>;
    if (!security::isSafeToken(version)) {
        return ArtifactResult(Error(ErrorCode::ValidationError, "invalid helper version", "version"));
    }
    if (!security::isAllowedRemotePath(remote_path)) {
        return ArtifactResult(Error(ErrorCode::ValidationError, "remote path not allowed", "remote_path"));
    }

    FILE* f = fopen(local_path.c_str(), "rb");
    if (!f) {
        MHLOG_ERROR(TAG, "Helper not found at %s", local_path.c_str());
        return ArtifactResult(Error(ErrorCode::DeployFailed, "helper not found at " + local_path));
    }
    auto artifact = std::make_shared<HelperArtifact>();
    artifact->version = version;
    artifact->remote_path = remote_path;
    uint8_t buf[64 * 1024];
    size_t n;
    while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
        artifact->bytes.insert(artifact->bytes.end(), buf, buf + n);
    }
    bool read_error = ferror(f) != 0;
    fclose(f);
    if (read_error || artifact->bytes.empty()) {
        return ArtifactResult(Error(ErrorCode::DeployFailed, "cannot read helper from " + local_path));
    }

    MHLOG_INFO(TAG, "Loaded helper %s (%zu bytes, version %s)",
               local_path.c_str(), artifact->bytes.size(), version.c_str());
    return ArtifactResult(std::shared_ptr<const HelperArtifact>(std::move(artifact)));
}

DeployProbe parseDeployProbe(const std::string& output) {
    DeployProbe p;
    std::istringstream in(output);
    std::string line;
    while (std::getline(in, line)) {
        while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) line.pop_back();
        if (line.rfind("size=", 0) == 0) {
            std::string v = line.substr(5);
            if (!v.empty() && v.find_first_not_of("0123456789") == std::string::npos) {
                p.present = true;
                p.size = std::strtoull(v.c_str(), nullptr, 10);
            }
        } else if (line.rfind("version=", 0) == 0) {
            p.version = line.substr(8);
        }
    }
    return p;
}

bool Deployer::matches(const DeployProbe& p, const HelperArtifact& artifact) {
    return p.present && p.size == artifact.bytes.size() && p.version == artifact.version;
}

Result<DeployProbe> Deployer::probe(DeviceLink& link, const std::string& remote_path) {
    std::string path = security::quoteShellArg(remote_path);
    std::string stamp = security::quoteShellArg(remote_path + ".version");
    std::string cmd = "echo size=$(stat -c %s " + path + " 2>/dev/null); "
                      "echo version=$(cat " + stamp + " 2>/dev/null)";
    auto out = link.execShell(cmd);
    if (out.is_err()) return Err<DeployProbe>(out.error());
    return Ok(parseDeployProbe(out.value()));
}

Result<void> Deployer::deploy(DeviceLink& link, const HelperArtifact& artifact) {
    const std::string& remote = artifact.remote_path;
    if (!security::isAllowedRemotePath(remote)) {
        return Err<void>(ErrorCode::DeployFailed, "remote path not allowed: " + remote);
    }
    if (!security::isSafeToken(artifact.version)) {
        return Err<void>(ErrorCode::DeployFailed, "invalid helper version");
    }

    auto current = probe(link, remote);
    if (current.is_err()) {
        return Err<void>(ErrorCode::DeployFailed, "probe failed: " + current.error().describe());
    }
    if (matches(current.value(), artifact)) {
        MHLOG_INFO(TAG, "[%s] helper %s already deployed", link.serial().c_str(), artifact.version.c_str());
        return Ok();
    }

    std::string quoted = security::quoteShellArg(remote);
    std::string stamp = security::quoteShellArg(remote + ".version");
    std::string last_error = "verification mismatch";

    for (int attempt = 1; attempt <= MAX_PUSH_ATTEMPTS; attempt++) {
        MHLOG_INFO(TAG, "[%s] pushing helper %s (%zu bytes), attempt %d/%d",
                   link.serial().c_str(), artifact.version.c_str(), artifact.bytes.size(),
                   attempt, MAX_PUSH_ATTEMPTS);

        // Stamp goes first so a half-written file never verifies
        auto rm = link.execShell("rm -f " + stamp);
        if (rm.is_err()) {
            last_error = rm.error().describe();
            continue;
        }
        push_count_++;
        auto pushed = link.pushFile(artifact.bytes, remote);
        if (pushed.is_err()) {
            last_error = pushed.error().describe();
            MHLOG_WARN(TAG, "[%s] push failed: %s", link.serial().c_str(), last_error.c_str());
            if (pushed.error().code == ErrorCode::PermissionDenied) break;
            continue;
        }
        auto chmod = link.execShell("chmod 644 " + quoted);
        if (chmod.is_err()) {
            last_error = chmod.error().describe();
            continue;
        }
        auto stamped = link.execShell("echo " + security::quoteShellArg(artifact.version) + " > " + stamp);
        if (stamped.is_err()) {
            last_error = stamped.error().describe();
            continue;
        }

        auto verify = probe(link, remote);
        if (verify.is_err()) {
            last_error = verify.error().describe();
            continue;
        }
        if (matches(verify.value(), artifact)) {
            MHLOG_INFO(TAG, "[%s] helper %s deployed", link.serial().c_str(), artifact.version.c_str());
            return Ok();
        }
        const DeployProbe& p = verify.value();
        last_error = "verification mismatch (size " + std::to_string(p.size) + "/" +
                     std::to_string(artifact.bytes.size()) + ", version '" + p.version + "')";
        MHLOG_WARN(TAG, "[%s] %s", link.serial().c_str(), last_error.c_str());
    }

    MHLOG_ERROR(TAG, "[%s] deploy failed: %s", link.serial().c_str(), last_error.c_str());
    return Err<void>(ErrorCode::DeployFailed, last_error);
}

Result<void> Deployer::remove(DeviceLink& link, const std::string& remote_path) {
    if (!security::isAllowedRemotePath(remote_path)) {
        return Err<void>(ErrorCode::PermissionDenied, "remote path not allowed", "remote_path");
    }
    auto out = link.execShell("rm -f " + security::quoteShellArg(remote_path) + " " +
                              security::quoteShellArg(remote_path + ".version"));
    if (out.is_err()) return out.error();
    MHLOG_INFO(TAG, "[%s] helper removed from %s", link.serial().c_str(), remote_path.c_str());
    return Ok();
}

} // namespace mirrorhub
