// =============================================================================
// mirrorhub - Helper Deployer
// =============================================================================
// Places the streaming helper on the device and verifies it by size and a
// version stamp (<remote_path>.version). A matching device copy is not pushed
// again; a mismatching push is retried once before failing.
// =============================================================================
#pragma once
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>
#include "device_link.hpp"
#include "result.hpp"

namespace mirrorhub {

struct HelperArtifact {
    std::string version;
    std::vector<uint8_t> bytes;
    std::string remote_path = "/data/local/tmp/scrcpy-server.jar";
};

// Reads the helper jar from local disk. Errors: DeployFailed, ValidationError (version).
Result<std::shared_ptr<const HelperArtifact>> loadArtifact(const std::string& local_path,
                                                           const std::string& version,
                                                           const std::string& remote_path);

// What the device reports for the deployed file
struct DeployProbe {
    bool present = false;
    uint64_t size = 0;
    std::string version;
};

// Parses "size=<n>\nversion=<v>" probe output
DeployProbe parseDeployProbe(const std::string& output);

class Deployer {
public:
    static constexpr int MAX_PUSH_ATTEMPTS = 2;

    // Errors: DeployFailed (message carries the underlying cause)
    Result<void> deploy(DeviceLink& link, const HelperArtifact& artifact);

    // Deletes the helper and its stamp. Errors: Disconnected, Timeout, PermissionDenied.
    Result<void> remove(DeviceLink& link, const std::string& remote_path);

    // Number of pushes performed (skipped deploys do not count)
    int pushCount() const { return push_count_.load(); }

private:
    Result<DeployProbe> probe(DeviceLink& link, const std::string& remote_path);
    static bool matches(const DeployProbe& p, const HelperArtifact& artifact);

    std::atomic<int> push_count_{0};
};

} // namespace mirrorhub
