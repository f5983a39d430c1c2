#pragma once
// =============================================================================
// adb_security.hpp
//
// Input validation for everything that ends up on an adb command line or in
// a remote shell command. Serials, remote paths and version strings are
// checked here before any command is built.
// =============================================================================

#include <string>
#include <cstring>
#include <cctype>

namespace mirrorhub {
namespace security {

// Dangerous shell metacharacters that could enable command injection
constexpr const char* SHELL_METACHARACTERS = "|;&$`\\\"'<>(){}[]!#*?~\n\r ";

inline bool containsMetacharacter(const std::string& s) {
    for (char c : s) {
        if (std::strchr(SHELL_METACHARACTERS, c) != nullptr) return true;
    }
    return false;
}

/**
 * Validate a device serial.
 * Valid formats:
 *   - Serial number: alphanumeric, may include ':', '.', '-', '_'
 *   - host:port for network devices
 */
inline bool isValidSerial(const std::string& serial) {
    if (serial.empty() || serial.length() > 64) {
        return false;
    }
    for (char c : serial) {
        if (!std::isalnum(static_cast<unsigned char>(c)) &&
            c != ':' && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

/**
 * Validate a remote file path for push/chmod/rm.
 * Only allows paths in /data/local/tmp/ and /sdcard/, no traversal.
 */
inline bool isAllowedRemotePath(const std::string& remote_path) {
    if (remote_path.empty() || remote_path.length() > 256) {
        return false;
    }
    if (remote_path.find("/data/local/tmp/") != 0 &&
        remote_path.find("/sdcard/") != 0) {
        return false;
    }
    if (remote_path.find("..") != std::string::npos) {
        return false;
    }
    return !containsMetacharacter(remote_path);
}

// Version strings and codec names: [A-Za-z0-9._-]+
inline bool isSafeToken(const std::string& token) {
    if (token.empty() || token.length() > 32) return false;
    for (char c : token) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '.' && c != '-' && c != '_') {
            return false;
        }
    }
    return true;
}

/**
 * Quote an argument for the device shell: 'abc' with embedded quotes escaped.
 */
inline std::string quoteShellArg(const std::string& arg) {
    std::string quoted = "'";
    quoted.reserve(arg.size() + 2);
    for (char c : arg) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    quoted += '\'';
    return quoted;
}

} // namespace security
} // namespace mirrorhub
