// =============================================================================
// Unit tests for ADB security functions (src/adb_security.hpp)
// =============================================================================
#include <gtest/gtest.h>
#include "adb_security.hpp"

using namespace mirrorhub::security;

// ===========================================================================
// isValidSerial
// ===========================================================================

TEST(AdbSecurityTest, ValidUsbSerial) {
    EXPECT_TRUE(isValidSerial("ABCDEF123456"));
    EXPECT_TRUE(isValidSerial("R5CT123ABCD"));
    EXPECT_TRUE(isValidSerial("device-1_test"));
    EXPECT_TRUE(isValidSerial("emulator-5554"));
}

TEST(AdbSecurityTest, ValidNetworkSerial) {
    EXPECT_TRUE(isValidSerial("192.168.0.5:5555"));
    EXPECT_TRUE(isValidSerial("10.0.0.1:39867"));
}

TEST(AdbSecurityTest, InvalidSerialEmpty) {
    EXPECT_FALSE(isValidSerial(""));
}

TEST(AdbSecurityTest, InvalidSerialTooLong) {
    std::string long_id(65, 'A');
    EXPECT_FALSE(isValidSerial(long_id));
}

TEST(AdbSecurityTest, InvalidSerialShellInjection) {
    EXPECT_FALSE(isValidSerial("device; rm -rf /"));
    EXPECT_FALSE(isValidSerial("$(whoami)"));
    EXPECT_FALSE(isValidSerial("dev`id`"));
    EXPECT_FALSE(isValidSerial("dev|cat /etc/passwd"));
    EXPECT_FALSE(isValidSerial("dev&background"));
}

TEST(AdbSecurityTest, InvalidSerialSpecialChars) {
    EXPECT_FALSE(isValidSerial("dev ice"));
    EXPECT_FALSE(isValidSerial("dev\nice"));
}

// ===========================================================================
// isAllowedRemotePath
// ===========================================================================

TEST(AdbSecurityTest, AllowedRemotePaths) {
    EXPECT_TRUE(isAllowedRemotePath("/data/local/tmp/scrcpy-server.jar"));
    EXPECT_TRUE(isAllowedRemotePath("/sdcard/Download/helper.jar"));
}

TEST(AdbSecurityTest, RejectedRemotePaths) {
    EXPECT_FALSE(isAllowedRemotePath(""));
    EXPECT_FALSE(isAllowedRemotePath("/system/bin/sh"));
    EXPECT_FALSE(isAllowedRemotePath("/data/local/tmp/../../system/x"));
    EXPECT_FALSE(isAllowedRemotePath("/data/local/tmp/a;reboot"));
    EXPECT_FALSE(isAllowedRemotePath("/data/local/tmp/with space.jar"));
    EXPECT_FALSE(isAllowedRemotePath("/data/local/tmp/" + std::string(300, 'a')));
}

// ===========================================================================
// isSafeToken
// ===========================================================================

TEST(AdbSecurityTest, SafeTokens) {
    EXPECT_TRUE(isSafeToken("2.6.1"));
    EXPECT_TRUE(isSafeToken("h264"));
    EXPECT_TRUE(isSafeToken("v3_beta-1"));
}

TEST(AdbSecurityTest, UnsafeTokens) {
    EXPECT_FALSE(isSafeToken(""));
    EXPECT_FALSE(isSafeToken("2.6 1"));
    EXPECT_FALSE(isSafeToken("1;reboot"));
    EXPECT_FALSE(isSafeToken(std::string(33, '1')));
}

// ===========================================================================
// quoteShellArg / containsMetacharacter
// ===========================================================================

TEST(AdbSecurityTest, QuoteShellArgPlain) {
    EXPECT_EQ(quoteShellArg("scid=0000abcd"), "'scid=0000abcd'");
    EXPECT_EQ(quoteShellArg(""), "''");
}

TEST(AdbSecurityTest, QuoteShellArgEmbeddedQuote) {
    EXPECT_EQ(quoteShellArg("it's"), "'it'\\''s'");
}

TEST(AdbSecurityTest, Metacharacters) {
    EXPECT_TRUE(containsMetacharacter("a|b"));
    EXPECT_TRUE(containsMetacharacter("$HOME"));
    EXPECT_TRUE(containsMetacharacter("a b"));
    EXPECT_FALSE(containsMetacharacter("/data/local/tmp/x.jar"));
}
