#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <future>
#include <string>
#include <thread>

#include "infrastructure/transport/AdbCliClient.h"

using namespace transport;
using protocol::ShellStatus;
using std::chrono::milliseconds;

namespace {

// Stands in for the adb binary: answers connect/disconnect and a few canned shell commands.
constexpr const char* kFakeAdb = R"(#!/bin/sh
case "$1" in
  start-server|kill-server)
    exit 0 ;;
  connect)
    case "$2" in
      10.0.0.9:5555) echo "failed to connect to '10.0.0.9:5555': Connection refused" ;;
      *) echo "connected to $2" ;;
    esac
    exit 0 ;;
  disconnect)
    echo "disconnected $2"
    exit 0 ;;
  -s)
    case "$4" in
      "echo hi") echo hi; exit 0 ;;
      "sleep") exec sleep 5 ;;
      "missing") echo "/system/bin/sh: missing: not found" >&2; exit 127 ;;
      "offline") echo "error: device offline" >&2; exit 1 ;;
      *) echo "unexpected: $4" >&2; exit 3 ;;
    esac ;;
esac
exit 1
)";

constexpr const char* kAddress = "10.0.0.5:5555";

class AdbCliClientTests : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        scriptPath_ = ::testing::TempDir() + "tvlink_fake_adb_" + info->name() + ".sh";
        {
            std::ofstream script(scriptPath_, std::ios::trunc);
            script << kFakeAdb;
        }
        namespace fs = std::filesystem;
        fs::permissions(scriptPath_, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                        fs::perm_options::replace);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove(scriptPath_, ec);
    }

    std::string scriptPath_;
};

} // namespace

//==============================================================================
// Exit handling
//==============================================================================

TEST_F(AdbCliClientTests, QuickCommandsCompleteWithTheirOutput) {
    AdbCliClient client(scriptPath_, logging::Logger{});

    std::string error;
    ASSERT_TRUE(client.startServer(error)) << error;

    for (int i = 0; i < 10; ++i) {
        const auto handle = client.connect(kAddress, error);
        ASSERT_TRUE(handle.has_value()) << "attempt " << i << ": " << error;

        const auto output = client.executeShell(*handle, "echo hi", milliseconds(5000));
        EXPECT_EQ(output.status, ShellStatus::Ok) << "attempt " << i << ": " << output.error;
        EXPECT_EQ(output.text, "hi\n");

        ASSERT_TRUE(client.disconnect(*handle, error)) << error;
    }
}

TEST_F(AdbCliClientTests, RepeatedShellCommandsOnOneHandleStayOk) {
    AdbCliClient client(scriptPath_, logging::Logger{});
    std::string error;
    const auto handle = client.connect(kAddress, error);
    ASSERT_TRUE(handle.has_value()) << error;

    for (int i = 0; i < 20; ++i) {
        const auto output = client.executeShell(*handle, "echo hi", milliseconds(5000));
        ASSERT_EQ(output.status, ShellStatus::Ok) << "run " << i << ": " << output.error;
    }
}

TEST_F(AdbCliClientTests, RefusedConnectIsReportedFromOutput) {
    AdbCliClient client(scriptPath_, logging::Logger{});
    std::string error;
    EXPECT_FALSE(client.connect("10.0.0.9:5555", error).has_value());
    EXPECT_NE(error.find("Connection refused"), std::string::npos) << error;
}

TEST_F(AdbCliClientTests, MissingExecutableFailsToStartServer) {
    AdbCliClient client(::testing::TempDir() + "tvlink_no_such_adb", logging::Logger{});
    std::string error;
    EXPECT_FALSE(client.startServer(error));
    EXPECT_FALSE(error.empty());
}

//==============================================================================
// Timeout and abort
//==============================================================================

TEST_F(AdbCliClientTests, SlowCommandTimesOutNearTheDeadline) {
    AdbCliClient client(scriptPath_, logging::Logger{});
    std::string error;
    const auto handle = client.connect(kAddress, error);
    ASSERT_TRUE(handle.has_value()) << error;

    const auto started = std::chrono::steady_clock::now();
    const auto output = client.executeShell(*handle, "sleep", milliseconds(300));
    const auto elapsed = std::chrono::steady_clock::now() - started;

    EXPECT_EQ(output.status, ShellStatus::Timeout);
    EXPECT_GE(elapsed, milliseconds(300));
    EXPECT_LT(elapsed, milliseconds(3000));
}

TEST_F(AdbCliClientTests, DisconnectAbortsCommandInFlight) {
    AdbCliClient client(scriptPath_, logging::Logger{});
    std::string error;
    const auto handle = client.connect(kAddress, error);
    ASSERT_TRUE(handle.has_value()) << error;

    auto pending = std::async(std::launch::async, [&client, &handle]() {
        return client.executeShell(*handle, "sleep", milliseconds(10000));
    });
    std::this_thread::sleep_for(milliseconds(300));

    const auto started = std::chrono::steady_clock::now();
    EXPECT_TRUE(client.disconnect(*handle, error)) << error;
    ASSERT_EQ(pending.wait_for(std::chrono::seconds(3)), std::future_status::ready);
    EXPECT_LT(std::chrono::steady_clock::now() - started, milliseconds(3000));
    EXPECT_EQ(pending.get().status, ShellStatus::ConnectionLost);

    const auto after = client.executeShell(*handle, "echo hi", milliseconds(1000));
    EXPECT_EQ(after.status, ShellStatus::ConnectionLost);
}

//==============================================================================
// Failure classification
//==============================================================================

TEST_F(AdbCliClientTests, DeviceShellErrorIsCommandFailure) {
    AdbCliClient client(scriptPath_, logging::Logger{});
    std::string error;
    const auto handle = client.connect(kAddress, error);
    ASSERT_TRUE(handle.has_value()) << error;

    const auto output = client.executeShell(*handle, "missing", milliseconds(5000));
    EXPECT_EQ(output.status, ShellStatus::Failed);
    EXPECT_NE(output.error.find("127"), std::string::npos) << output.error;
}

TEST_F(AdbCliClientTests, AdbTransportErrorIsLostLink) {
    AdbCliClient client(scriptPath_, logging::Logger{});
    std::string error;
    const auto handle = client.connect(kAddress, error);
    ASSERT_TRUE(handle.has_value()) << error;

    const auto output = client.executeShell(*handle, "offline", milliseconds(5000));
    EXPECT_EQ(output.status, ShellStatus::ConnectionLost);
}

TEST(AdbCliClientClassificationTests, OnlyAdbDiagnosticsMeanLostLink) {
    EXPECT_TRUE(AdbCliClient::indicatesLostLink("error: device offline\n"));
    EXPECT_TRUE(AdbCliClient::indicatesLostLink("error: device '10.0.0.5:5555' not found\n"));
    EXPECT_TRUE(AdbCliClient::indicatesLostLink("error: no devices/emulators found\n"));
    EXPECT_TRUE(AdbCliClient::indicatesLostLink("adb: error: closed\n"));

    EXPECT_FALSE(AdbCliClient::indicatesLostLink("/system/bin/sh: foo: not found\n"));
    EXPECT_FALSE(AdbCliClient::indicatesLostLink("cat: /proc/x: file closed\n"));
    EXPECT_FALSE(AdbCliClient::indicatesLostLink(""));
}
