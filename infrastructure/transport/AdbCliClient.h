#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "layers/common/logging.h"
#include "layers/protocol/protocol_layer.h"

namespace transport {

// ProtocolClient driving the `adb` executable. One child process per call; a handle
// is the serial (host:port) that `adb connect` registered.
class AdbCliClient final : public protocol::ProtocolClient {
public:
    AdbCliClient(std::string adbPath, logging::Logger logger);

    bool startServer(std::string& error) override;
    void stopServer() override;

    std::optional<protocol::ConnectionHandle> connect(const std::string& address, std::string& error) override;
    protocol::ShellOutput executeShell(protocol::ConnectionHandle handle, const std::string& command,
                                       std::chrono::milliseconds timeout) override;
    bool disconnect(protocol::ConnectionHandle handle, std::string& error) override;

    // True when adb itself reports the transport gone ("error: device offline", ...).
    static bool indicatesLostLink(const std::string& text);

private:
    struct RunResult {
        bool started = false;
        bool timedOut = false;
        bool aborted = false;
        int exitCode = -1;
        std::string output;
        std::string error;
    };

    struct Link {
        std::string serial;
        std::shared_ptr<boost::asio::io_context> activeCall;
        bool aborted = false;
    };

    RunResult run(const std::vector<std::string>& args, std::chrono::milliseconds timeout,
                  std::optional<protocol::ConnectionHandle> handle = std::nullopt);

    bool callAborted(protocol::ConnectionHandle handle);

    std::string adbPath_;
    logging::Logger logger_;

    std::mutex mutex_;
    std::unordered_map<protocol::ConnectionHandle, Link> links_;
    protocol::ConnectionHandle nextHandle_ = 1;
};

} // namespace transport
