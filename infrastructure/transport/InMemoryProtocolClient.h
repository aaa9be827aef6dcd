#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "layers/protocol/protocol_layer.h"

namespace transport {

// Scriptable ProtocolClient kept entirely in memory. Every call is recorded so tests
// can assert on ordering and overlap. Unknown addresses are reachable by default.
class InMemoryProtocolClient final : public protocol::ProtocolClient {
public:
    bool startServer(std::string& error) override;
    void stopServer() override;

    std::optional<protocol::ConnectionHandle> connect(const std::string& address, std::string& error) override;
    protocol::ShellOutput executeShell(protocol::ConnectionHandle handle, const std::string& command,
                                       std::chrono::milliseconds timeout) override;
    bool disconnect(protocol::ConnectionHandle handle, std::string& error) override;

    // Scripting.
    void setReachable(const std::string& address, bool reachable);
    void setResponse(const std::string& address, const std::string& command, const std::string& output);
    void setDefaultResponse(const std::string& command, const std::string& output);
    void setStatus(const std::string& address, const std::string& command, protocol::ShellStatus status);
    void clearStatus(const std::string& address, const std::string& command);
    void setCommandDelay(std::chrono::milliseconds delay);
    void setServerStartFails(bool fails);
    // Every open handle to `address` reports ConnectionLost from now on.
    void dropConnections(const std::string& address);

    // Observation.
    std::vector<std::string> executed(const std::string& address) const;
    std::size_t connectAttempts(const std::string& address) const;
    std::size_t maxConcurrentPerHandle() const;
    std::size_t openConnections() const;
    std::size_t disconnects() const;
    std::size_t serverStarts() const;
    std::size_t serverStops() const;
    bool serverRunning() const;

private:
    struct Connection {
        std::string address;
        bool lost = false;
        bool aborted = false;
        std::size_t inFlight = 0;
    };

    using Key = std::pair<std::string, std::string>;

    mutable std::mutex mutex_;
    std::condition_variable abortCv_;

    std::unordered_map<std::string, bool> reachable_;
    std::map<Key, std::string> responses_;
    std::unordered_map<std::string, std::string> defaultResponses_;
    std::map<Key, protocol::ShellStatus> statuses_;
    std::chrono::milliseconds delay_{0};
    bool serverStartFails_ = false;

    std::unordered_map<protocol::ConnectionHandle, Connection> connections_;
    protocol::ConnectionHandle nextHandle_ = 1;

    std::unordered_map<std::string, std::vector<std::string>> executed_;
    std::unordered_map<std::string, std::size_t> connectAttempts_;
    std::size_t maxConcurrent_ = 0;
    std::size_t disconnects_ = 0;
    std::size_t serverStarts_ = 0;
    std::size_t serverStops_ = 0;
    bool serverRunning_ = false;
};

} // namespace transport
