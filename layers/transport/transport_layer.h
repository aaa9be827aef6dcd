#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include <boost/asio.hpp>

#include "ReconnectPolicy.h"
#include "ServerLease.h"
#include "layers/common/logging.h"
#include "layers/protocol/protocol_layer.h"

namespace transport {

enum class SessionState {
    Disconnected,
    Connecting,
    Connected,
    Backoff,
    Closed
};

const char* toString(SessionState state) noexcept;

enum class CommandError {
    None,
    NotConnected,
    SessionClosed,
    Timeout,
    ExecutionFailed,
    ConnectionLost,
    InvalidArgument
};

const char* toString(CommandError error) noexcept;

struct CommandResult {
    bool success = false;
    std::string rawOutput;
    std::string error;
    CommandError code = CommandError::None;

    static CommandResult ok(std::string output);
    static CommandResult failure(CommandError code, std::string error);
};

struct SessionSettings {
    std::chrono::milliseconds commandTimeout{5000};
    // Consecutive timed-out or failed commands after which the link is treated as dead.
    std::uint32_t commandFailureThreshold = 3;
    std::chrono::milliseconds shutdownGrace{3000};
    ReconnectSettings reconnect;
};

using StateChangedCallback = std::function<void(const std::string& deviceId, SessionState state)>;

// One device's debug link. Owns the connection handle exclusively and runs every
// protocol call on a private worker thread fed by a FIFO queue, so commands on the
// handle never overlap. Must be owned by a std::shared_ptr (retry timers hold weak refs).
class Session : public std::enable_shared_from_this<Session> {
public:
    using Job = std::function<void()>;

    Session(std::string deviceId,
            std::string address,
            protocol::ProtocolClient& client,
            ServerLease& serverLease,
            boost::asio::io_context& ioContext,
            SessionSettings settings,
            logging::Logger logger);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void start(StateChangedCallback onStateChanged);

    const std::string& deviceId() const noexcept { return deviceId_; }
    const std::string& address() const noexcept { return address_; }

    SessionState state() const;
    std::uint32_t failureCount() const;
    std::optional<std::chrono::steady_clock::time_point> nextRetryAt() const;

    // Blocks until the attempt finishes. No-op returning true when already Connected;
    // returns false without an attempt while in Backoff (the retry timer owns that).
    bool connect();

    CommandResult executeShell(const std::string& command);
    std::future<CommandResult> executeShellAsync(const std::string& command);

    // Queues arbitrary work behind everything already queued. Work running on the
    // worker may call connect()/executeShell() directly; they run inline.
    bool post(Job job);

    // Waits up to shutdownGrace for an in-flight protocol call, then disconnects.
    void close();

private:
    bool onWorkerThread() const;
    bool enqueue(Job job);
    void workerLoop();

    bool doConnect(bool retry);
    CommandResult runShell(const std::string& command);
    void handleLinkFailure(const std::string& reason);
    void dropConnection(const std::string& reason);
    void scheduleRetry(std::chrono::milliseconds delay);
    void onRetryTimer();

    bool transitionTo(SessionState next);
    static bool isAllowed(SessionState from, SessionState to) noexcept;

    const std::string deviceId_;
    const std::string address_;
    protocol::ProtocolClient& client_;
    ServerLease& serverLease_;
    SessionSettings settings_;
    logging::Logger logger_;

    mutable std::mutex mutex_;
    std::condition_variable queueCv_;
    std::condition_variable idleCv_;
    std::deque<Job> queue_;
    bool stopping_ = false;
    bool closing_ = false;
    bool clientCallActive_ = false;
    bool leaseHeld_ = false;

    SessionState state_ = SessionState::Disconnected;
    std::optional<protocol::ConnectionHandle> handle_;
    std::uint32_t failureCount_ = 0;
    std::uint32_t consecutiveCommandFailures_ = 0;
    std::optional<std::chrono::steady_clock::time_point> nextRetryAt_;
    ReconnectPolicy policy_;
    boost::asio::steady_timer retryTimer_;

    std::mutex transitionMutex_;
    StateChangedCallback onStateChanged_;

    std::thread worker_;
    std::atomic<std::thread::id> workerId_{};
};

using SessionPtr = std::shared_ptr<Session>;

} // namespace transport
