#include "transport_layer.h"

#include <utility>

namespace transport {

namespace {

std::future<CommandResult> readyResult(CommandResult result) {
    std::promise<CommandResult> promise;
    promise.set_value(std::move(result));
    return promise.get_future();
}

} // namespace

const char* toString(SessionState state) noexcept {
    switch (state) {
    case SessionState::Disconnected:
        return "disconnected";
    case SessionState::Connecting:
        return "connecting";
    case SessionState::Connected:
        return "connected";
    case SessionState::Backoff:
        return "backoff";
    case SessionState::Closed:
        return "closed";
    }
    return "unknown";
}

const char* toString(CommandError error) noexcept {
    switch (error) {
    case CommandError::None:
        return "none";
    case CommandError::NotConnected:
        return "not_connected";
    case CommandError::SessionClosed:
        return "session_closed";
    case CommandError::Timeout:
        return "timeout";
    case CommandError::ExecutionFailed:
        return "execution_failed";
    case CommandError::ConnectionLost:
        return "connection_lost";
    case CommandError::InvalidArgument:
        return "invalid_argument";
    }
    return "unknown";
}

CommandResult CommandResult::ok(std::string output) {
    CommandResult result;
    result.success = true;
    result.rawOutput = std::move(output);
    return result;
}

CommandResult CommandResult::failure(CommandError code, std::string error) {
    CommandResult result;
    result.code = code;
    result.error = std::move(error);
    return result;
}

Session::Session(std::string deviceId,
                 std::string address,
                 protocol::ProtocolClient& client,
                 ServerLease& serverLease,
                 boost::asio::io_context& ioContext,
                 SessionSettings settings,
                 logging::Logger logger)
    : deviceId_(std::move(deviceId)),
      address_(std::move(address)),
      client_(client),
      serverLease_(serverLease),
      settings_(settings),
      logger_(std::move(logger)),
      policy_(settings.reconnect),
      retryTimer_(ioContext) {}

Session::~Session() {
    close();
    if (worker_.joinable()) {
        if (onWorkerThread()) {
            worker_.detach();
        } else {
            worker_.join();
        }
    }
}

void Session::start(StateChangedCallback onStateChanged) {
    {
        std::lock_guard<std::mutex> lock(transitionMutex_);
        onStateChanged_ = std::move(onStateChanged);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (worker_.joinable() || closing_) {
        return;
    }
    worker_ = std::thread([this]() { workerLoop(); });
}

SessionState Session::state() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return state_;
}

std::uint32_t Session::failureCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failureCount_;
}

std::optional<std::chrono::steady_clock::time_point> Session::nextRetryAt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return nextRetryAt_;
}

bool Session::connect() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_ || state_ == SessionState::Backoff) {
            return false;
        }
        if (state_ == SessionState::Connected) {
            return true;
        }
    }

    if (onWorkerThread()) {
        return doConnect(false);
    }

    auto task = std::make_shared<std::packaged_task<bool()>>([this]() { return doConnect(false); });
    auto future = task->get_future();
    if (!enqueue([task]() { (*task)(); })) {
        return false;
    }

    try {
        return future.get();
    } catch (const std::future_error& e) {
        logger_.debug(deviceId_ + ": connect abandoned: " + e.what());
        return false;
    }
}

CommandResult Session::executeShell(const std::string& command) {
    if (onWorkerThread()) {
        return runShell(command);
    }

    auto future = executeShellAsync(command);
    try {
        return future.get();
    } catch (const std::future_error& e) {
        return CommandResult::failure(CommandError::SessionClosed, std::string("Command abandoned: ") + e.what());
    }
}

std::future<CommandResult> Session::executeShellAsync(const std::string& command) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return readyResult(CommandResult::failure(CommandError::SessionClosed, "Session is closed"));
        }
        if (state_ != SessionState::Connected) {
            return readyResult(CommandResult::failure(CommandError::NotConnected,
                                                      std::string("Session is ") + toString(state_)));
        }
    }

    auto task = std::make_shared<std::packaged_task<CommandResult()>>([this, command]() { return runShell(command); });
    auto future = task->get_future();
    if (!enqueue([task]() { (*task)(); })) {
        return readyResult(CommandResult::failure(CommandError::SessionClosed, "Session is closed"));
    }
    return future;
}

bool Session::post(Job job) {
    return enqueue(std::move(job));
}

void Session::close() {
    std::optional<protocol::ConnectionHandle> handle;
    bool releaseLease = false;
    bool joinWorker = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        if (closing_) {
            return;
        }
        closing_ = true;
        retryTimer_.cancel();
        nextRetryAt_.reset();

        if (!onWorkerThread() && clientCallActive_) {
            if (!idleCv_.wait_for(lock, settings_.shutdownGrace, [this]() { return !clientCallActive_; })) {
                logger_.warning(deviceId_ + ": in-flight command did not finish within grace period, forcing disconnect");
            }
        }

        handle = handle_;
        handle_.reset();
        releaseLease = leaseHeld_;
        leaseHeld_ = false;
        stopping_ = true;
        joinWorker = worker_.joinable() && !onWorkerThread();
        if (!worker_.joinable()) {
            queue_.clear();
        }
    }
    queueCv_.notify_all();

    if (handle) {
        std::string error;
        if (!client_.disconnect(*handle, error)) {
            logger_.warning(deviceId_ + ": disconnect failed: " + error);
        }
    }

    transitionTo(SessionState::Closed);

    if (joinWorker) {
        worker_.join();
    }
    if (releaseLease) {
        serverLease_.release();
    }
}

bool Session::onWorkerThread() const {
    return workerId_.load() == std::this_thread::get_id();
}

bool Session::enqueue(Job job) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return false;
        }
        queue_.push_back(std::move(job));
    }
    queueCv_.notify_one();
    return true;
}

void Session::workerLoop() {
    workerId_.store(std::this_thread::get_id());

    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            queueCv_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }
            job = std::move(queue_.front());
            queue_.pop_front();
        }

        try {
            job();
        } catch (const std::exception& e) {
            logger_.error(deviceId_ + ": queued job failed: " + e.what());
        }
    }
}

bool Session::doConnect(bool retry) {
    bool needLease = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return false;
        }
        if (state_ == SessionState::Connected) {
            return true;
        }
        if (state_ == SessionState::Backoff && !retry) {
            return false;
        }
        needLease = !leaseHeld_;
    }

    transitionTo(SessionState::Connecting);

    if (needLease) {
        std::string error;
        if (!serverLease_.acquire(error)) {
            handleLinkFailure("protocol server unavailable: " + error);
            return false;
        }

        bool lateClose = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            lateClose = closing_;
            if (!lateClose) {
                leaseHeld_ = true;
            }
        }
        if (lateClose) {
            serverLease_.release();
            return false;
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return false;
        }
        clientCallActive_ = true;
    }

    std::string error;
    const auto handle = client_.connect(address_, error);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        clientCallActive_ = false;
    }
    idleCv_.notify_all();

    if (!handle) {
        handleLinkFailure("connect to " + address_ + " failed: " + error);
        return false;
    }

    bool discard = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            discard = true;
        } else {
            handle_ = *handle;
            failureCount_ = 0;
            consecutiveCommandFailures_ = 0;
            nextRetryAt_.reset();
        }
    }

    if (discard) {
        std::string disconnectError;
        if (!client_.disconnect(*handle, disconnectError)) {
            logger_.warning(deviceId_ + ": disconnect failed: " + disconnectError);
        }
        return false;
    }

    transitionTo(SessionState::Connected);
    logger_.info(deviceId_ + ": connected to " + address_);
    return true;
}

CommandResult Session::runShell(const std::string& command) {
    protocol::ConnectionHandle handle = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return CommandResult::failure(CommandError::SessionClosed, "Session is closed");
        }
        if (state_ != SessionState::Connected || !handle_) {
            return CommandResult::failure(CommandError::NotConnected, std::string("Session is ") + toString(state_));
        }
        handle = *handle_;
        clientCallActive_ = true;
    }

    auto output = client_.executeShell(handle, command, settings_.commandTimeout);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        clientCallActive_ = false;
    }
    idleCv_.notify_all();

    switch (output.status) {
    case protocol::ShellStatus::Ok: {
        std::lock_guard<std::mutex> lock(mutex_);
        failureCount_ = 0;
        consecutiveCommandFailures_ = 0;
        return CommandResult::ok(std::move(output.text));
    }

    case protocol::ShellStatus::ConnectionLost:
        dropConnection("connection lost during '" + command + "': " + output.error);
        return CommandResult::failure(CommandError::ConnectionLost, "Connection lost: " + output.error);

    case protocol::ShellStatus::Timeout:
    case protocol::ShellStatus::Failed:
        break;
    }

    const bool timedOut = output.status == protocol::ShellStatus::Timeout;
    bool dead = false;
    std::uint32_t failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        failures = ++consecutiveCommandFailures_;
        dead = failures >= settings_.commandFailureThreshold;
    }

    const std::string reason = timedOut ? "command timed out after " + std::to_string(settings_.commandTimeout.count()) + " ms"
                                        : "command failed: " + output.error;
    logger_.debug(deviceId_ + ": '" + command + "' " + reason + " (" + std::to_string(failures) + " in a row)");
    if (dead) {
        dropConnection(std::to_string(failures) + " consecutive command failures");
    }

    return CommandResult::failure(timedOut ? CommandError::Timeout : CommandError::ExecutionFailed, reason);
}

void Session::handleLinkFailure(const std::string& reason) {
    std::chrono::milliseconds delay{0};
    std::uint32_t failures = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return;
        }
        failures = ++failureCount_;
        delay = policy_.nextDelay(failures);
        nextRetryAt_ = std::chrono::steady_clock::now() + delay;
    }

    const auto message = deviceId_ + ": " + reason + "; retry #" + std::to_string(failures) + " in " +
                         std::to_string(delay.count()) + " ms";
    if (failures == 1) {
        logger_.warning(message);
    } else {
        logger_.debug(message);
    }

    transitionTo(SessionState::Backoff);
    scheduleRetry(delay);
}

void Session::dropConnection(const std::string& reason) {
    std::optional<protocol::ConnectionHandle> handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closing_) {
            return;
        }
        handle = handle_;
        handle_.reset();
        consecutiveCommandFailures_ = 0;
    }

    if (handle) {
        std::string error;
        if (!client_.disconnect(*handle, error)) {
            logger_.debug(deviceId_ + ": disconnect after failure reported: " + error);
        }
    }

    handleLinkFailure(reason);
}

void Session::scheduleRetry(std::chrono::milliseconds delay) {
    std::weak_ptr<Session> weak = weak_from_this();

    std::lock_guard<std::mutex> lock(mutex_);
    if (closing_) {
        return;
    }
    retryTimer_.expires_after(delay);
    retryTimer_.async_wait([weak](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (auto self = weak.lock()) {
            self->onRetryTimer();
        }
    });
}

void Session::onRetryTimer() {
    enqueue([this]() { doConnect(true); });
}

bool Session::transitionTo(SessionState next) {
    std::lock_guard<std::mutex> transitionLock(transitionMutex_);

    SessionState previous;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        previous = state_;
        if (previous == next) {
            return true;
        }
        if (previous == SessionState::Closed || (closing_ && next != SessionState::Closed)) {
            return false;
        }
        if (!isAllowed(previous, next)) {
            logger_.warning(deviceId_ + ": rejected transition " + toString(previous) + " -> " + toString(next));
            return false;
        }
        state_ = next;
    }

    logger_.debug(deviceId_ + ": " + toString(previous) + " -> " + toString(next));
    if (onStateChanged_) {
        onStateChanged_(deviceId_, next);
    }
    return true;
}

bool Session::isAllowed(SessionState from, SessionState to) noexcept {
    if (to == SessionState::Closed) {
        return from != SessionState::Closed;
    }

    switch (from) {
    case SessionState::Disconnected:
        return to == SessionState::Connecting;
    case SessionState::Connecting:
        return to == SessionState::Connected || to == SessionState::Backoff;
    case SessionState::Connected:
        return to == SessionState::Backoff;
    case SessionState::Backoff:
        return to == SessionState::Connecting;
    case SessionState::Closed:
        return false;
    }
    return false;
}

} // namespace transport
