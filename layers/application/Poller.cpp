#include "Poller.h"

#include <future>
#include <utility>

#include "layers/protocol/OutputParsers.h"

namespace application {

Poller::Poller(transport::SessionPtr session,
               DevicePublisherPtr publisher,
               boost::asio::io_context& ioContext,
               std::chrono::milliseconds interval,
               Clock clock,
               logging::Logger logger)
    : session_(std::move(session)),
      publisher_(std::move(publisher)),
      clock_(std::move(clock)),
      logger_(std::move(logger)),
      timer_(ioContext),
      interval_(interval) {}

void Poller::start(std::chrono::milliseconds firstDelay) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (running_) {
            return;
        }
        running_ = true;
    }
    scheduleNext(firstDelay);
}

void Poller::stop() {
    std::lock_guard<std::mutex> lock(mutex_);
    running_ = false;
    timer_.cancel();
}

bool Poller::tick() {
    if (cycleInFlight_.exchange(true)) {
        ++skippedTicks_;
        logger_.debug(session_->deviceId() + ": previous poll cycle still running, tick dropped");
        return false;
    }

    auto self = shared_from_this();
    const bool queued = session_->post([self]() {
        self->runCycle();
        self->cycleInFlight_ = false;
    });
    if (!queued) {
        cycleInFlight_ = false;
        return false;
    }
    return true;
}

bool Poller::pollNow() {
    if (cycleInFlight_.exchange(true)) {
        ++skippedTicks_;
        return false;
    }

    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    auto self = shared_from_this();
    const bool queued = session_->post([self, done]() {
        self->runCycle();
        self->cycleInFlight_ = false;
        done->set_value();
    });
    if (!queued) {
        cycleInFlight_ = false;
        return false;
    }

    try {
        future.get();
    } catch (const std::future_error& e) {
        cycleInFlight_ = false;
        logger_.debug(session_->deviceId() + ": poll abandoned: " + e.what());
        return false;
    }
    return true;
}

void Poller::pollSoon() {
    scheduleNext(std::chrono::milliseconds(0));
}

void Poller::setInterval(std::chrono::milliseconds interval) {
    std::lock_guard<std::mutex> lock(mutex_);
    interval_ = interval;
}

std::chrono::milliseconds Poller::interval() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return interval_;
}

bool Poller::hasPolled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hasPolled_;
}

protocol::PolledState Poller::lastKnownState() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastKnown_;
}

void Poller::scheduleNext(std::chrono::milliseconds delay) {
    std::weak_ptr<Poller> weak = weak_from_this();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        return;
    }
    timer_.expires_after(delay);
    timer_.async_wait([weak](const boost::system::error_code& ec) {
        if (ec == boost::asio::error::operation_aborted) {
            return;
        }
        if (auto self = weak.lock()) {
            self->tick();
            self->scheduleNext(self->interval());
        }
    });
}

void Poller::runCycle() {
    const auto& deviceId = session_->deviceId();

    try {
        if (!session_->connect()) {
            logger_.debug(deviceId + ": not connected (" + transport::toString(session_->state()) + "), poll skipped");
            return;
        }

        protocol::PolledState candidate;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (hasPolled_) {
                candidate = lastKnown_;
            }
        }

        for (const auto& diagnostic : protocol::diagnosticCommands()) {
            const auto result = session_->executeShell(diagnostic.command);
            if (!result.success) {
                logger_.debug(deviceId + ": poll cycle abandoned at '" + diagnostic.command + "': " + result.error);
                return;
            }

            std::string reason;
            if (!protocol::applyDiagnosticOutput(diagnostic.field, result.rawOutput, candidate, reason)) {
                logger_.debug(deviceId + ": " + protocol::fieldName(diagnostic.field) + " kept previous value: " + reason);
            }
        }

        candidate.observedAt = clock_ ? clock_() : std::chrono::system_clock::now();

        std::vector<protocol::FieldChange> changes;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            changes = protocol::diffStates(hasPolled_ ? &lastKnown_ : nullptr, candidate);
            lastKnown_ = std::move(candidate);
            hasPolled_ = true;
        }

        ++completedCycles_;
        publisher_->publishChanges(changes);
    } catch (const std::exception& e) {
        logger_.error(deviceId + ": poll cycle failed: " + e.what());
    }
}

} // namespace application
