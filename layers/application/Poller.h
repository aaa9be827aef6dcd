#pragma once

#include <boost/asio.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>

#include "StateSink.h"
#include "layers/common/logging.h"
#include "layers/protocol/PolledState.h"
#include "layers/transport/transport_layer.h"

namespace application {

using Clock = std::function<std::chrono::system_clock::time_point()>;

// Periodic poll cycles for one Session. A tick that fires while the previous
// cycle is still running is dropped, never queued.
class Poller : public std::enable_shared_from_this<Poller> {
public:
    Poller(transport::SessionPtr session,
           DevicePublisherPtr publisher,
           boost::asio::io_context& ioContext,
           std::chrono::milliseconds interval,
           Clock clock,
           logging::Logger logger);

    Poller(const Poller&) = delete;
    Poller& operator=(const Poller&) = delete;

    void start(std::chrono::milliseconds firstDelay = std::chrono::milliseconds(0));
    void stop();

    // Queues a cycle on the Session unless one is already in flight.
    bool tick();

    // Queues a cycle and waits for it. False when skipped (busy or session closed).
    bool pollNow();

    // Brings the next timer tick forward to "now".
    void pollSoon();

    void setInterval(std::chrono::milliseconds interval);
    std::chrono::milliseconds interval() const;

    bool busy() const noexcept { return cycleInFlight_.load(); }
    std::uint64_t completedCycles() const noexcept { return completedCycles_.load(); }
    std::uint64_t skippedTicks() const noexcept { return skippedTicks_.load(); }

    bool hasPolled() const;
    protocol::PolledState lastKnownState() const;

private:
    void runCycle();
    void scheduleNext(std::chrono::milliseconds delay);

    transport::SessionPtr session_;
    DevicePublisherPtr publisher_;
    Clock clock_;
    logging::Logger logger_;

    mutable std::mutex mutex_;
    boost::asio::steady_timer timer_;
    std::chrono::milliseconds interval_;
    bool running_ = false;
    bool hasPolled_ = false;
    protocol::PolledState lastKnown_;

    std::atomic<bool> cycleInFlight_{false};
    std::atomic<std::uint64_t> completedCycles_{0};
    std::atomic<std::uint64_t> skippedTicks_{0};
};

using PollerPtr = std::shared_ptr<Poller>;

} // namespace application
