#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_set>

#include "DeviceRegistry.h"
#include "layers/common/logging.h"

namespace application {

struct DiscoveryEvent {
    std::string address;
    std::string name;
};

// Lazy, possibly endless stream of observations. next() blocks until an event is
// available; std::nullopt ends the stream. It may throw for a single bad observation.
class DiscoverySource {
public:
    virtual ~DiscoverySource() = default;
    virtual std::optional<DiscoveryEvent> next() = 0;
    // Unblocks a pending next(), which then returns std::nullopt.
    virtual void stop() = 0;
};

// Drains a DiscoverySource on its own thread and feeds new addresses to the registry.
class DiscoveryBridge {
public:
    DiscoveryBridge(DeviceRegistry& registry, logging::Logger logger);
    ~DiscoveryBridge();

    DiscoveryBridge(const DiscoveryBridge&) = delete;
    DiscoveryBridge& operator=(const DiscoveryBridge&) = delete;

    void start(std::shared_ptr<DiscoverySource> source);
    void stop();

    // Returns true when the observation reached the registry.
    bool handle(const DiscoveryEvent& event);

    std::uint64_t accepted() const noexcept { return accepted_.load(); }
    std::uint64_t duplicates() const noexcept { return duplicates_.load(); }
    std::uint64_t rejected() const noexcept { return rejected_.load(); }

    static std::string cleanName(const std::string& raw);

private:
    void run();

    DeviceRegistry& registry_;
    logging::Logger logger_;

    std::mutex mutex_;
    std::unordered_set<std::string> seen_;
    std::shared_ptr<DiscoverySource> source_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    std::atomic<std::uint64_t> accepted_{0};
    std::atomic<std::uint64_t> duplicates_{0};
    std::atomic<std::uint64_t> rejected_{0};
};

} // namespace application
