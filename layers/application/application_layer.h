#pragma once

#include <boost/asio.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "AdapterConfig.h"
#include "DeviceRegistry.h"
#include "DiscoveryBridge.h"
#include "StateSink.h"
#include "layers/common/logging.h"
#include "layers/protocol/protocol_layer.h"
#include "layers/transport/ServerLease.h"
#include "layers/transport/transport_layer.h"

namespace application {

// Facade over the whole adapter: owns the timer thread, the shared server lease,
// the registry and the discovery bridge, and tears them down in that reverse order.
class AdapterCore {
public:
    AdapterCore(protocol::ProtocolClient& client, StateSink& sink, logging::Logger logger, Clock clock = {});
    ~AdapterCore();

    AdapterCore(const AdapterCore&) = delete;
    AdapterCore& operator=(const AdapterCore&) = delete;

    // Builds the registry from `config`. Per-device problems land in `warnings` and
    // do not fail the start; the adapter then runs with whatever was accepted.
    bool start(const AdapterConfig& config, std::vector<std::string>& warnings, std::string& error);
    bool attachDiscovery(std::shared_ptr<DiscoverySource> source, std::string& error);

    // Idempotent.
    void shutdown();
    bool running() const;

    std::vector<DeviceSnapshot> listDevices() const;
    std::optional<DeviceSnapshot> device(const std::string& deviceId) const;

    transport::CommandResult sendKey(const std::string& deviceId, const std::string& key);
    transport::CommandResult launchApp(const std::string& deviceId, const std::string& packageId);
    transport::CommandResult stopApp(const std::string& deviceId, const std::string& packageId);
    transport::CommandResult sendText(const std::string& deviceId, const std::string& text);
    transport::CommandResult reboot(const std::string& deviceId);
    transport::CommandResult shell(const std::string& deviceId, const std::string& command);

    bool setEnabled(const std::string& deviceId, bool enabled, std::string& error);
    bool pollNow(const std::string& deviceId, std::string& error);

    DeviceRegistry* registry() noexcept { return registry_.get(); }
    DiscoveryBridge* discovery() noexcept { return discovery_.get(); }
    const transport::ServerLease& serverLease() const noexcept { return serverLease_; }

private:
    transport::CommandResult execute(protocol::CommandKind kind, const std::string& deviceId, const std::string& argument);

    protocol::ProtocolClient& client_;
    StateSink& sink_;
    logging::Logger logger_;
    Clock clock_;

    boost::asio::io_context ioContext_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard_;
    std::thread ioThread_;

    transport::ServerLease serverLease_;
    std::unique_ptr<DeviceRegistry> registry_;
    std::unique_ptr<DiscoveryBridge> discovery_;

    mutable std::mutex mutex_;
    bool started_ = false;
    bool stopped_ = false;
};

} // namespace application
