#include "application_layer.h"

#include <utility>

namespace application {

AdapterCore::AdapterCore(protocol::ProtocolClient& client, StateSink& sink, logging::Logger logger, Clock clock)
    : client_(client),
      sink_(sink),
      logger_(std::move(logger)),
      clock_(std::move(clock)),
      workGuard_(boost::asio::make_work_guard(ioContext_)),
      ioThread_([this]() { ioContext_.run(); }),
      serverLease_(client_, logger_) {
    if (!clock_) {
        clock_ = []() { return std::chrono::system_clock::now(); };
    }
}

AdapterCore::~AdapterCore() {
    shutdown();
}

bool AdapterCore::start(const AdapterConfig& config, std::vector<std::string>& warnings, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
        error = "Adapter already shut down";
        return false;
    }
    if (started_) {
        error = "Adapter already started";
        return false;
    }

    std::string configError;
    if (!validateAdapterConfig(config, configError)) {
        logger_.error("Configuration error: " + configError);
        warnings.push_back(configError);
    }

    RegistrySettings settings;
    settings.defaultPollInterval = config.pollInterval;
    settings.firstPollDelay = config.firstPollDelay;
    settings.autoRegister = config.autoRegister;
    settings.session.commandTimeout = config.effectiveCommandTimeout();
    settings.session.commandFailureThreshold = config.commandFailureThreshold;
    settings.session.shutdownGrace = config.shutdownGrace;
    settings.session.reconnect = config.reconnect;

    registry_ = std::make_unique<DeviceRegistry>(client_, serverLease_, ioContext_, settings,
                                                 AdapterContext{sink_, logger_, clock_});

    std::vector<std::string> errors;
    registry_->applyConfiguration(config.devices, errors);
    for (const auto& e : errors) {
        logger_.warning("Configuration: " + e);
        warnings.push_back(e);
    }

    discovery_ = std::make_unique<DiscoveryBridge>(*registry_, logger_);
    started_ = true;

    logger_.info("Adapter started with " + std::to_string(registry_->size()) + " device(s), auto-register " +
                 (config.autoRegister ? "on" : "off"));
    return true;
}

bool AdapterCore::attachDiscovery(std::shared_ptr<DiscoverySource> source, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_ || stopped_) {
        error = "Adapter is not running";
        return false;
    }
    if (!source) {
        error = "Discovery source is null";
        return false;
    }
    discovery_->start(std::move(source));
    return true;
}

void AdapterCore::shutdown() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopped_) {
            return;
        }
        stopped_ = true;
    }

    if (discovery_) {
        discovery_->stop();
    }
    if (registry_) {
        registry_->closeAll();
    }

    workGuard_.reset();
    ioContext_.stop();
    if (ioThread_.joinable()) {
        ioThread_.join();
    }

    if (serverLease_.users() != 0) {
        logger_.warning("Server lease still held by " + std::to_string(serverLease_.users()) + " user(s) at shutdown");
    }
    logger_.info("Adapter stopped");
}

bool AdapterCore::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_ && !stopped_;
}

std::vector<DeviceSnapshot> AdapterCore::listDevices() const {
    if (!registry_) {
        return {};
    }
    return registry_->snapshots();
}

std::optional<DeviceSnapshot> AdapterCore::device(const std::string& deviceId) const {
    if (!registry_) {
        return std::nullopt;
    }
    return registry_->snapshot(deviceId);
}

transport::CommandResult AdapterCore::sendKey(const std::string& deviceId, const std::string& key) {
    return execute(protocol::CommandKind::KeyEvent, deviceId, key);
}

transport::CommandResult AdapterCore::launchApp(const std::string& deviceId, const std::string& packageId) {
    return execute(protocol::CommandKind::LaunchApp, deviceId, packageId);
}

transport::CommandResult AdapterCore::stopApp(const std::string& deviceId, const std::string& packageId) {
    return execute(protocol::CommandKind::StopApp, deviceId, packageId);
}

transport::CommandResult AdapterCore::sendText(const std::string& deviceId, const std::string& text) {
    return execute(protocol::CommandKind::SendText, deviceId, text);
}

transport::CommandResult AdapterCore::reboot(const std::string& deviceId) {
    return execute(protocol::CommandKind::Reboot, deviceId, {});
}

transport::CommandResult AdapterCore::shell(const std::string& deviceId, const std::string& command) {
    return execute(protocol::CommandKind::Shell, deviceId, command);
}

bool AdapterCore::setEnabled(const std::string& deviceId, bool enabled, std::string& error) {
    if (!running()) {
        error = "Adapter is not running";
        return false;
    }
    return registry_->setEnabled(deviceId, enabled, error);
}

bool AdapterCore::pollNow(const std::string& deviceId, std::string& error) {
    if (!running()) {
        error = "Adapter is not running";
        return false;
    }
    if (!registry_->snapshot(deviceId)) {
        error = "Unknown device: " + deviceId;
        return false;
    }
    if (!registry_->pollNow(deviceId)) {
        error = "Poll skipped for " + deviceId;
        return false;
    }
    return true;
}

transport::CommandResult AdapterCore::execute(protocol::CommandKind kind, const std::string& deviceId,
                                              const std::string& argument) {
    if (!running()) {
        return transport::CommandResult::failure(transport::CommandError::SessionClosed, "Adapter is not running");
    }

    protocol::Command command;
    command.deviceId = deviceId;
    command.kind = kind;
    command.argument = argument;
    command.issuedAt = clock_();
    return registry_->execute(command);
}

} // namespace application
