#include "DeviceRegistry.h"

#include <future>
#include <unordered_set>
#include <utility>

namespace application {

const char* toString(UpsertOutcome outcome) noexcept {
    switch (outcome) {
    case UpsertOutcome::Created:
        return "created";
    case UpsertOutcome::Updated:
        return "updated";
    case UpsertOutcome::Unchanged:
        return "unchanged";
    case UpsertOutcome::Ignored:
        return "ignored";
    case UpsertOutcome::Rejected:
        return "rejected";
    }
    return "unknown";
}

DeviceRegistry::DeviceRegistry(protocol::ProtocolClient& client,
                               transport::ServerLease& serverLease,
                               boost::asio::io_context& ioContext,
                               RegistrySettings settings,
                               AdapterContext context)
    : client_(client),
      serverLease_(serverLease),
      ioContext_(ioContext),
      settings_(settings),
      context_(std::move(context)) {}

DeviceRegistry::~DeviceRegistry() {
    closeAll();
}

UpsertOutcome DeviceRegistry::upsert(const DeviceDescriptor& descriptor, DeviceSource source, std::string& error) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    return upsertLocked(descriptor, source, error);
}

void DeviceRegistry::applyConfiguration(const std::vector<DeviceDescriptor>& devices, std::vector<std::string>& errors) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);

    std::unordered_set<std::string> configuredIds;
    for (const auto& descriptor : devices) {
        std::string normalized;
        std::string error;
        if (!normalizeAddress(descriptor.address, normalized, error)) {
            errors.push_back(error);
            continue;
        }

        const auto id = deviceIdFromAddress(normalized);
        if (!configuredIds.insert(id).second) {
            errors.push_back("Duplicate device address ignored: " + normalized);
            continue;
        }

        if (upsertLocked(descriptor, DeviceSource::Configuration, error) == UpsertOutcome::Rejected) {
            configuredIds.erase(id);
            errors.push_back(error);
        }
    }

    std::vector<std::string> dropped;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : entries_) {
            if (entry.device.source != DeviceSource::Configuration || configuredIds.count(id) != 0) {
                continue;
            }
            if (entry.device.discovered && settings_.autoRegister) {
                entry.device.source = DeviceSource::Discovery;
                continue;
            }
            dropped.push_back(id);
        }
    }

    for (const auto& id : dropped) {
        removeLocked(id);
    }
}

bool DeviceRegistry::remove(const std::string& deviceId) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    return removeLocked(deviceId);
}

bool DeviceRegistry::setEnabled(const std::string& deviceId, bool enabled, std::string& error) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    if (closed_) {
        error = "Registry is shut down";
        return false;
    }

    auto it = entries_.find(deviceId);
    if (it == entries_.end()) {
        error = "Unknown device: " + deviceId;
        return false;
    }

    auto& entry = it->second;
    if (entry.device.enabled == enabled) {
        return true;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.device.enabled = enabled;
    }
    if (enabled) {
        activateLocked(entry);
    } else {
        deactivateLocked(entry);
    }
    context_.logger.info(deviceId + (enabled ? ": enabled" : ": disabled"));
    return true;
}

void DeviceRegistry::setAutoRegister(bool enabled) {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    std::lock_guard<std::mutex> lock(mutex_);
    settings_.autoRegister = enabled;
}

bool DeviceRegistry::autoRegister() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return settings_.autoRegister;
}

std::optional<DeviceSnapshot> DeviceRegistry::snapshot(const std::string& deviceId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(deviceId);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return makeSnapshot(it->second);
}

std::vector<DeviceSnapshot> DeviceRegistry::snapshots() const {
    std::vector<DeviceSnapshot> result;
    std::lock_guard<std::mutex> lock(mutex_);
    result.reserve(entries_.size());
    for (const auto& [_, entry] : entries_) {
        result.push_back(makeSnapshot(entry));
    }
    return result;
}

std::optional<std::string> DeviceRegistry::findIdByAddress(const std::string& address) const {
    std::string normalized;
    std::string error;
    if (!normalizeAddress(address, normalized, error)) {
        return std::nullopt;
    }

    const auto id = deviceIdFromAddress(normalized);
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(id);
    if (it == entries_.end() || it->second.device.address != normalized) {
        return std::nullopt;
    }
    return id;
}

std::size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

std::size_t DeviceRegistry::activeSessions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t count = 0;
    for (const auto& [_, entry] : entries_) {
        if (entry.session) {
            ++count;
        }
    }
    return count;
}

transport::CommandResult DeviceRegistry::execute(const protocol::Command& command) {
    std::string shellLine;
    std::string error;
    if (!protocol::buildShellCommand(command, shellLine, error)) {
        return transport::CommandResult::failure(transport::CommandError::InvalidArgument, error);
    }

    transport::SessionPtr session;
    PollerPtr poller;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(command.deviceId);
        if (it == entries_.end()) {
            return transport::CommandResult::failure(transport::CommandError::InvalidArgument,
                                                     "Unknown device: " + command.deviceId);
        }
        session = it->second.session;
        poller = it->second.poller;
    }

    if (!session) {
        return transport::CommandResult::failure(transport::CommandError::NotConnected, "Device is disabled");
    }
    if (!session->connect()) {
        return transport::CommandResult::failure(
            transport::CommandError::NotConnected,
            std::string("Device is not connected (") + transport::toString(session->state()) + ")");
    }

    auto result = session->executeShell(shellLine);
    if (result.success) {
        std::string failure;
        if (protocol::controlOutputIndicatesFailure(command.kind, result.rawOutput, failure)) {
            result.success = false;
            result.code = transport::CommandError::ExecutionFailed;
            result.error = failure;
        }
    }

    if (result.success) {
        context_.logger.info(command.deviceId + ": " + protocol::toString(command.kind) + " '" + command.argument + "' done");
        if (poller && command.kind != protocol::CommandKind::Shell) {
            poller->pollSoon();
        }
    } else {
        context_.logger.warning(command.deviceId + ": " + protocol::toString(command.kind) + " '" + command.argument +
                                "' failed: " + result.error);
    }
    return result;
}

bool DeviceRegistry::pollNow(const std::string& deviceId) {
    PollerPtr poller;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(deviceId);
        if (it == entries_.end()) {
            return false;
        }
        poller = it->second.poller;
    }
    return poller && poller->pollNow();
}

void DeviceRegistry::closeAll() {
    std::lock_guard<std::mutex> writeLock(writeMutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    std::vector<Entry> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.reserve(entries_.size());
        for (auto& [_, entry] : entries_) {
            entries.push_back(std::move(entry));
        }
        entries_.clear();
    }

    for (auto& entry : entries) {
        if (entry.poller) {
            entry.poller->stop();
        }
        entry.publisher->mute();
    }

    std::vector<std::future<void>> closing;
    for (auto& entry : entries) {
        if (entry.session) {
            auto session = entry.session;
            closing.push_back(std::async(std::launch::async, [session]() { session->close(); }));
        }
    }
    for (auto& f : closing) {
        f.wait();
    }

    if (!entries.empty()) {
        context_.logger.info("Closed " + std::to_string(closing.size()) + " session(s)");
    }
}

UpsertOutcome DeviceRegistry::upsertLocked(const DeviceDescriptor& descriptor, DeviceSource source, std::string& error) {
    if (closed_) {
        error = "Registry is shut down";
        return UpsertOutcome::Rejected;
    }

    std::string address;
    if (!normalizeAddress(descriptor.address, address, error)) {
        return UpsertOutcome::Rejected;
    }
    const auto id = deviceIdFromAddress(address);

    auto it = entries_.find(id);
    if (it != entries_.end()) {
        auto& entry = it->second;
        if (entry.device.address != address) {
            error = "Device id " + id + " already used by " + entry.device.address;
            return UpsertOutcome::Rejected;
        }

        if (source == DeviceSource::Discovery) {
            std::lock_guard<std::mutex> lock(mutex_);
            entry.device.discovered = true;
            // Configuration owns name and enabled flag once it knows the device.
            if (entry.device.source == DeviceSource::Configuration || descriptor.displayName.empty() ||
                descriptor.displayName == entry.device.displayName) {
                return UpsertOutcome::Unchanged;
            }
            entry.device.displayName = descriptor.displayName;
            return UpsertOutcome::Updated;
        }

        bool changed = entry.device.source != DeviceSource::Configuration;
        bool enabledChanged = false;
        bool intervalChanged = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            entry.device.source = DeviceSource::Configuration;
            if (!descriptor.displayName.empty() && descriptor.displayName != entry.device.displayName) {
                entry.device.displayName = descriptor.displayName;
                changed = true;
            }
            if (descriptor.pollInterval != entry.device.pollInterval) {
                entry.device.pollInterval = descriptor.pollInterval;
                intervalChanged = true;
            }
            if (descriptor.enabled != entry.device.enabled) {
                entry.device.enabled = descriptor.enabled;
                enabledChanged = true;
            }
        }

        if (intervalChanged && entry.poller) {
            entry.poller->setInterval(effectiveInterval(entry.device));
        }
        if (enabledChanged) {
            if (descriptor.enabled) {
                activateLocked(entry);
            } else {
                deactivateLocked(entry);
            }
        }
        return changed || enabledChanged || intervalChanged ? UpsertOutcome::Updated : UpsertOutcome::Unchanged;
    }

    if (source == DeviceSource::Discovery && !autoRegister()) {
        context_.logger.debug("Discovered " + address + " is not configured and auto-register is off, ignored");
        return UpsertOutcome::Ignored;
    }

    Entry entry;
    entry.device.id = id;
    entry.device.address = address;
    entry.device.displayName = descriptor.displayName.empty() ? address : descriptor.displayName;
    entry.device.enabled = descriptor.enabled;
    entry.device.pollInterval = descriptor.pollInterval;
    entry.device.source = source;
    entry.device.discovered = source == DeviceSource::Discovery;
    entry.publisher = std::make_shared<DevicePublisher>(id, context_.sink);

    Entry* stored = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        stored = &entries_.emplace(id, std::move(entry)).first->second;
    }

    if (stored->device.enabled) {
        activateLocked(*stored);
    } else {
        stored->publisher->mute();
    }

    context_.logger.info("Added device " + id + " (" + address + ", " + toString(source) + ")");
    return UpsertOutcome::Created;
}

bool DeviceRegistry::removeLocked(const std::string& deviceId) {
    Entry entry;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(deviceId);
        if (it == entries_.end()) {
            return false;
        }
        entry = std::move(it->second);
        entries_.erase(it);
    }

    if (entry.poller) {
        entry.poller->stop();
    }
    entry.publisher->retire();
    if (entry.session) {
        entry.session->close();
    }

    context_.logger.info("Removed device " + deviceId);
    return true;
}

void DeviceRegistry::activateLocked(Entry& entry) {
    if (entry.session) {
        return;
    }

    auto session = std::make_shared<transport::Session>(entry.device.id,
                                                        entry.device.address,
                                                        client_,
                                                        serverLease_,
                                                        ioContext_,
                                                        settings_.session,
                                                        context_.logger);
    auto poller = std::make_shared<Poller>(session,
                                           entry.publisher,
                                           ioContext_,
                                           effectiveInterval(entry.device),
                                           context_.clock,
                                           context_.logger);

    entry.publisher->unmute();

    auto publisher = entry.publisher;
    session->start([publisher](const std::string&, transport::SessionState state) {
        if (state == transport::SessionState::Connected) {
            publisher->publishConnected(true);
        } else if (state == transport::SessionState::Backoff || state == transport::SessionState::Closed) {
            publisher->publishConnected(false);
        }
    });

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entry.session = session;
        entry.poller = poller;
    }
    poller->start(settings_.firstPollDelay);
}

void DeviceRegistry::deactivateLocked(Entry& entry) {
    transport::SessionPtr session;
    PollerPtr poller;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = std::move(entry.session);
        poller = std::move(entry.poller);
        entry.session.reset();
        entry.poller.reset();
    }

    if (poller) {
        poller->stop();
    }
    entry.publisher->mute();
    if (session) {
        session->close();
    }
}

std::chrono::milliseconds DeviceRegistry::effectiveInterval(const Device& device) const {
    return device.pollInterval.count() > 0 ? device.pollInterval : settings_.defaultPollInterval;
}

DeviceSnapshot DeviceRegistry::makeSnapshot(const Entry& entry) const {
    DeviceSnapshot snapshot;
    snapshot.device = entry.device;
    if (entry.session) {
        snapshot.sessionState = entry.session->state();
        snapshot.failureCount = entry.session->failureCount();
        snapshot.nextRetryAt = entry.session->nextRetryAt();
    }
    if (entry.poller) {
        snapshot.hasState = entry.poller->hasPolled();
        snapshot.state = entry.poller->lastKnownState();
    }
    return snapshot;
}

} // namespace application
