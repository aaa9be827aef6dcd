#pragma once

#include <boost/asio.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "Device.h"
#include "Poller.h"
#include "StateSink.h"
#include "layers/common/logging.h"
#include "layers/protocol/protocol_layer.h"
#include "layers/transport/ServerLease.h"
#include "layers/transport/transport_layer.h"

namespace application {

// Collaborators handed to the registry instead of globals.
struct AdapterContext {
    StateSink& sink;
    logging::Logger logger;
    Clock clock;
};

struct RegistrySettings {
    std::chrono::milliseconds defaultPollInterval{10000};
    std::chrono::milliseconds firstPollDelay{0};
    bool autoRegister = false;
    transport::SessionSettings session;
};

enum class UpsertOutcome {
    Created,
    Updated,
    Unchanged,
    Ignored,
    Rejected
};

const char* toString(UpsertOutcome outcome) noexcept;

struct DeviceSnapshot {
    Device device;
    transport::SessionState sessionState = transport::SessionState::Closed;
    std::uint32_t failureCount = 0;
    std::optional<std::chrono::steady_clock::time_point> nextRetryAt;
    bool hasState = false;
    protocol::PolledState state;
};

// Owns every Device and its Session/Poller pair, keyed by device id (derived from the address,
// so one address can never have two Sessions). All mutations are serialized; readers get snapshots.
class DeviceRegistry {
public:
    DeviceRegistry(protocol::ProtocolClient& client,
                   transport::ServerLease& serverLease,
                   boost::asio::io_context& ioContext,
                   RegistrySettings settings,
                   AdapterContext context);
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    UpsertOutcome upsert(const DeviceDescriptor& descriptor, DeviceSource source, std::string& error);

    // Merges a full configured list: entries are upserted, configured devices missing from
    // the list are removed (or handed back to discovery when discovered and auto-register is on).
    void applyConfiguration(const std::vector<DeviceDescriptor>& devices, std::vector<std::string>& errors);

    bool remove(const std::string& deviceId);
    bool setEnabled(const std::string& deviceId, bool enabled, std::string& error);

    void setAutoRegister(bool enabled);
    bool autoRegister() const;

    std::optional<DeviceSnapshot> snapshot(const std::string& deviceId) const;
    std::vector<DeviceSnapshot> snapshots() const;
    std::optional<std::string> findIdByAddress(const std::string& address) const;
    std::size_t size() const;
    std::size_t activeSessions() const;

    transport::CommandResult execute(const protocol::Command& command);
    bool pollNow(const std::string& deviceId);

    // Stops every poller and closes all Sessions in parallel. Further mutations are rejected.
    void closeAll();

private:
    struct Entry {
        Device device;
        DevicePublisherPtr publisher;
        transport::SessionPtr session;
        PollerPtr poller;
    };

    UpsertOutcome upsertLocked(const DeviceDescriptor& descriptor, DeviceSource source, std::string& error);
    bool removeLocked(const std::string& deviceId);
    void activateLocked(Entry& entry);
    void deactivateLocked(Entry& entry);
    std::chrono::milliseconds effectiveInterval(const Device& device) const;
    DeviceSnapshot makeSnapshot(const Entry& entry) const;

    protocol::ProtocolClient& client_;
    transport::ServerLease& serverLease_;
    boost::asio::io_context& ioContext_;
    RegistrySettings settings_;
    AdapterContext context_;

    std::mutex writeMutex_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
    bool closed_ = false;
};

} // namespace application
