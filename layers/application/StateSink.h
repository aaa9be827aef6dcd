#pragma once

#include <boost/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "layers/protocol/PolledState.h"

namespace application {

// External key/value store receiving derived per-device values. A null value means "unknown".
class StateSink {
public:
    virtual ~StateSink() = default;
    virtual void writeState(const std::string& deviceId, const std::string& name, const boost::json::value& value) = 0;
};

// Gate between one device and the sink. Muted while the device is disabled,
// retired for good when it is removed.
class DevicePublisher {
public:
    DevicePublisher(std::string deviceId, StateSink& sink);

    void publishChanges(const std::vector<protocol::FieldChange>& changes);

    // Written only when it differs from the last written value.
    void publishConnected(bool connected);

    // Writes connected=false (if it was ever written true) and mutes.
    void mute();
    void unmute();

    // Writes exactly one connected=false, then drops everything.
    void retire();

    bool isOpen() const;
    std::optional<bool> lastConnected() const;

private:
    const std::string deviceId_;
    StateSink& sink_;

    mutable std::mutex mutex_;
    bool muted_ = false;
    bool retired_ = false;
    std::optional<bool> connected_;
};

using DevicePublisherPtr = std::shared_ptr<DevicePublisher>;

} // namespace application
