#include "StateSink.h"

namespace application {

DevicePublisher::DevicePublisher(std::string deviceId, StateSink& sink)
    : deviceId_(std::move(deviceId)), sink_(sink) {}

void DevicePublisher::publishChanges(const std::vector<protocol::FieldChange>& changes) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (muted_ || retired_) {
        return;
    }
    for (const auto& change : changes) {
        sink_.writeState(deviceId_, change.name, change.value);
    }
}

void DevicePublisher::publishConnected(bool connected) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (muted_ || retired_ || connected_ == connected) {
        return;
    }
    connected_ = connected;
    sink_.writeState(deviceId_, "connected", connected);
}

void DevicePublisher::mute() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (muted_ || retired_) {
        return;
    }
    if (connected_ == true) {
        connected_ = false;
        sink_.writeState(deviceId_, "connected", false);
    }
    muted_ = true;
}

void DevicePublisher::unmute() {
    std::lock_guard<std::mutex> lock(mutex_);
    muted_ = false;
}

void DevicePublisher::retire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (retired_) {
        return;
    }
    retired_ = true;
    connected_ = false;
    sink_.writeState(deviceId_, "connected", false);
}

bool DevicePublisher::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !muted_ && !retired_;
}

std::optional<bool> DevicePublisher::lastConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connected_;
}

} // namespace application
