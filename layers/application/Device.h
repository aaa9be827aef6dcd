#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace application {

constexpr std::uint16_t kDefaultAdbPort = 5555;

enum class DeviceSource {
    Configuration,
    Discovery
};

const char* toString(DeviceSource source) noexcept;

// One entry of the configured device list or one discovery observation.
struct DeviceDescriptor {
    std::string address;
    std::string displayName;
    bool enabled = true;
    std::chrono::milliseconds pollInterval{0}; // 0: global default
};

struct Device {
    std::string id;
    std::string address; // normalized host:port
    std::string displayName;
    bool enabled = true;
    std::chrono::milliseconds pollInterval{0};
    DeviceSource source = DeviceSource::Configuration;
    bool discovered = false;
};

// "10.0.0.5" -> "10.0.0.5:5555". Hostnames are lower-cased.
bool normalizeAddress(const std::string& raw, std::string& normalized, std::string& error);

// Stable key derived from a normalized address: "10.0.0.5:5555" -> "10_0_0_5".
std::string deviceIdFromAddress(const std::string& normalizedAddress);

} // namespace application
