#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "Device.h"
#include "layers/common/logging.h"
#include "layers/transport/ReconnectPolicy.h"

namespace application {

struct AdapterConfig {
    std::vector<DeviceDescriptor> devices;
    std::chrono::milliseconds pollInterval{10000};
    bool autoRegister = false;
    std::chrono::milliseconds commandTimeout{0}; // 0: min(pollInterval, 5 s)
    std::uint32_t commandFailureThreshold = 3;
    transport::ReconnectSettings reconnect;
    std::chrono::milliseconds shutdownGrace{3000};
    std::chrono::milliseconds firstPollDelay{0};
    std::string adbPath = "adb";

    std::chrono::milliseconds effectiveCommandTimeout() const;
};

// Fills `out` from a parsed JSON document. Bad device entries are skipped and
// reported through `warnings`; a structurally wrong document fails with `error`.
bool parseAdapterConfig(const boost::json::value& root, AdapterConfig& out, std::vector<std::string>& warnings,
                        std::string& error);

bool loadAdapterConfig(const std::string& path, AdapterConfig& out, std::vector<std::string>& warnings,
                       std::string& error);

// Startup loading: a missing or broken file is logged once at error level and the
// defaults are returned, so the service still comes up (with zero Sessions).
AdapterConfig loadAdapterConfigOrDefaults(const std::string& path, std::vector<std::string>& warnings,
                                          const logging::Logger& logger);

// Startup check: a config that can never produce a Session.
bool validateAdapterConfig(const AdapterConfig& config, std::string& error);

} // namespace application
