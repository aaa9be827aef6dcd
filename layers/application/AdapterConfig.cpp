#include "AdapterConfig.h"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace application {

namespace json = boost::json;

namespace {

constexpr std::int64_t kMinPollIntervalMs = 500;
constexpr std::int64_t kMaxDurationMs = 24LL * 60 * 60 * 1000;

bool readDurationMs(const json::object& obj, const char* key, std::int64_t minimum, std::chrono::milliseconds& out,
                    std::string& error) {
    if (!obj.contains(key)) {
        return true;
    }
    const auto& value = obj.at(key);
    if (!value.is_int64() && !value.is_uint64()) {
        error = std::string(key) + " must be an integer (milliseconds)";
        return false;
    }
    const auto ms = value.is_int64() ? value.as_int64() : static_cast<std::int64_t>(value.as_uint64());
    if (ms < minimum || ms > kMaxDurationMs) {
        error = std::string(key) + " out of range [" + std::to_string(minimum) + ".." + std::to_string(kMaxDurationMs) + "]";
        return false;
    }
    out = std::chrono::milliseconds(ms);
    return true;
}

bool readBool(const json::object& obj, const char* key, bool& out, std::string& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_bool()) {
        error = std::string(key) + " must be boolean";
        return false;
    }
    out = obj.at(key).as_bool();
    return true;
}

bool readString(const json::object& obj, const char* key, std::string& out, std::string& error) {
    if (!obj.contains(key)) {
        return true;
    }
    if (!obj.at(key).is_string()) {
        error = std::string(key) + " must be string";
        return false;
    }
    out = std::string(obj.at(key).as_string().c_str());
    return true;
}

bool parseDevice(const json::value& item, DeviceDescriptor& out, std::string& error) {
    if (!item.is_object()) {
        error = "device entry must be object";
        return false;
    }
    const auto& obj = item.as_object();

    // "ip" is accepted as an alias of "address".
    const char* addressKey = obj.contains("address") ? "address" : "ip";
    if (!obj.contains(addressKey) || !obj.at(addressKey).is_string()) {
        error = "device entry requires string address";
        return false;
    }
    out.address = std::string(obj.at(addressKey).as_string().c_str());

    std::string normalized;
    if (!normalizeAddress(out.address, normalized, error)) {
        return false;
    }

    if (!readString(obj, "name", out.displayName, error) || !readBool(obj, "enabled", out.enabled, error) ||
        !readDurationMs(obj, "pollIntervalMs", kMinPollIntervalMs, out.pollInterval, error)) {
        error = normalized + ": " + error;
        return false;
    }
    return true;
}

} // namespace

std::chrono::milliseconds AdapterConfig::effectiveCommandTimeout() const {
    if (commandTimeout.count() > 0) {
        return commandTimeout;
    }
    return std::min(pollInterval, std::chrono::milliseconds(5000));
}

bool parseAdapterConfig(const json::value& root, AdapterConfig& out, std::vector<std::string>& warnings,
                        std::string& error) {
    if (!root.is_object()) {
        error = "Configuration root must be object";
        return false;
    }
    const auto& obj = root.as_object();

    AdapterConfig config;
    if (!readDurationMs(obj, "pollIntervalMs", kMinPollIntervalMs, config.pollInterval, error) ||
        !readBool(obj, "autoRegister", config.autoRegister, error) ||
        !readDurationMs(obj, "commandTimeoutMs", 100, config.commandTimeout, error) ||
        !readDurationMs(obj, "shutdownGraceMs", 0, config.shutdownGrace, error) ||
        !readDurationMs(obj, "firstPollDelayMs", 0, config.firstPollDelay, error) ||
        !readString(obj, "adbPath", config.adbPath, error)) {
        return false;
    }

    if (obj.contains("commandFailureThreshold")) {
        const auto& value = obj.at("commandFailureThreshold");
        if (!value.is_int64() || value.as_int64() < 1 || value.as_int64() > 100) {
            error = "commandFailureThreshold must be an integer in [1..100]";
            return false;
        }
        config.commandFailureThreshold = static_cast<std::uint32_t>(value.as_int64());
    }

    if (obj.contains("reconnect")) {
        if (!obj.at("reconnect").is_object()) {
            error = "reconnect must be object";
            return false;
        }
        const auto& reconnect = obj.at("reconnect").as_object();
        if (!readDurationMs(reconnect, "baseDelayMs", 10, config.reconnect.baseDelay, error) ||
            !readDurationMs(reconnect, "maxDelayMs", 10, config.reconnect.maxDelay, error)) {
            return false;
        }
        if (config.reconnect.maxDelay < config.reconnect.baseDelay) {
            error = "reconnect.maxDelayMs must not be below baseDelayMs";
            return false;
        }
        if (reconnect.contains("jitter")) {
            const auto& jitter = reconnect.at("jitter");
            if (!jitter.is_number()) {
                error = "reconnect.jitter must be a number";
                return false;
            }
            const auto value = jitter.to_number<double>();
            if (value < 0.0 || value > 1.0) {
                error = "reconnect.jitter must be in [0..1]";
                return false;
            }
            config.reconnect.jitter = value;
        }
    }

    if (obj.contains("devices")) {
        if (!obj.at("devices").is_array()) {
            error = "devices must be array";
            return false;
        }
        std::size_t index = 0;
        for (const auto& item : obj.at("devices").as_array()) {
            DeviceDescriptor descriptor;
            std::string deviceError;
            if (!parseDevice(item, descriptor, deviceError)) {
                warnings.push_back("devices[" + std::to_string(index) + "] skipped: " + deviceError);
            } else {
                config.devices.push_back(std::move(descriptor));
            }
            ++index;
        }
    }

    out = std::move(config);
    return true;
}

bool loadAdapterConfig(const std::string& path, AdapterConfig& out, std::vector<std::string>& warnings,
                       std::string& error) {
    std::ifstream file(path);
    if (!file) {
        error = "Cannot open configuration file: " + path;
        return false;
    }

    std::ostringstream content;
    content << file.rdbuf();

    json::error_code ec;
    const auto root = json::parse(content.str(), ec);
    if (ec) {
        error = "Invalid JSON in " + path + ": " + ec.message();
        return false;
    }
    return parseAdapterConfig(root, out, warnings, error);
}

AdapterConfig loadAdapterConfigOrDefaults(const std::string& path, std::vector<std::string>& warnings,
                                          const logging::Logger& logger) {
    AdapterConfig config;
    if (path.empty()) {
        return config;
    }

    std::string error;
    if (!loadAdapterConfig(path, config, warnings, error)) {
        logger.error("Configuration error: " + error);
        warnings.push_back(error);
        return AdapterConfig{};
    }
    for (const auto& warning : warnings) {
        logger.warning("Configuration: " + warning);
    }
    return config;
}

bool validateAdapterConfig(const AdapterConfig& config, std::string& error) {
    if (config.devices.empty() && !config.autoRegister) {
        error = "No devices configured and auto-register is disabled";
        return false;
    }
    return true;
}

} // namespace application
