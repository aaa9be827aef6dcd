#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "infrastructure/transport/InMemoryProtocolClient.h"
#include "layers/application/StateSink.h"
#include "layers/common/logging.h"

namespace testsupport {

struct StateWrite {
    std::string deviceId;
    std::string name;
    boost::json::value value;
};

class RecordingSink final : public application::StateSink {
public:
    void writeState(const std::string& deviceId, const std::string& name, const boost::json::value& value) override {
        std::lock_guard<std::mutex> lock(mutex_);
        writes_.push_back({deviceId, name, value});
    }

    std::vector<StateWrite> writes() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    std::vector<StateWrite> writesFor(const std::string& deviceId, const std::string& name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<StateWrite> out;
        for (const auto& w : writes_) {
            if (w.deviceId == deviceId && w.name == name) {
                out.push_back(w);
            }
        }
        return out;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_.size();
    }

    void clear() {
        std::lock_guard<std::mutex> lock(mutex_);
        writes_.clear();
    }

private:
    mutable std::mutex mutex_;
    std::vector<StateWrite> writes_;
};

class CapturingLog {
public:
    logging::Logger logger() {
        return logging::Logger([this](logging::LogLevel level, const std::string& message) {
            std::lock_guard<std::mutex> lock(mutex_);
            lines_.push_back({level, message});
        });
    }

    std::size_t count(logging::LogLevel level, const std::string& fragment = {}) const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::size_t n = 0;
        for (const auto& [l, m] : lines_) {
            if (l == level && m.find(fragment) != std::string::npos) {
                ++n;
            }
        }
        return n;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::pair<logging::LogLevel, std::string>> lines_;
};

inline bool waitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

constexpr const char* kPowerAwake = "POWER MANAGER (dumpsys power)\n  mWakefulness=Awake\n  mWakefulnessChanging=false\n";
constexpr const char* kPowerAsleep = "POWER MANAGER (dumpsys power)\n  mWakefulness=Asleep\n";
constexpr const char* kMediaPlaying =
    "MEDIA SESSION SERVICE (dumpsys media_session)\n"
    "    com.netflix.ninja/Netflix\n"
    "      state=PlaybackState {state=3, position=1200, buffered position=0, speed=1.0}\n";
constexpr const char* kMediaNone = "MEDIA SESSION SERVICE (dumpsys media_session)\nSessions Stack - have 0 sessions:\n";
constexpr const char* kWindowNetflix =
    "WINDOW MANAGER WINDOWS (dumpsys window windows)\n"
    "  mCurrentFocus=Window{3f2b9c u0 com.netflix.ninja/com.netflix.ninja.MainActivity}\n";

// Scripts every diagnostic command for `address` with a plausible awake, playing TV.
inline void scriptHealthyDevice(transport::InMemoryProtocolClient& client, const std::string& address) {
    client.setResponse(address, "dumpsys power", kPowerAwake);
    client.setResponse(address, "dumpsys media_session", kMediaPlaying);
    client.setResponse(address, "getprop ro.build.version.release", "9\n");
    client.setResponse(address, "getprop ro.build.version.sdk", "28\n");
    client.setResponse(address, "dumpsys window windows", kWindowNetflix);
}

} // namespace testsupport
