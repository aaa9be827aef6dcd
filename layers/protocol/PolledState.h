#pragma once

#include <boost/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

// Snapshot of one successful poll cycle. An empty optional means "unknown".
struct PolledState {
    std::optional<bool> power;
    std::optional<bool> audioPlaying;
    std::optional<std::string> androidVersion;
    std::optional<std::int64_t> apiLevel;
    std::optional<std::string> foregroundApp;
    std::chrono::system_clock::time_point observedAt{};
};

struct FieldChange {
    std::string name;
    boost::json::value value;
};

// Field-by-field difference. With no previous state every field is reported.
std::vector<FieldChange> diffStates(const PolledState* previous, const PolledState& next);

boost::json::object toJson(const PolledState& state);

} // namespace protocol
