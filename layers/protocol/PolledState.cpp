#include "PolledState.h"

namespace protocol {

namespace json = boost::json;

namespace {

template <typename T>
json::value toValue(const std::optional<T>& field) {
    if (!field) {
        return nullptr;
    }
    return json::value(*field);
}

template <typename T>
void diffField(const char* name, const std::optional<T>* previous, const std::optional<T>& next,
               std::vector<FieldChange>& out) {
    if (previous != nullptr && *previous == next) {
        return;
    }
    out.push_back(FieldChange{name, toValue(next)});
}

} // namespace

std::vector<FieldChange> diffStates(const PolledState* previous, const PolledState& next) {
    std::vector<FieldChange> changes;
    diffField("power", previous ? &previous->power : nullptr, next.power, changes);
    diffField("audioPlaying", previous ? &previous->audioPlaying : nullptr, next.audioPlaying, changes);
    diffField("androidVersion", previous ? &previous->androidVersion : nullptr, next.androidVersion, changes);
    diffField("apiLevel", previous ? &previous->apiLevel : nullptr, next.apiLevel, changes);
    diffField("foregroundApp", previous ? &previous->foregroundApp : nullptr, next.foregroundApp, changes);
    return changes;
}

json::object toJson(const PolledState& state) {
    json::object out;
    out["power"] = toValue(state.power);
    out["audioPlaying"] = toValue(state.audioPlaying);
    out["androidVersion"] = toValue(state.androidVersion);
    out["apiLevel"] = toValue(state.apiLevel);
    out["foregroundApp"] = toValue(state.foregroundApp);
    out["observedAt"] = std::chrono::duration_cast<std::chrono::milliseconds>(
                            state.observedAt.time_since_epoch()).count();
    return out;
}

} // namespace protocol
