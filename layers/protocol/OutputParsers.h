#pragma once

#include <cstdint>
#include <string>
#include <variant>

#include "PolledState.h"
#include "protocol_layer.h"

namespace protocol {

// Marker not found in the command output. Never an error: the caller keeps its previous value.
struct ParseFailure {
    std::string reason;
};

template <typename T>
using ParseResult = std::variant<T, ParseFailure>;

template <typename T>
bool isParsed(const ParseResult<T>& result) noexcept {
    return std::holds_alternative<T>(result);
}

// `dumpsys power`: mWakefulness=Awake, falling back to "Display Power: state=ON".
ParseResult<bool> parsePower(const std::string& raw);

// `dumpsys media_session`: true when any PlaybackState reports state=3 (playing).
ParseResult<bool> parsePlayback(const std::string& raw);

// `getprop ro.build.version.release`
ParseResult<std::string> parseAndroidVersion(const std::string& raw);

// `getprop ro.build.version.sdk`
ParseResult<std::int64_t> parseApiLevel(const std::string& raw);

// `dumpsys window windows`: package name of mCurrentFocus / mFocusedApp / mResumedActivity.
ParseResult<std::string> parseForegroundApp(const std::string& raw);

// Runs the parser for `field` and stores the value into `state` on success.
// On failure `state` is left untouched and `reason` describes the miss.
bool applyDiagnosticOutput(DiagnosticField field, const std::string& raw, PolledState& state, std::string& reason);

} // namespace protocol
