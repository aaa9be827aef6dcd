#include "OutputParsers.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <vector>

namespace protocol {

namespace {

std::string trim(const std::string& text) {
    const auto begin = std::find_if_not(text.begin(), text.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    const auto end = std::find_if_not(text.rbegin(), text.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

std::vector<std::string> splitLines(const std::string& raw) {
    std::vector<std::string> lines;
    std::istringstream stream(raw);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

// Value following `marker` on `line`, up to the next whitespace or ','.
std::string tokenAfter(const std::string& line, std::size_t markerEnd) {
    std::size_t end = markerEnd;
    while (end < line.size() && std::isspace(static_cast<unsigned char>(line[end])) == 0 && line[end] != ',') {
        ++end;
    }
    return line.substr(markerEnd, end - markerEnd);
}

std::string toLowerAscii(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return text;
}

bool isVersionString(const std::string& text) {
    if (text.empty() || std::isdigit(static_cast<unsigned char>(text.front())) == 0) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0 || c == '.'; });
}

// "Window{3f2b9c u0 com.example/.Main}" -> "com.example"
std::string packageFromRecord(const std::string& record) {
    std::istringstream tokens(record);
    std::string token;
    while (tokens >> token) {
        const auto slash = token.find('/');
        if (slash == std::string::npos || slash == 0) {
            continue;
        }
        auto candidate = token.substr(0, slash);
        const auto brace = candidate.find_last_of('{');
        if (brace != std::string::npos) {
            candidate = candidate.substr(brace + 1);
        }
        if (isValidPackageId(candidate)) {
            return candidate;
        }
    }
    return {};
}

} // namespace

ParseResult<bool> parsePower(const std::string& raw) {
    const auto lines = splitLines(raw);

    static const std::string wakefulness = "mWakefulness=";
    for (const auto& line : lines) {
        const auto pos = line.find(wakefulness);
        if (pos == std::string::npos) {
            continue;
        }
        const auto value = tokenAfter(line, pos + wakefulness.size());
        if (value.empty()) {
            continue;
        }
        return toLowerAscii(value) == "awake";
    }

    static const std::string displayPower = "Display Power: state=";
    for (const auto& line : lines) {
        const auto pos = line.find(displayPower);
        if (pos == std::string::npos) {
            continue;
        }
        const auto value = toLowerAscii(tokenAfter(line, pos + displayPower.size()));
        if (value == "on") {
            return true;
        }
        if (!value.empty()) {
            return false;
        }
    }

    static const std::string screenOn = "mScreenOn=";
    for (const auto& line : lines) {
        const auto pos = line.find(screenOn);
        if (pos == std::string::npos) {
            continue;
        }
        const auto value = tokenAfter(line, pos + screenOn.size());
        if (value == "true") {
            return true;
        }
        if (value == "false") {
            return false;
        }
    }

    return ParseFailure{"no wakefulness or display power marker"};
}

ParseResult<bool> parsePlayback(const std::string& raw) {
    static const std::string marker = "state=PlaybackState {state=";

    bool sawState = false;
    std::size_t pos = raw.find(marker);
    while (pos != std::string::npos) {
        const auto valueBegin = pos + marker.size();
        int state = 0;
        const auto* first = raw.data() + valueBegin;
        const auto* last = raw.data() + raw.size();
        const auto res = std::from_chars(first, last, state);
        if (res.ec == std::errc()) {
            sawState = true;
            if (state == 3) {
                return true;
            }
        }
        pos = raw.find(marker, valueBegin);
    }

    if (sawState) {
        return false;
    }
    return ParseFailure{"no PlaybackState entries"};
}

ParseResult<std::string> parseAndroidVersion(const std::string& raw) {
    for (const auto& line : splitLines(raw)) {
        const auto value = trim(line);
        if (isVersionString(value)) {
            return value;
        }
    }
    return ParseFailure{"no version line"};
}

ParseResult<std::int64_t> parseApiLevel(const std::string& raw) {
    for (const auto& line : splitLines(raw)) {
        const auto value = trim(line);
        if (value.empty()) {
            continue;
        }

        std::int64_t level = 0;
        const auto* begin = value.data();
        const auto* end = begin + value.size();
        const auto res = std::from_chars(begin, end, level);
        if (res.ec != std::errc() || res.ptr != end) {
            continue;
        }
        if (level < 1 || level > 1000) {
            return ParseFailure{"api level out of range: " + value};
        }
        return level;
    }
    return ParseFailure{"no api level line"};
}

ParseResult<std::string> parseForegroundApp(const std::string& raw) {
    static const char* markers[] = {"mCurrentFocus=", "mFocusedApp=", "mResumedActivity:", "ResumedActivity:"};

    const auto lines = splitLines(raw);
    for (const auto* marker : markers) {
        for (const auto& line : lines) {
            const auto pos = line.find(marker);
            if (pos == std::string::npos) {
                continue;
            }
            auto package = packageFromRecord(line.substr(pos));
            if (!package.empty()) {
                return package;
            }
        }
    }
    return ParseFailure{"no focused window or resumed activity"};
}

bool applyDiagnosticOutput(DiagnosticField field, const std::string& raw, PolledState& state, std::string& reason) {
    switch (field) {
    case DiagnosticField::Power: {
        auto parsed = parsePower(raw);
        if (!isParsed(parsed)) {
            reason = std::get<ParseFailure>(parsed).reason;
            return false;
        }
        state.power = std::get<bool>(parsed);
        return true;
    }
    case DiagnosticField::AudioPlaying: {
        auto parsed = parsePlayback(raw);
        if (!isParsed(parsed)) {
            reason = std::get<ParseFailure>(parsed).reason;
            return false;
        }
        state.audioPlaying = std::get<bool>(parsed);
        return true;
    }
    case DiagnosticField::AndroidVersion: {
        auto parsed = parseAndroidVersion(raw);
        if (!isParsed(parsed)) {
            reason = std::get<ParseFailure>(parsed).reason;
            return false;
        }
        state.androidVersion = std::move(std::get<std::string>(parsed));
        return true;
    }
    case DiagnosticField::ApiLevel: {
        auto parsed = parseApiLevel(raw);
        if (!isParsed(parsed)) {
            reason = std::get<ParseFailure>(parsed).reason;
            return false;
        }
        state.apiLevel = std::get<std::int64_t>(parsed);
        return true;
    }
    case DiagnosticField::ForegroundApp: {
        auto parsed = parseForegroundApp(raw);
        if (!isParsed(parsed)) {
            reason = std::get<ParseFailure>(parsed).reason;
            return false;
        }
        state.foregroundApp = std::move(std::get<std::string>(parsed));
        return true;
    }
    }

    reason = "unsupported field";
    return false;
}

} // namespace protocol
