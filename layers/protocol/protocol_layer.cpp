#include "protocol_layer.h"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace protocol {

namespace {

constexpr std::size_t kMaxTextLength = 1024;

bool isAsciiDigits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

const std::vector<DiagnosticCommand>& diagnosticCommands() {
    static const std::vector<DiagnosticCommand> commands = {
        {DiagnosticField::Power, "dumpsys power"},
        {DiagnosticField::AudioPlaying, "dumpsys media_session"},
        {DiagnosticField::AndroidVersion, "getprop ro.build.version.release"},
        {DiagnosticField::ApiLevel, "getprop ro.build.version.sdk"},
        {DiagnosticField::ForegroundApp, "dumpsys window windows"},
    };
    return commands;
}

const char* fieldName(DiagnosticField field) noexcept {
    switch (field) {
    case DiagnosticField::Power:
        return "power";
    case DiagnosticField::AudioPlaying:
        return "audioPlaying";
    case DiagnosticField::AndroidVersion:
        return "androidVersion";
    case DiagnosticField::ApiLevel:
        return "apiLevel";
    case DiagnosticField::ForegroundApp:
        return "foregroundApp";
    }
    return "unknown";
}

const char* toString(CommandKind kind) noexcept {
    switch (kind) {
    case CommandKind::KeyEvent:
        return "sendKey";
    case CommandKind::LaunchApp:
        return "launchApp";
    case CommandKind::StopApp:
        return "stopApp";
    case CommandKind::SendText:
        return "sendText";
    case CommandKind::Reboot:
        return "reboot";
    case CommandKind::Shell:
        return "shell";
    }
    return "unknown";
}

bool isValidKeyCode(const std::string& key) {
    if (isAsciiDigits(key)) {
        return key.size() <= 4;
    }

    static const std::string prefix = "KEYCODE_";
    if (key.size() <= prefix.size() || key.compare(0, prefix.size(), prefix) != 0) {
        return false;
    }
    return std::all_of(key.begin() + static_cast<std::ptrdiff_t>(prefix.size()), key.end(), [](unsigned char c) {
        return std::isupper(c) != 0 || std::isdigit(c) != 0 || c == '_';
    });
}

bool isValidPackageId(const std::string& packageId) {
    if (packageId.empty() || packageId.size() > 255) {
        return false;
    }
    if (packageId.front() == '.' || packageId.back() == '.') {
        return false;
    }
    return std::all_of(packageId.begin(), packageId.end(), [](unsigned char c) {
        return std::isalnum(c) != 0 || c == '_' || c == '.';
    });
}

std::string escapeInputText(const std::string& text) {
    static const char* special = "\\'\"`$&|;<>()*~!#?[]{}";

    std::string out;
    out.reserve(text.size() * 2);
    for (const char c : text) {
        if (c == ' ') {
            out += "%s";
            continue;
        }
        if (std::strchr(special, c) != nullptr) {
            out.push_back('\\');
        }
        out.push_back(c);
    }
    return out;
}

bool buildShellCommand(const Command& command, std::string& shellLine, std::string& error) {
    const auto& arg = command.argument;

    switch (command.kind) {
    case CommandKind::KeyEvent:
        if (!isValidKeyCode(arg)) {
            error = "Invalid key code: " + arg;
            return false;
        }
        shellLine = "input keyevent " + arg;
        return true;

    case CommandKind::LaunchApp:
        if (!isValidPackageId(arg)) {
            error = "Invalid package id: " + arg;
            return false;
        }
        shellLine = "monkey -p " + arg + " -c android.intent.category.LAUNCHER 1";
        return true;

    case CommandKind::StopApp:
        if (!isValidPackageId(arg)) {
            error = "Invalid package id: " + arg;
            return false;
        }
        shellLine = "am force-stop " + arg;
        return true;

    case CommandKind::SendText:
        if (arg.empty() || arg.size() > kMaxTextLength) {
            error = "Text must be 1.." + std::to_string(kMaxTextLength) + " characters";
            return false;
        }
        if (std::any_of(arg.begin(), arg.end(), [](unsigned char c) { return c < 0x20 || c == 0x7F; })) {
            error = "Text must not contain control characters";
            return false;
        }
        shellLine = "input text " + escapeInputText(arg);
        return true;

    case CommandKind::Reboot:
        shellLine = "reboot";
        return true;

    case CommandKind::Shell:
        if (arg.empty()) {
            error = "Shell command is empty";
            return false;
        }
        shellLine = arg;
        return true;
    }

    error = "Unsupported command kind";
    return false;
}

bool controlOutputIndicatesFailure(CommandKind kind, const std::string& output, std::string& error) {
    if (kind == CommandKind::LaunchApp) {
        if (output.find("No activities found") != std::string::npos) {
            error = "No launchable activity for package";
            return true;
        }
        if (output.find("monkey aborted") != std::string::npos) {
            error = "Launch aborted by device";
            return true;
        }
    }

    if (kind == CommandKind::KeyEvent || kind == CommandKind::SendText) {
        const auto pos = output.find("Error:");
        if (pos != std::string::npos) {
            const auto eol = output.find('\n', pos);
            error = output.substr(pos, eol == std::string::npos ? std::string::npos : eol - pos);
            return true;
        }
    }

    return false;
}

} // namespace protocol
