#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace protocol {

using ConnectionHandle = std::uint64_t;

enum class ShellStatus {
    Ok,
    Timeout,
    Failed,
    ConnectionLost
};

struct ShellOutput {
    ShellStatus status = ShellStatus::Ok;
    std::string text;
    std::string error;
};

// Debug-protocol capability supplied by a collaborator (adb binary, in-memory fake).
// All calls may block. disconnect() must abort a command still running on the handle.
class ProtocolClient {
public:
    virtual ~ProtocolClient() = default;

    // Local server shared by every connection. Called through transport::ServerLease only.
    virtual bool startServer(std::string& error) = 0;
    virtual void stopServer() = 0;

    virtual std::optional<ConnectionHandle> connect(const std::string& address, std::string& error) = 0;
    virtual ShellOutput executeShell(ConnectionHandle handle, const std::string& command,
                                     std::chrono::milliseconds timeout) = 0;
    virtual bool disconnect(ConnectionHandle handle, std::string& error) = 0;
};

enum class DiagnosticField {
    Power,
    AudioPlaying,
    AndroidVersion,
    ApiLevel,
    ForegroundApp
};

struct DiagnosticCommand {
    DiagnosticField field;
    const char* command;
};

// Read-only commands issued once per poll cycle, in this order.
const std::vector<DiagnosticCommand>& diagnosticCommands();

const char* fieldName(DiagnosticField field) noexcept;

enum class CommandKind {
    KeyEvent,
    LaunchApp,
    StopApp,
    SendText,
    Reboot,
    Shell
};

const char* toString(CommandKind kind) noexcept;

struct Command {
    std::string deviceId;
    CommandKind kind = CommandKind::KeyEvent;
    std::string argument;
    std::chrono::system_clock::time_point issuedAt{};
};

bool isValidKeyCode(const std::string& key);
bool isValidPackageId(const std::string& packageId);
std::string escapeInputText(const std::string& text);

// Validates the argument and produces the shell line for a user command.
bool buildShellCommand(const Command& command, std::string& shellLine, std::string& error);

// Some control commands report failure in their output while exiting cleanly.
bool controlOutputIndicatesFailure(CommandKind kind, const std::string& output, std::string& error);

} // namespace protocol
