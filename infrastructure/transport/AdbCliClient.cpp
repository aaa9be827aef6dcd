#include "AdbCliClient.h"

#include <boost/filesystem.hpp>
#include <boost/process.hpp>

#include <future>
#include <sstream>
#include <thread>
#include <utility>

namespace transport {

namespace bp = boost::process;

namespace {

constexpr std::chrono::milliseconds kServerTimeout{10000};
constexpr std::chrono::milliseconds kConnectTimeout{10000};
constexpr std::chrono::milliseconds kDisconnectTimeout{5000};
constexpr std::chrono::milliseconds kDrainTime{200};
constexpr std::chrono::milliseconds kPollStep{5};

bool ready(const std::future<std::string>& result) {
    return result.valid() && result.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

std::string trimmed(const std::string& text) {
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

} // namespace

AdbCliClient::AdbCliClient(std::string adbPath, logging::Logger logger)
    : adbPath_(std::move(adbPath)), logger_(std::move(logger)) {}

bool AdbCliClient::startServer(std::string& error) {
    const auto result = run({"start-server"}, kServerTimeout);
    if (!result.started || result.timedOut || result.exitCode != 0) {
        error = "adb start-server failed: " + trimmed(result.error.empty() ? result.output : result.error);
        return false;
    }
    logger_.debug("adb server started");
    return true;
}

void AdbCliClient::stopServer() {
    const auto result = run({"kill-server"}, kServerTimeout);
    if (!result.started || result.exitCode != 0) {
        logger_.warning("adb kill-server failed: " + trimmed(result.error.empty() ? result.output : result.error));
    }
}

std::optional<protocol::ConnectionHandle> AdbCliClient::connect(const std::string& address, std::string& error) {
    const auto result = run({"connect", address}, kConnectTimeout);
    if (!result.started) {
        error = result.error;
        return std::nullopt;
    }
    if (result.timedOut) {
        error = "adb connect " + address + " timed out";
        return std::nullopt;
    }

    // adb exits 0 even when the connection was refused; only the text tells.
    const auto text = trimmed(result.output + result.error);
    if (text.find("connected to") == std::string::npos) {
        error = text.empty() ? "adb connect " + address + " failed" : text;
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    const auto handle = nextHandle_++;
    links_[handle].serial = address;
    return handle;
}

protocol::ShellOutput AdbCliClient::executeShell(protocol::ConnectionHandle handle, const std::string& command,
                                                 std::chrono::milliseconds timeout) {
    std::string serial;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = links_.find(handle);
        if (it == links_.end() || it->second.aborted) {
            return {protocol::ShellStatus::ConnectionLost, {}, "connection handle is closed"};
        }
        serial = it->second.serial;
    }

    const auto result = run({"-s", serial, "shell", command}, timeout, handle);
    if (!result.started) {
        return {protocol::ShellStatus::Failed, {}, result.error};
    }
    if (result.aborted) {
        return {protocol::ShellStatus::ConnectionLost, {}, "aborted by disconnect"};
    }
    if (result.timedOut) {
        return {protocol::ShellStatus::Timeout, result.output, "command timed out"};
    }
    if (result.exitCode != 0 && indicatesLostLink(result.error)) {
        return {protocol::ShellStatus::ConnectionLost, result.output, trimmed(result.error)};
    }
    if (result.exitCode != 0) {
        return {protocol::ShellStatus::Failed, result.output,
                "exit code " + std::to_string(result.exitCode) + ": " + trimmed(result.error)};
    }
    return {protocol::ShellStatus::Ok, result.output, {}};
}

bool AdbCliClient::disconnect(protocol::ConnectionHandle handle, std::string& error) {
    std::string serial;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = links_.find(handle);
        if (it == links_.end()) {
            error = "unknown connection handle";
            return false;
        }
        serial = it->second.serial;
        it->second.aborted = true;
        if (it->second.activeCall) {
            // Wakes the waiting call so it sees the abort.
            boost::asio::post(*it->second.activeCall, []() {});
        }
    }

    const auto result = run({"disconnect", serial}, kDisconnectTimeout);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        links_.erase(handle);
    }

    if (!result.started || result.timedOut || result.exitCode != 0) {
        error = "adb disconnect " + serial + " failed: " + trimmed(result.error.empty() ? result.output : result.error);
        return false;
    }
    return true;
}

AdbCliClient::RunResult AdbCliClient::run(const std::vector<std::string>& args, std::chrono::milliseconds timeout,
                                          std::optional<protocol::ConnectionHandle> handle) {
    RunResult result;
    auto ios = std::make_shared<boost::asio::io_context>();

    if (handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = links_.find(*handle);
        if (it == links_.end() || it->second.aborted) {
            result.started = true;
            result.aborted = true;
            return result;
        }
        it->second.activeCall = ios;
    }

    std::future<std::string> out;
    std::future<std::string> err;
    try {
        const auto exe = adbPath_.find('/') == std::string::npos ? bp::search_path(adbPath_)
                                                                 : boost::filesystem::path(adbPath_);
        if (exe.empty()) {
            result.error = "adb executable not found: " + adbPath_;
        } else {
            bool exited = false;
            int exitCode = -1;
            const auto deadline = std::chrono::steady_clock::now() + timeout;

            bp::child child(exe, bp::args(args), bp::std_in.close(), bp::std_out > out, bp::std_err > err, *ios,
                            bp::on_exit([&exited, &exitCode](int code, const std::error_code&) {
                                exited = true;
                                exitCode = code;
                            }));
            result.started = true;

            // Pipes reaching EOF do not mean the child has been reaped; only the exit
            // notification or the deadline ends the wait.
            while (!exited) {
                if (handle && callAborted(*handle)) {
                    result.aborted = true;
                    break;
                }
                if (std::chrono::steady_clock::now() >= deadline) {
                    break;
                }
                if (ios->stopped()) {
                    ios->restart();
                }
                if (ios->run_one_until(deadline) == 0 && !exited) {
                    std::error_code ec;
                    if (!child.running(ec)) {
                        exited = true;
                        exitCode = child.exit_code();
                    } else {
                        std::this_thread::sleep_for(kPollStep);
                    }
                }
            }

            if (exited) {
                result.exitCode = exitCode;
            } else {
                std::error_code ec;
                child.terminate(ec);
                result.timedOut = !result.aborted;
            }

            // Collect whatever output is left; a killed child may leave a grandchild holding the pipes.
            const auto drainDeadline = std::chrono::steady_clock::now() + kDrainTime;
            while (!(ready(out) && ready(err)) && std::chrono::steady_clock::now() < drainDeadline) {
                if (ios->stopped()) {
                    ios->restart();
                }
                if (ios->run_one_until(drainDeadline) == 0) {
                    break;
                }
            }
            if (ready(out)) {
                result.output = out.get();
            }
            if (ready(err)) {
                result.error = err.get();
            }
        }
    } catch (const bp::process_error& e) {
        result.started = false;
        result.error = std::string("cannot run adb: ") + e.what();
    } catch (const std::future_error& e) {
        result.error = std::string("adb output unavailable: ") + e.what();
    }

    if (handle) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = links_.find(*handle);
        if (it == links_.end() || it->second.aborted) {
            result.aborted = true;
        } else {
            it->second.activeCall.reset();
        }
    }

    if (result.started && !result.timedOut && !result.aborted) {
        logger_.debug("adb " + args.front() + " exit " + std::to_string(result.exitCode));
    }
    return result;
}

bool AdbCliClient::callAborted(protocol::ConnectionHandle handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = links_.find(handle);
    return it == links_.end() || it->second.aborted;
}

bool AdbCliClient::indicatesLostLink(const std::string& text) {
    // Only adb's own diagnostics; whatever the device shell prints is a command failure.
    static const char* const markers[] = {"device offline", "no devices/emulators found", "device unauthorized",
                                          "closed", "not found"};

    std::istringstream lines(text);
    std::string line;
    while (std::getline(lines, line)) {
        const auto first = line.find_first_not_of(" \t");
        if (first == std::string::npos) {
            continue;
        }
        line.erase(0, first);
        if (line.rfind("error: ", 0) != 0 && line.rfind("adb: error: ", 0) != 0) {
            continue;
        }
        for (const auto* marker : markers) {
            if (line.find(marker) != std::string::npos) {
                return true;
            }
        }
    }
    return false;
}

} // namespace transport
