#include <boost/asio.hpp>
#include <boost/json.hpp>

#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <limits>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "infrastructure/transport/AdbCliClient.h"
#include "layers/api/api_layer.h"
#include "layers/application/AdapterConfig.h"
#include "layers/application/application_layer.h"
#include "layers/common/logging.h"

namespace {

struct StartupOptions {
    std::string configPath;
    std::string bindAddress = "127.0.0.1";
    std::uint16_t apiPort = 8080;
    bool apiEnabled = true;

    std::optional<bool> autoRegister;
    std::optional<std::uint32_t> pollIntervalMs;
    std::optional<std::string> adbPath;

    bool verbose = false;
    bool showHelp = false;
};

void printUsage() {
    std::cout
        << "Usage: tvlink [options]\n"
        << "Options:\n"
        << "  --config <path>                JSON configuration file\n"
        << "  --bind <ip>                    API bind address (default: 127.0.0.1)\n"
        << "  --api-port <port>              API TCP port (default: 8080)\n"
        << "  --no-api                       Do not start the JSON-RPC API\n"
        << "\n"
        << "  Overrides of configuration values:\n"
        << "    --auto-register              Register discovered devices automatically\n"
        << "    --poll-interval-ms <ms>      Default poll interval\n"
        << "    --adb <path>                 adb executable (default: adb from PATH)\n"
        << "\n"
        << "  Other:\n"
        << "    --verbose                    Print debug log lines\n"
        << "    --help                       Show this help\n";
}

template <typename UInt>
bool parseUnsigned(const std::string& text, UInt& out) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        unsigned long long value = std::stoull(text);
        if (value > static_cast<unsigned long long>(std::numeric_limits<UInt>::max())) {
            return false;
        }
        out = static_cast<UInt>(value);
        return true;
    } catch (const std::out_of_range&) {
        return false;
    }
}

std::optional<StartupOptions> parseArgs(int argc, char* argv[], std::string& error) {
    StartupOptions options;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];

        auto getValue = [&](const std::string& key) -> std::optional<std::string> {
            if (i + 1 >= argc) {
                error = "Missing value for " + key;
                return std::nullopt;
            }
            ++i;
            return std::string(argv[i]);
        };

        if (arg == "--help") {
            options.showHelp = true;
            continue;
        }
        if (arg == "--verbose") {
            options.verbose = true;
            continue;
        }
        if (arg == "--no-api") {
            options.apiEnabled = false;
            continue;
        }
        if (arg == "--auto-register") {
            options.autoRegister = true;
            continue;
        }
        if (arg == "--config") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.configPath = *value;
            continue;
        }
        if (arg == "--bind") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.bindAddress = *value;
            continue;
        }
        if (arg == "--api-port") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            if (!parseUnsigned(*value, options.apiPort) || options.apiPort == 0) {
                error = "Invalid --api-port value: " + *value;
                return std::nullopt;
            }
            continue;
        }
        if (arg == "--poll-interval-ms") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            std::uint32_t ms = 0;
            if (!parseUnsigned(*value, ms) || ms < 500) {
                error = "Invalid --poll-interval-ms value (>= 500): " + *value;
                return std::nullopt;
            }
            options.pollIntervalMs = ms;
            continue;
        }
        if (arg == "--adb") {
            auto value = getValue(arg);
            if (!value) return std::nullopt;
            options.adbPath = *value;
            continue;
        }

        error = "Unknown argument: " + arg;
        return std::nullopt;
    }

    return options;
}

// Prints every state write as one JSON line on stdout.
class ConsoleStateSink final : public application::StateSink {
public:
    void writeState(const std::string& deviceId, const std::string& name, const boost::json::value& value) override {
        boost::json::object line;
        line["device"] = deviceId;
        line["name"] = name;
        line["value"] = value;
        std::lock_guard<std::mutex> lock(mutex_);
        std::cout << "[state] " << boost::json::serialize(line) << std::endl;
    }

private:
    std::mutex mutex_;
};

logging::Logger makeConsoleLogger(bool verbose) {
    auto mutex = std::make_shared<std::mutex>();
    return logging::Logger([mutex, verbose](logging::LogLevel level, const std::string& message) {
        if (level == logging::LogLevel::Debug && !verbose) {
            return;
        }
        std::lock_guard<std::mutex> lock(*mutex);
        auto& stream = level == logging::LogLevel::Warning || level == logging::LogLevel::Error ? std::cerr : std::cout;
        stream << "[" << logging::toString(level) << "] " << message << std::endl;
    });
}

application::AdapterConfig loadConfiguration(const StartupOptions& options, const logging::Logger& logger) {
    std::vector<std::string> warnings;
    auto config = application::loadAdapterConfigOrDefaults(options.configPath, warnings, logger);

    if (options.autoRegister) {
        config.autoRegister = *options.autoRegister;
    }
    if (options.pollIntervalMs) {
        config.pollInterval = std::chrono::milliseconds(*options.pollIntervalMs);
    }
    if (options.adbPath) {
        config.adbPath = *options.adbPath;
    }
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    std::string parseError;
    const auto parsed = parseArgs(argc, argv, parseError);
    if (!parsed) {
        std::cerr << parseError << "\n\n";
        printUsage();
        return 2;
    }

    const auto options = *parsed;
    if (options.showHelp) {
        printUsage();
        return 0;
    }

    const auto logger = makeConsoleLogger(options.verbose);

    const auto config = loadConfiguration(options, logger);

    transport::AdbCliClient client(config.adbPath, logger);
    ConsoleStateSink sink;
    application::AdapterCore adapter(client, sink, logger);

    std::vector<std::string> warnings;
    std::string error;
    if (!adapter.start(config, warnings, error)) {
        std::cerr << "Failed to start: " << error << std::endl;
        return 1;
    }

    std::optional<api::HttpJsonServer> server;
    if (options.apiEnabled) {
        server.emplace(adapter, options.bindAddress, options.apiPort, logger);
        if (!server->start(error)) {
            std::cerr << error << std::endl;
            adapter.shutdown();
            return 1;
        }
        std::cout << "HTTP JSON API started on " << options.bindAddress << ':' << options.apiPort << std::endl;
    }

    boost::asio::io_context signalContext;
    boost::asio::signal_set signals(signalContext, SIGINT, SIGTERM);
    signals.async_wait([&logger](const boost::system::error_code& ec, int signalNumber) {
        if (!ec) {
            logger.info("Signal " + std::to_string(signalNumber) + " received, shutting down");
        }
    });
    signalContext.run();

    // Sessions first: the API server only stops accepting once its thread is idle.
    adapter.shutdown();
    if (server) {
        server->stop();
    }
    return 0;
}
