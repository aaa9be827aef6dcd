#include "api_layer.h"

#include <boost/beast/version.hpp>

#include <algorithm>
#include <chrono>
#include <utility>

namespace api {

namespace beast = boost::beast;
namespace http = beast::http;
namespace json = boost::json;
using tcp = boost::asio::ip::tcp;

namespace {

bool readStringParam(const json::object& params, const char* key, std::string& out) {
    if (!params.contains(key) || !params.at(key).is_string()) {
        return false;
    }
    out = std::string(params.at(key).as_string().c_str());
    return true;
}

// Key codes may arrive as JSON numbers.
bool readKeyParam(const json::object& params, std::string& out) {
    if (!params.contains("key")) {
        return false;
    }
    const auto& value = params.at("key");
    if (value.is_int64()) {
        if (value.as_int64() < 0) {
            return false;
        }
        out = std::to_string(value.as_int64());
        return true;
    }
    return readStringParam(params, "key", out);
}

int errorCodeFor(transport::CommandError error) {
    switch (error) {
    case transport::CommandError::InvalidArgument:
        return InvalidParams;
    case transport::CommandError::NotConnected:
        return DeviceNotConnected;
    case transport::CommandError::SessionClosed:
        return DeviceClosed;
    case transport::CommandError::Timeout:
        return CommandTimedOut;
    case transport::CommandError::ExecutionFailed:
        return CommandFailed;
    case transport::CommandError::ConnectionLost:
        return LinkLost;
    case transport::CommandError::None:
        break;
    }
    return OperationFailed;
}

} // namespace

json::object toJson(const application::DeviceSnapshot& snapshot) {
    json::object out;
    out["id"] = snapshot.device.id;
    out["address"] = snapshot.device.address;
    out["name"] = snapshot.device.displayName;
    out["enabled"] = snapshot.device.enabled;
    out["source"] = application::toString(snapshot.device.source);
    out["discovered"] = snapshot.device.discovered;
    out["connection"] = transport::toString(snapshot.sessionState);
    out["failureCount"] = snapshot.failureCount;
    if (snapshot.nextRetryAt) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            *snapshot.nextRetryAt - std::chrono::steady_clock::now());
        out["retryInMs"] = std::max<std::int64_t>(0, remaining.count());
    } else {
        out["retryInMs"] = nullptr;
    }
    if (snapshot.hasState) {
        out["state"] = protocol::toJson(snapshot.state);
    } else {
        out["state"] = nullptr;
    }
    return out;
}

ApiController::ApiController(application::AdapterCore& adapter)
    : adapter_(adapter) {}

json::value ApiController::processRequest(const json::value& request) {
    if (request.is_array()) {
        return processBatch(request.as_array());
    }

    if (!request.is_object()) {
        return errorResponse(nullptr, InvalidRequest, "Invalid JSON-RPC payload");
    }

    return processSingle(request.as_object());
}

json::array ApiController::processBatch(const json::array& requests) {
    json::array responses;
    for (const auto& item : requests) {
        if (!item.is_object()) {
            responses.emplace_back(errorResponse(nullptr, InvalidRequest, "Batch item must be object"));
            continue;
        }
        responses.emplace_back(processSingle(item.as_object()));
    }
    return responses;
}

json::value ApiController::processSingle(const json::object& req) {
    const json::value id = req.contains("id") ? req.at("id") : json::value(nullptr);

    if (!req.contains("method") || !req.at("method").is_string()) {
        return errorResponse(id, InvalidRequest, "Missing method");
    }

    const std::string method = req.at("method").as_string().c_str();
    const json::object params = req.contains("params") && req.at("params").is_object()
                                    ? req.at("params").as_object()
                                    : json::object{};

    if (method == "ping") {
        json::object result;
        result["status"] = adapter_.running() ? "ok" : "stopped";
        result["service"] = "tvlink";
        return okResponse(id, result);
    }

    if (method == "devices.list") {
        json::array devices;
        for (const auto& snapshot : adapter_.listDevices()) {
            devices.push_back(toJson(snapshot));
        }
        return okResponse(id, json::object{{"devices", devices}});
    }

    if (method.rfind("device.", 0) != 0) {
        return errorResponse(id, MethodNotFound, "Method not found");
    }

    if (!params.contains("device")) {
        return errorResponse(id, InvalidParams, "device is required");
    }
    const auto deviceId = resolveDevice(params);
    if (!deviceId) {
        return errorResponse(id, UnknownDevice, "Unknown device");
    }

    if (method == "device.state") {
        const auto snapshot = adapter_.device(*deviceId);
        if (!snapshot) {
            return errorResponse(id, UnknownDevice, "Unknown device");
        }
        return okResponse(id, toJson(*snapshot));
    }

    if (method == "device.setEnabled") {
        if (!params.contains("enabled") || !params.at("enabled").is_bool()) {
            return errorResponse(id, InvalidParams, "enabled (bool) is required");
        }
        std::string error;
        if (!adapter_.setEnabled(*deviceId, params.at("enabled").as_bool(), error)) {
            return errorResponse(id, OperationFailed, error);
        }
        return okResponse(id, json::object{{"device", *deviceId}, {"enabled", params.at("enabled").as_bool()}});
    }

    if (method == "device.poll") {
        std::string error;
        if (!adapter_.pollNow(*deviceId, error)) {
            return errorResponse(id, OperationFailed, error);
        }
        const auto snapshot = adapter_.device(*deviceId);
        if (!snapshot) {
            return errorResponse(id, UnknownDevice, "Unknown device");
        }
        return okResponse(id, toJson(*snapshot));
    }

    if (method == "device.sendKey") {
        std::string key;
        if (!readKeyParam(params, key)) {
            return errorResponse(id, InvalidParams, "key is required");
        }
        return commandResponse(id, adapter_.sendKey(*deviceId, key));
    }

    if (method == "device.launchApp" || method == "device.stopApp") {
        std::string packageId;
        if (!readStringParam(params, "package", packageId)) {
            return errorResponse(id, InvalidParams, "package is required");
        }
        return commandResponse(id, method == "device.launchApp" ? adapter_.launchApp(*deviceId, packageId)
                                                                : adapter_.stopApp(*deviceId, packageId));
    }

    if (method == "device.sendText") {
        std::string text;
        if (!readStringParam(params, "text", text)) {
            return errorResponse(id, InvalidParams, "text is required");
        }
        return commandResponse(id, adapter_.sendText(*deviceId, text));
    }

    if (method == "device.reboot") {
        return commandResponse(id, adapter_.reboot(*deviceId));
    }

    if (method == "device.shell") {
        std::string command;
        if (!readStringParam(params, "command", command)) {
            return errorResponse(id, InvalidParams, "command is required");
        }
        return commandResponse(id, adapter_.shell(*deviceId, command));
    }

    return errorResponse(id, MethodNotFound, "Method not found");
}

// "device" may be the device id or its address.
std::optional<std::string> ApiController::resolveDevice(const json::object& params) const {
    std::string value;
    if (!readStringParam(params, "device", value) || value.empty()) {
        return std::nullopt;
    }
    if (adapter_.device(value)) {
        return value;
    }
    if (auto* registry = adapter_.registry()) {
        return registry->findIdByAddress(value);
    }
    return std::nullopt;
}

json::value ApiController::commandResponse(const json::value& id, const transport::CommandResult& result) const {
    if (!result.success) {
        auto response = errorResponse(id, errorCodeFor(result.code), result.error);
        response.as_object()["error"].as_object()["data"] = json::object{{"reason", transport::toString(result.code)}};
        return response;
    }
    return okResponse(id, json::object{{"accepted", true}, {"output", result.rawOutput}});
}

json::value ApiController::errorResponse(const json::value& id, int code, const std::string& message) const {
    json::object r;
    r["jsonrpc"] = "2.0";
    r["id"] = id;
    json::object e;
    e["code"] = code;
    e["message"] = message;
    r["error"] = e;
    return r;
}

json::value ApiController::okResponse(const json::value& id, const json::value& result) const {
    json::object r;
    r["jsonrpc"] = "2.0";
    r["id"] = id;
    r["result"] = result;
    return r;
}

HttpJsonServer::HttpJsonServer(application::AdapterCore& adapter, std::string bindAddress, std::uint16_t port,
                               logging::Logger logger)
    : adapter_(adapter), bindAddress_(std::move(bindAddress)), port_(port), logger_(std::move(logger)) {}

HttpJsonServer::~HttpJsonServer() {
    stop();
}

bool HttpJsonServer::start(std::string& error) {
    if (running_) {
        return true;
    }

    boost::system::error_code ec;
    const auto address = boost::asio::ip::make_address(bindAddress_, ec);
    if (ec) {
        error = "Invalid bind address " + bindAddress_ + ": " + ec.message();
        return false;
    }

    auto acceptor = std::make_unique<tcp::acceptor>(ioContext_);
    const tcp::endpoint endpoint{address, port_};
    acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        acceptor->set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        error = "Cannot listen on " + bindAddress_ + ":" + std::to_string(port_) + ": " + ec.message();
        return false;
    }

    const auto bound = acceptor->local_endpoint(ec);
    if (!ec) {
        port_ = bound.port();
    }

    acceptor_ = std::move(acceptor);
    running_ = true;
    ioContext_.restart();
    doAccept();
    serverThread_ = std::thread([this]() { ioContext_.run(); });
    return true;
}

std::uint16_t HttpJsonServer::port() const {
    return port_;
}

void HttpJsonServer::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    ioContext_.stop();
    if (serverThread_.joinable()) {
        serverThread_.join();
    }

    // Server thread is gone; the acceptor can be closed from here.
    boost::system::error_code ec;
    if (acceptor_) {
        acceptor_->close(ec);
    }
}

void HttpJsonServer::doAccept() {
    acceptor_->async_accept([this](const boost::system::error_code& ec, tcp::socket socket) {
        if (!running_) {
            return;
        }
        if (ec) {
            logger_.debug("API accept failed: " + ec.message());
        } else {
            handleSession(std::move(socket));
        }
        doAccept();
    });
}

void HttpJsonServer::handleSession(tcp::socket socket) {
    beast::flat_buffer buffer;
    http::request<http::string_body> req;
    boost::system::error_code ec;

    http::read(socket, buffer, req, ec);
    if (ec) {
        logger_.debug("API read failed: " + ec.message());
        return;
    }

    http::response<http::string_body> res;
    res.version(req.version());
    res.keep_alive(false);
    res.set(http::field::server, BOOST_BEAST_VERSION_STRING);
    res.set(http::field::content_type, "application/json");

    if (req.method() != http::verb::post) {
        res.result(http::status::method_not_allowed);
        res.body() = R"({"jsonrpc":"2.0","id":null,"error":{"code":-32600,"message":"Only POST method is supported"}})";
        res.prepare_payload();
        http::write(socket, res, ec);
        return;
    }

    json::error_code parseEc;
    const auto payload = json::parse(req.body(), parseEc);
    if (parseEc) {
        res.result(http::status::bad_request);
        res.body() = R"({"jsonrpc":"2.0","id":null,"error":{"code":-32700,"message":"Parse error: invalid JSON"}})";
        res.prepare_payload();
        http::write(socket, res, ec);
        return;
    }

    ApiController controller(adapter_);
    const auto response = controller.processRequest(payload);

    res.result(http::status::ok);
    res.body() = json::serialize(response);
    res.prepare_payload();

    http::write(socket, res, ec);
    if (ec) {
        logger_.debug("API write failed: " + ec.message());
    }

    socket.shutdown(tcp::socket::shutdown_both, ec);
}

} // namespace api
