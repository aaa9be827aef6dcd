#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <thread>

#include "layers/application/application_layer.h"
#include "layers/common/logging.h"

namespace api {

// JSON-RPC error codes beyond the reserved -32xxx range used for protocol errors.
enum ErrorCode : int {
    ParseError = -32700,
    InvalidRequest = -32600,
    MethodNotFound = -32601,
    InvalidParams = -32602,
    UnknownDevice = -32001,
    OperationFailed = -32002,
    DeviceNotConnected = -32010,
    DeviceClosed = -32011,
    CommandTimedOut = -32012,
    CommandFailed = -32013,
    LinkLost = -32014
};

class ApiController {
public:
    explicit ApiController(application::AdapterCore& adapter);

    boost::json::value processRequest(const boost::json::value& request);
    boost::json::array processBatch(const boost::json::array& requests);

private:
    boost::json::value processSingle(const boost::json::object& req);
    boost::json::value commandResponse(const boost::json::value& id, const transport::CommandResult& result) const;
    std::optional<std::string> resolveDevice(const boost::json::object& params) const;

    boost::json::value errorResponse(const boost::json::value& id, int code, const std::string& message) const;
    boost::json::value okResponse(const boost::json::value& id, const boost::json::value& result) const;

    application::AdapterCore& adapter_;
};

boost::json::object toJson(const application::DeviceSnapshot& snapshot);

class HttpJsonServer {
public:
    HttpJsonServer(application::AdapterCore& adapter, std::string bindAddress, std::uint16_t port, logging::Logger logger);
    ~HttpJsonServer();

    bool start(std::string& error);
    void stop();

    // Bound port; differs from the requested one when 0 was asked for.
    std::uint16_t port() const;

private:
    void doAccept();
    void handleSession(boost::asio::ip::tcp::socket socket);

    application::AdapterCore& adapter_;
    std::string bindAddress_;
    std::uint16_t port_;
    logging::Logger logger_;

    boost::asio::io_context ioContext_;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;
    std::atomic<bool> running_{false};
    std::thread serverThread_;
};

} // namespace api
