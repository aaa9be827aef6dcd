#pragma once

#include <cstddef>
#include <mutex>
#include <string>

#include "layers/common/logging.h"
#include "layers/protocol/protocol_layer.h"

namespace transport {

// Reference-counted access to the protocol client's local server process.
// The first acquire() starts it, the last release() stops it.
class ServerLease {
public:
    ServerLease(protocol::ProtocolClient& client, logging::Logger logger);

    ServerLease(const ServerLease&) = delete;
    ServerLease& operator=(const ServerLease&) = delete;

    bool acquire(std::string& error);
    void release();

    std::size_t users() const;
    bool running() const;

private:
    protocol::ProtocolClient& client_;
    logging::Logger logger_;

    mutable std::mutex mutex_;
    std::size_t users_ = 0;
    bool running_ = false;
};

} // namespace transport
