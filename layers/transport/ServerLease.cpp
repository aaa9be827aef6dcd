#include "ServerLease.h"

namespace transport {

ServerLease::ServerLease(protocol::ProtocolClient& client, logging::Logger logger)
    : client_(client), logger_(std::move(logger)) {}

bool ServerLease::acquire(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
        if (!client_.startServer(error)) {
            logger_.warning("Failed to start protocol server: " + error);
            return false;
        }
        running_ = true;
        logger_.info("Protocol server started");
    }
    ++users_;
    return true;
}

void ServerLease::release() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (users_ == 0) {
        return;
    }
    if (--users_ == 0 && running_) {
        client_.stopServer();
        running_ = false;
        logger_.info("Protocol server stopped");
    }
}

std::size_t ServerLease::users() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return users_;
}

bool ServerLease::running() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return running_;
}

} // namespace transport
