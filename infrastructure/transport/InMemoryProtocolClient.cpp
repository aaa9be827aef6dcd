#include "InMemoryProtocolClient.h"

#include <algorithm>

namespace transport {

bool InMemoryProtocolClient::startServer(std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (serverStartFails_) {
        error = "cannot start server";
        return false;
    }
    ++serverStarts_;
    serverRunning_ = true;
    return true;
}

void InMemoryProtocolClient::stopServer() {
    std::lock_guard<std::mutex> lock(mutex_);
    ++serverStops_;
    serverRunning_ = false;
}

std::optional<protocol::ConnectionHandle> InMemoryProtocolClient::connect(const std::string& address, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    ++connectAttempts_[address];

    if (!serverRunning_) {
        error = "server not running";
        return std::nullopt;
    }

    auto it = reachable_.find(address);
    if (it != reachable_.end() && !it->second) {
        error = "failed to connect to " + address + ": Connection refused";
        return std::nullopt;
    }

    const auto handle = nextHandle_++;
    connections_[handle].address = address;
    return handle;
}

protocol::ShellOutput InMemoryProtocolClient::executeShell(protocol::ConnectionHandle handle, const std::string& command,
                                                           std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);

    auto it = connections_.find(handle);
    if (it == connections_.end() || it->second.lost) {
        return {protocol::ShellStatus::ConnectionLost, {}, "device not found"};
    }

    const auto address = it->second.address;
    executed_[address].push_back(command);

    auto& connection = it->second;
    ++connection.inFlight;
    maxConcurrent_ = std::max(maxConcurrent_, connection.inFlight);

    protocol::ShellOutput output;
    if (delay_.count() > 0) {
        const auto wait = std::min(delay_, timeout);
        const bool aborted = abortCv_.wait_for(lock, wait, [this, handle]() {
            auto c = connections_.find(handle);
            return c == connections_.end() || c->second.aborted || c->second.lost;
        });
        if (aborted) {
            output = {protocol::ShellStatus::ConnectionLost, {}, "connection closed"};
        } else if (delay_ > timeout) {
            output = {protocol::ShellStatus::Timeout, {}, "command timed out"};
        }
    }

    auto current = connections_.find(handle);
    if (current != connections_.end()) {
        --current->second.inFlight;
        if (current->second.aborted && current->second.inFlight == 0) {
            connections_.erase(current);
        }
    }
    if (output.status != protocol::ShellStatus::Ok) {
        return output;
    }

    auto status = statuses_.find({address, command});
    if (status != statuses_.end() && status->second != protocol::ShellStatus::Ok) {
        return {status->second, {}, "scripted failure"};
    }

    auto response = responses_.find({address, command});
    if (response != responses_.end()) {
        return {protocol::ShellStatus::Ok, response->second, {}};
    }
    auto fallback = defaultResponses_.find(command);
    if (fallback != defaultResponses_.end()) {
        return {protocol::ShellStatus::Ok, fallback->second, {}};
    }
    return {protocol::ShellStatus::Ok, {}, {}};
}

bool InMemoryProtocolClient::disconnect(protocol::ConnectionHandle handle, std::string& error) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connections_.find(handle);
    if (it == connections_.end()) {
        error = "unknown handle " + std::to_string(handle);
        return false;
    }
    it->second.aborted = true;
    if (it->second.inFlight == 0) {
        connections_.erase(it);
    }
    ++disconnects_;
    abortCv_.notify_all();
    return true;
}

void InMemoryProtocolClient::setReachable(const std::string& address, bool reachable) {
    std::lock_guard<std::mutex> lock(mutex_);
    reachable_[address] = reachable;
}

void InMemoryProtocolClient::setResponse(const std::string& address, const std::string& command, const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    responses_[{address, command}] = output;
}

void InMemoryProtocolClient::setDefaultResponse(const std::string& command, const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    defaultResponses_[command] = output;
}

void InMemoryProtocolClient::setStatus(const std::string& address, const std::string& command, protocol::ShellStatus status) {
    std::lock_guard<std::mutex> lock(mutex_);
    statuses_[{address, command}] = status;
}

void InMemoryProtocolClient::clearStatus(const std::string& address, const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    statuses_.erase({address, command});
}

void InMemoryProtocolClient::setCommandDelay(std::chrono::milliseconds delay) {
    std::lock_guard<std::mutex> lock(mutex_);
    delay_ = delay;
}

void InMemoryProtocolClient::setServerStartFails(bool fails) {
    std::lock_guard<std::mutex> lock(mutex_);
    serverStartFails_ = fails;
}

void InMemoryProtocolClient::dropConnections(const std::string& address) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [_, connection] : connections_) {
        if (connection.address == address) {
            connection.lost = true;
        }
    }
    abortCv_.notify_all();
}

std::vector<std::string> InMemoryProtocolClient::executed(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = executed_.find(address);
    return it == executed_.end() ? std::vector<std::string>{} : it->second;
}

std::size_t InMemoryProtocolClient::connectAttempts(const std::string& address) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = connectAttempts_.find(address);
    return it == connectAttempts_.end() ? 0 : it->second;
}

std::size_t InMemoryProtocolClient::maxConcurrentPerHandle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return maxConcurrent_;
}

std::size_t InMemoryProtocolClient::openConnections() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<std::size_t>(std::count_if(connections_.begin(), connections_.end(),
                                                  [](const auto& item) { return !item.second.aborted; }));
}

std::size_t InMemoryProtocolClient::disconnects() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return disconnects_;
}

std::size_t InMemoryProtocolClient::serverStarts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serverStarts_;
}

std::size_t InMemoryProtocolClient::serverStops() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serverStops_;
}

bool InMemoryProtocolClient::serverRunning() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return serverRunning_;
}

} // namespace transport
