#include "DiscoveryBridge.h"

#include <algorithm>
#include <cctype>

namespace application {

namespace {

constexpr int kMaxConsecutiveSourceErrors = 16;

bool endsWith(const std::string& text, const std::string& suffix) {
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

DiscoveryBridge::DiscoveryBridge(DeviceRegistry& registry, logging::Logger logger)
    : registry_(registry), logger_(std::move(logger)) {}

DiscoveryBridge::~DiscoveryBridge() {
    stop();
}

void DiscoveryBridge::start(std::shared_ptr<DiscoverySource> source) {
    if (!source || running_.exchange(true)) {
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        source_ = std::move(source);
    }
    thread_ = std::thread([this]() { run(); });
}

void DiscoveryBridge::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    std::shared_ptr<DiscoverySource> source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        source = source_;
    }
    if (source) {
        source->stop();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

bool DiscoveryBridge::handle(const DiscoveryEvent& event) {
    std::string address;
    std::string error;
    if (!normalizeAddress(event.address, address, error)) {
        ++rejected_;
        logger_.warning("Discovery event rejected: " + error);
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (seen_.count(address) != 0) {
            ++duplicates_;
            return false;
        }
    }

    DeviceDescriptor descriptor;
    descriptor.address = address;
    descriptor.displayName = cleanName(event.name);
    descriptor.enabled = true;

    const auto outcome = registry_.upsert(descriptor, DeviceSource::Discovery, error);
    if (outcome == UpsertOutcome::Rejected) {
        ++rejected_;
        logger_.warning("Discovery event for " + address + " rejected: " + error);
        return false;
    }

    if (outcome == UpsertOutcome::Ignored) {
        return false;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        seen_.insert(address);
    }
    ++accepted_;
    logger_.debug("Discovered " + address + " (" + descriptor.displayName + "): " + toString(outcome));
    return true;
}

std::string DiscoveryBridge::cleanName(const std::string& raw) {
    auto begin = std::find_if_not(raw.begin(), raw.end(), [](unsigned char c) { return std::isspace(c) != 0; });
    auto end = std::find_if_not(raw.rbegin(), raw.rend(), [](unsigned char c) { return std::isspace(c) != 0; }).base();
    std::string name = begin < end ? std::string(begin, end) : std::string{};

    for (const auto* suffix : {"._adb._tcp.local.", "._adb._tcp.local", ".local.", ".local"}) {
        if (endsWith(name, suffix)) {
            name.resize(name.size() - std::char_traits<char>::length(suffix));
            break;
        }
    }
    return name;
}

void DiscoveryBridge::run() {
    std::shared_ptr<DiscoverySource> source;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        source = source_;
    }

    int consecutiveErrors = 0;
    while (running_) {
        std::optional<DiscoveryEvent> event;
        try {
            event = source->next();
            consecutiveErrors = 0;
        } catch (const std::exception& e) {
            ++rejected_;
            logger_.warning(std::string("Discovery source error: ") + e.what());
            if (++consecutiveErrors >= kMaxConsecutiveSourceErrors) {
                logger_.error("Discovery source failed " + std::to_string(consecutiveErrors) + " times in a row, giving up");
                break;
            }
            continue;
        }

        if (!event) {
            break;
        }
        handle(*event);
    }
    logger_.debug("Discovery stream ended");
}

} // namespace application
