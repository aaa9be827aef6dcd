#include "ReconnectPolicy.h"

#include <algorithm>

namespace transport {

ReconnectPolicy::ReconnectPolicy(ReconnectSettings settings)
    : ReconnectPolicy(settings, std::random_device{}()) {}

ReconnectPolicy::ReconnectPolicy(ReconnectSettings settings, std::uint32_t seed)
    : settings_(settings), rng_(seed) {
    if (settings_.baseDelay.count() < 1) {
        settings_.baseDelay = std::chrono::milliseconds(1);
    }
    settings_.maxDelay = std::max(settings_.maxDelay, settings_.baseDelay);
    settings_.jitter = std::clamp(settings_.jitter, 0.0, 1.0);
}

std::chrono::milliseconds ReconnectPolicy::nominalDelay(std::uint32_t failureCount) const {
    const auto cap = settings_.maxDelay.count();
    auto delay = settings_.baseDelay.count();

    // failureCount 0 (after a success) and 1 both yield the base delay.
    for (std::uint32_t i = 1; i < failureCount && delay < cap; ++i) {
        delay = delay > cap / 2 ? cap : delay * 2;
    }
    return std::chrono::milliseconds(std::min(delay, cap));
}

std::chrono::milliseconds ReconnectPolicy::nextDelay(std::uint32_t failureCount) {
    const auto nominal = nominalDelay(failureCount);
    if (settings_.jitter <= 0.0) {
        return nominal;
    }

    std::uniform_real_distribution<double> dist(-settings_.jitter, settings_.jitter);
    const auto jittered = static_cast<double>(nominal.count()) * (1.0 + dist(rng_));
    return std::chrono::milliseconds(std::max<std::int64_t>(0, static_cast<std::int64_t>(jittered)));
}

} // namespace transport
