#pragma once

#include <chrono>
#include <cstdint>
#include <random>

namespace transport {

struct ReconnectSettings {
    std::chrono::milliseconds baseDelay{2000};
    std::chrono::milliseconds maxDelay{120000};
    double jitter = 0.1; // fraction of the nominal delay, applied as +/-
};

// Exponential backoff: the first failure waits baseDelay, each further one doubles it up to maxDelay.
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(ReconnectSettings settings);
    ReconnectPolicy(ReconnectSettings settings, std::uint32_t seed);

    std::chrono::milliseconds nominalDelay(std::uint32_t failureCount) const;
    std::chrono::milliseconds nextDelay(std::uint32_t failureCount);

    const ReconnectSettings& settings() const noexcept { return settings_; }

private:
    ReconnectSettings settings_;
    std::mt19937 rng_;
};

} // namespace transport
