#pragma once

#include <chrono>

namespace wb::jobs {

struct BackoffPolicy {
    enum class Kind { Exponential, Linear };

    Kind kind = Kind::Exponential;
    std::chrono::milliseconds initialDelay = std::chrono::seconds(30);
    std::chrono::milliseconds maxDelay = std::chrono::hours(5);

    // Delay before re-run number `attempt` (1-based): initial * 2^(attempt-1) for
    // exponential, initial * attempt for linear, never above maxDelay.
    [[nodiscard]] std::chrono::milliseconds delayFor(unsigned int attempt) const;
};

}
