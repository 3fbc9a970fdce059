#include "jobs/BackoffPolicy.hpp"

#include <algorithm>

using namespace wb::jobs;

std::chrono::milliseconds BackoffPolicy::delayFor(const unsigned int attempt) const {
    if (attempt == 0 || initialDelay.count() <= 0) return std::chrono::milliseconds::zero();

    if (kind == Kind::Linear) {
        const auto steps = static_cast<long double>(attempt);
        if (steps * initialDelay.count() >= maxDelay.count()) return maxDelay;
        return initialDelay * attempt;
    }

    auto delay = initialDelay;
    for (unsigned int i = 1; i < attempt; ++i) {
        if (delay >= maxDelay / 2) return maxDelay;
        delay *= 2;
    }
    return std::min(delay, maxDelay);
}
