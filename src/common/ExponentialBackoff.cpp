#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

#include <algorithm>
#include <optional>
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <utility>
#include <vector>

namespace logretry {

ExponentialBackoff::ExponentialBackoff(std::chrono::microseconds base, std::chrono::microseconds max, int s)
    : baseDelay {base},
      maxDelay {max},
      steps {s} {
    if (base < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Base delay must be >= zero.");
    }
    if (max < base) {
        throw std::invalid_argument("Max delay must be >= base delay.");
    }
}

std::optional<std::chrono::microseconds> ExponentialBackoff::nextDelay() {
    if (attempt >= steps) {
        return std::nullopt;
    }
    auto baseCount = static_cast<uint64_t>(baseDelay.count());
    auto maxCount = static_cast<uint64_t>(maxDelay.count());
    // Past 63 doublings the shift overflows, and the cap is reached long before.
    auto shift = static_cast<unsigned int>(std::min(attempt, 62));
    auto delay = baseCount > (maxCount >> shift) ? maxCount : baseCount << shift;
    attempt++;
    return std::chrono::microseconds(std::min(delay, maxCount));
}

void ExponentialBackoff::reset() {
    attempt = 0;
}

RetryPolicy exponentialPolicy(int attempts, std::chrono::microseconds base, std::chrono::microseconds max, bool jitter) {
    ExponentialBackoff backoff {base, max, std::max(attempts - 1, 1)};
    std::vector<std::chrono::microseconds> delays;
    while (auto delay = backoff.nextDelay()) {
        delays.push_back(*delay);
    }
    return RetryPolicy{attempts, std::move(delays), jitter};
}

} // namespace logretry
