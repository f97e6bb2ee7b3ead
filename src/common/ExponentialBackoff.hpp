#ifndef LOGRETRY_EXPONENTIAL_BACKOFF_H
#define LOGRETRY_EXPONENTIAL_BACKOFF_H

#include "common/RetryPolicy.hpp"
#include <optional>
#include <chrono>

namespace logretry {

class ExponentialBackoff {
public:
    ExponentialBackoff(std::chrono::microseconds base, std::chrono::microseconds max, int steps);
    std::optional<std::chrono::microseconds> nextDelay();
    void reset();
private:
    std::chrono::microseconds baseDelay;
    std::chrono::microseconds maxDelay;
    int steps;
    int attempt{0};
};

// Policy waiting base, 2*base, 4*base... capped at max between its attempts.
RetryPolicy exponentialPolicy(int attempts, std::chrono::microseconds base, std::chrono::microseconds max, bool jitter = false);

} // namespace logretry

#endif // LOGRETRY_EXPONENTIAL_BACKOFF_H
