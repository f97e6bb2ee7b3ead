#ifndef LOGRETRY_FULL_JITTER_H
#define LOGRETRY_FULL_JITTER_H

#include <chrono>

namespace logretry {

// Uniform draw in [0, v] from a generator private to the calling thread.
std::chrono::microseconds fullJitter(std::chrono::microseconds v);

} // namespace logretry

#endif // LOGRETRY_FULL_JITTER_H
