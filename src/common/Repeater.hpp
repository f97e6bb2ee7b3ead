#ifndef LOGRETRY_REPEATER_H
#define LOGRETRY_REPEATER_H

#include <functional>
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include <string>

namespace logretry {

// Runs an operation until it succeeds, fails fatally or the policy's attempts
// are spent. The policy is checked on construction. Holds no per-call state,
// so one instance may serve many threads.
class Repeater {
public:
    explicit Repeater(RetryPolicy p);
    Result attempt(const std::string& op, const std::function<Result()>& fn) const;
    const RetryPolicy policy;
};

} // namespace logretry

#endif // LOGRETRY_REPEATER_H
