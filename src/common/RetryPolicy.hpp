// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * LogRetry a retrying log drain.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#ifndef LOGRETRY_RETRY_POLICY_H
#define LOGRETRY_RETRY_POLICY_H

#include "common/Error.hpp"
#include <chrono>
#include <functional>
#include <vector>

namespace logretry {

struct RetryPolicy {
    using Classifier = std::function<bool(const Error&)>;

    RetryPolicy(
        int attempts,
        std::chrono::microseconds delay,
        bool jitter = false,
        Classifier classifier = isTransient
    );
    RetryPolicy(
        int attempts,
        std::vector<std::chrono::microseconds> delays,
        bool jitter = false,
        Classifier classifier = isTransient
    );

    // Throws std::invalid_argument unless the fields still hold a usable policy.
    void validate() const;

    // Delay after the given failed attempt (1-based). Past the end of the
    // sequence the last value is reused.
    std::chrono::microseconds delayFor(int attempt) const;

    Outcome classify(const Result& result) const;

    // Includes the first attempt.
    int maxAttempts;
    std::vector<std::chrono::microseconds> delays;
    bool jitter;
    Classifier transient;
};

// Five attempts, waiting 1s, 2s, 3s and 4s in between.
RetryPolicy defaultRetryPolicy();

} // namespace logretry

#endif // LOGRETRY_RETRY_POLICY_H
