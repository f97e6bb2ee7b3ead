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
#include "common/RetryPolicy.hpp"
#include "common/Error.hpp"
#include <algorithm>
#include <stdexcept>
#include <chrono>
#include <cstddef>
#include <utility>
#include <vector>

namespace logretry {

RetryPolicy::RetryPolicy(
    int attempts,
    std::chrono::microseconds delay,
    bool j,
    Classifier classifier)
    : RetryPolicy(attempts, std::vector<std::chrono::microseconds>{delay}, j, std::move(classifier)) {}

RetryPolicy::RetryPolicy(
    int attempts,
    std::vector<std::chrono::microseconds> d,
    bool j,
    Classifier classifier)
    : maxAttempts(attempts),
      delays(std::move(d)),
      jitter(j),
      transient(std::move(classifier)) {
    validate();
}

void RetryPolicy::validate() const {
    if (maxAttempts < 1) {
        throw std::invalid_argument("Max attempts must be >= one.");
    }
    if (delays.empty()) {
        throw std::invalid_argument("Delay sequence must not be empty.");
    }
    if (std::any_of(delays.begin(), delays.end(),
            [](std::chrono::microseconds v) { return v < std::chrono::microseconds::zero(); })) {
        throw std::invalid_argument("Delays must be >= zero.");
    }
    if (!transient) {
        throw std::invalid_argument("Error classifier must be set.");
    }
}

std::chrono::microseconds RetryPolicy::delayFor(int attempt) const {
    if (attempt < 1) {
        throw std::invalid_argument("Attempt must be >= one.");
    }
    if (delays.empty()) {
        throw std::invalid_argument("Delay sequence must not be empty.");
    }
    auto index = std::min(static_cast<std::size_t>(attempt - 1), delays.size() - 1);
    return delays[index];
}

Outcome RetryPolicy::classify(const Result& result) const {
    if (result.has_value()) {
        return Outcome::Delivered;
    }
    return transient(result.error()) ? Outcome::TransientFailure : Outcome::FatalFailure;
}

RetryPolicy defaultRetryPolicy() {
    return RetryPolicy{
        5,
        std::vector<std::chrono::microseconds>{
            std::chrono::seconds{1},
            std::chrono::seconds{2},
            std::chrono::seconds{3},
            std::chrono::seconds{4}
        }
    };
}

} // namespace logretry
