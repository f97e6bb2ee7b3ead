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
#include "common/Repeater.hpp"
#include "common/Error.hpp"
#include "common/FullJitter.hpp"
#include "common/Log.hpp"
#include "common/RetryPolicy.hpp"
#include <functional>
#include <expected>
#include <chrono>
#include <thread>
#include <string>
#include <utility>

namespace logretry {

Repeater::Repeater(RetryPolicy p)
    : policy {std::move(p)} {
    policy.validate();
}

Result Repeater::attempt(const std::string& op, const std::function<Result()>& fn) const {
    for (int attempt = 1;; ++attempt) {
        auto result = fn();
        switch (policy.classify(result)) {
            case Outcome::Delivered:
                if (attempt > 1) {
                    log()->debug("{}: succeeded on attempt {}", op, attempt);
                }
                return result;
            case Outcome::FatalFailure:
                return result;
            case Outcome::TransientFailure:
                break;
        }
        if (attempt >= policy.maxAttempts) {
            log()->error("{}: giving up after {} attempts: {}", op, attempt, describe(result.error()));
            return std::unexpected {exhausted(result.error(), attempt)};
        }
        auto delay = policy.delayFor(attempt);
        if (policy.jitter) {
            delay = fullJitter(delay);
        }
        log()->warn("{}: attempt {}/{} failed: {}, retrying in {}us",
            op, attempt, policy.maxAttempts, describe(result.error()), delay.count());
        std::this_thread::sleep_for(delay);
    }
}

} // namespace logretry
