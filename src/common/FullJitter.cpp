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
#include "common/FullJitter.hpp"
#include <algorithm>
#include <array>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <random>

namespace logretry {

namespace {

std::mt19937 seededGenerator() {
    auto constexpr seedLen = sizeof(std::mt19937::result_type) * std::mt19937::state_size
        / sizeof(std::seed_seq::result_type);
    auto seed = std::array<std::seed_seq::result_type, seedLen>();
    auto dev = std::random_device();
    std::generate_n(seed.begin(), seedLen, std::ref(dev));
    auto seq = std::seed_seq(seed.begin(), seed.end());
    return std::mt19937{seq};
}

} // namespace

std::chrono::microseconds fullJitter(std::chrono::microseconds v) {
    if (v < std::chrono::microseconds::zero()) {
        throw std::invalid_argument("Negative duration is not supported");
    }
    thread_local auto rng = seededGenerator();
    std::uniform_int_distribution<std::chrono::microseconds::rep> dist(0, v.count());
    return std::chrono::microseconds(dist(rng));
}

} // namespace logretry
