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
#ifndef LOGRETRY_LOCKED_DRAIN_HPP
#define LOGRETRY_LOCKED_DRAIN_HPP

#include "drain/Drain.hpp"
#include "common/Error.hpp"
#include "common/Record.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace logretry {

// Serializes every call into a drain that is not safe to share between threads.
class LockedDrain : public Drain {
public:
    explicit LockedDrain(std::unique_ptr<Drain> d) : inner {std::move(d)} {
        if (!inner) {
            throw std::invalid_argument("Inner drain must not be null.");
        }
    }

    Result emit(const Record& record) override {
        std::lock_guard l{m};
        return inner->emit(record);
    }

    Result flush() override {
        std::lock_guard l{m};
        return inner->flush();
    }
private:
    std::unique_ptr<Drain> inner;
    std::mutex m;
};

} // namespace logretry

#endif // LOGRETRY_LOCKED_DRAIN_HPP
