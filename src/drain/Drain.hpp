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
#ifndef LOGRETRY_DRAIN_HPP
#define LOGRETRY_DRAIN_HPP

#include "common/Error.hpp"
#include "common/Record.hpp"

namespace logretry {

// A destination for log records. Failures carry an ErrorCode the retry policy
// classifies as transient or fatal.
class Drain {
public:
    virtual ~Drain() = default;

    virtual Result emit(const Record& record) = 0;
    virtual Result flush() { return {}; }
};

} // namespace logretry

#endif // LOGRETRY_DRAIN_HPP
