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
#include "drain/RetryDrain.hpp"
#include "common/Error.hpp"
#include "common/Record.hpp"
#include "common/RetryPolicy.hpp"
#include <memory>
#include <stdexcept>
#include <utility>

namespace logretry {

RetryDrain::RetryDrain(std::unique_ptr<Drain> d, RetryPolicy p)
    : inner {std::move(d)},
      repeater {std::move(p)} {
    if (!inner) {
        throw std::invalid_argument("Inner drain must not be null.");
    }
}

Result RetryDrain::emit(const Record& record) {
    return repeater.attempt("emit", [this, &record] {
        return inner->emit(record);
    });
}

Result RetryDrain::flush() {
    return inner->flush();
}

const RetryPolicy& RetryDrain::policy() const {
    return repeater.policy;
}

} // namespace logretry
