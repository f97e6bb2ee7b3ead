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
#include "drain/ReconnectingDrain.hpp"
#include "common/Error.hpp"
#include "common/Log.hpp"
#include "common/Record.hpp"
#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"
#include <expected>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>

namespace logretry {

ReconnectingDrain::ReconnectingDrain(Factory f)
    : factory {std::move(f)} {
    if (!factory) {
        throw std::invalid_argument("Drain factory must be set.");
    }
}

std::expected<std::unique_ptr<ReconnectingDrain>, Error> ReconnectingDrain::connect(Factory f, const RetryPolicy& policy) {
    auto drain = std::make_unique<ReconnectingDrain>(std::move(f));
    const Repeater repeater {policy};
    auto result = repeater.attempt("connect", [&drain] {
        std::lock_guard l{drain->m};
        return drain->ensureConnected();
    });
    if (!result.has_value()) {
        return std::unexpected {result.error()};
    }
    return drain;
}

Result ReconnectingDrain::emit(const Record& record) {
    std::lock_guard l{m};
    auto c = ensureConnected();
    if (!c.has_value()) {
        return c;
    }
    auto result = inner->emit(record);
    if (!result.has_value()) {
        log()->warn("Discarding failed drain: {}", describe(result.error()));
        inner.reset();
    }
    return result;
}

Result ReconnectingDrain::flush() {
    std::lock_guard l{m};
    if (!inner) {
        return {};
    }
    return inner->flush();
}

bool ReconnectingDrain::connected() {
    std::lock_guard l{m};
    return inner != nullptr;
}

Result ReconnectingDrain::ensureConnected() {
    if (inner) {
        return {};
    }
    auto created = factory();
    if (!created.has_value()) {
        log()->warn("Could not create drain: {}", describe(created.error()));
        return std::unexpected {created.error()};
    }
    if (!created.value()) {
        return std::unexpected {Error{ErrorCode::Internal, "Drain factory returned no drain"}};
    }
    inner = std::move(created.value());
    log()->info("Created drain");
    return {};
}

} // namespace logretry
