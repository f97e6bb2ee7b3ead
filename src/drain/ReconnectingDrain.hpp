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
#ifndef LOGRETRY_RECONNECTING_DRAIN_HPP
#define LOGRETRY_RECONNECTING_DRAIN_HPP

#include "drain/Drain.hpp"
#include "common/Error.hpp"
#include "common/Record.hpp"
#include "common/RetryPolicy.hpp"
#include <expected>
#include <functional>
#include <memory>
#include <mutex>

namespace logretry {

/*
 * Drain built on demand by a factory, e.g. a writer over a freshly opened
 * connection. A drain that fails is thrown away and the next emit builds a new
 * one, so wrapping this in a RetryDrain reconnects between attempts.
 *
 * A factory failure is reported as the emit's failure. Calls are serialized.
 */
class ReconnectingDrain : public Drain {
public:
    using Factory = std::function<std::expected<std::unique_ptr<Drain>, Error>()>;

    // Lazy: the factory is not called before the first emit.
    explicit ReconnectingDrain(Factory f);
    ReconnectingDrain(const ReconnectingDrain&) = delete;
    ReconnectingDrain& operator=(const ReconnectingDrain&) = delete;

    // Eager: builds the inner drain right away, retrying the factory under the
    // policy. Fails if the factory never succeeds.
    static std::expected<std::unique_ptr<ReconnectingDrain>, Error> connect(Factory f, const RetryPolicy& policy);

    Result emit(const Record& record) override;
    Result flush() override;

    [[nodiscard]] bool connected();
private:
    Result ensureConnected();

    Factory factory;
    std::unique_ptr<Drain> inner;
    std::mutex m;
};

} // namespace logretry

#endif // LOGRETRY_RECONNECTING_DRAIN_HPP
