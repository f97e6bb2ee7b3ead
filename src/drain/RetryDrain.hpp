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
#ifndef LOGRETRY_RETRY_DRAIN_HPP
#define LOGRETRY_RETRY_DRAIN_HPP

#include "drain/Drain.hpp"
#include "common/Error.hpp"
#include "common/Record.hpp"
#include "common/Repeater.hpp"
#include "common/RetryPolicy.hpp"
#include <memory>

namespace logretry {

/*
 * Resubmits a record to the inner drain while it fails transiently, waiting
 * between attempts as the policy prescribes. A fatal failure is returned as
 * is; once the attempts are spent the last failure is returned wrapped in a
 * RetriesExhausted error.
 *
 * The calling thread blocks for every attempt and delay. No lock is taken, so
 * the inner drain must be safe to call concurrently when this drain is (wrap
 * it in a LockedDrain otherwise). A failed attempt is assumed not to have
 * persisted the record.
 */
class RetryDrain : public Drain {
public:
    RetryDrain(std::unique_ptr<Drain> inner, RetryPolicy policy);
    RetryDrain(const RetryDrain&) = delete;
    RetryDrain& operator=(const RetryDrain&) = delete;

    Result emit(const Record& record) override;
    // Forwarded once, never retried.
    Result flush() override;

    const RetryPolicy& policy() const;
private:
    std::unique_ptr<Drain> inner;
    Repeater repeater;
};

} // namespace logretry

#endif // LOGRETRY_RETRY_DRAIN_HPP
