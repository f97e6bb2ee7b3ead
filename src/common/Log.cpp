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
#include "common/Log.hpp"
#include <memory>
#include <mutex>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace logretry {

std::shared_ptr<spdlog::logger> log() {
    static std::mutex m;
    std::lock_guard l{m};
    if (auto existing = spdlog::get(loggerName)) {
        return existing;
    }
    // The application may register a logger under this name between the lookup
    // and the creation; spdlog reports that as a duplicate.
    try {
        return spdlog::stderr_color_mt(loggerName);
    } catch (const spdlog::spdlog_ex&) {
        if (auto existing = spdlog::get(loggerName)) {
            return existing;
        }
        throw;
    }
}

} // namespace logretry
