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
#ifndef SCRIPTED_DRAIN_HPP
#define SCRIPTED_DRAIN_HPP

#include <cstddef>
#include <expected>
#include <mutex>
#include <string>
#include <utility>
#include <vector>
#include "common/Error.hpp"
#include "common/Record.hpp"
#include "drain/Drain.hpp"

// Drain answering emits from a fixed script, then with a fallback result.
// Keeps a copy of every record it was handed.
class ScriptedDrain : public logretry::Drain {
public:
    explicit ScriptedDrain(std::vector<logretry::Result> s, logretry::Result f = {})
        : script {std::move(s)},
          fallback {std::move(f)} {}

    logretry::Result emit(const logretry::Record& record) override {
        std::lock_guard l{m};
        seen.push_back(record);
        if (next < script.size()) {
            return script[next++];
        }
        return fallback;
    }

    logretry::Result flush() override {
        std::lock_guard l{m};
        ++flushes;
        return flushResult;
    }

    std::size_t calls() {
        std::lock_guard l{m};
        return seen.size();
    }

    std::vector<logretry::Record> records() {
        std::lock_guard l{m};
        return seen;
    }

    int flushes{0};
    logretry::Result flushResult{};
private:
    std::vector<logretry::Result> script;
    logretry::Result fallback;
    std::size_t next{0};
    std::vector<logretry::Record> seen;
    std::mutex m;
};

inline logretry::Result delivered() {
    return {};
}

inline logretry::Result transientFailure(const std::string& what = "destination busy") {
    return std::unexpected {logretry::Error{logretry::ErrorCode::Unavailable, what}};
}

inline logretry::Result fatalFailure(const std::string& what = "destination closed for good") {
    return std::unexpected {logretry::Error{logretry::ErrorCode::BrokenDestination, what}};
}

inline std::vector<logretry::Result> transientFailures(std::size_t n) {
    return std::vector<logretry::Result>(n, transientFailure());
}

#endif // SCRIPTED_DRAIN_HPP
