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
#ifndef LOGRETRY_DRAIN_SINK_HPP
#define LOGRETRY_DRAIN_SINK_HPP

#include "drain/Drain.hpp"
#include "common/Error.hpp"
#include "common/Record.hpp"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <utility>
#include <spdlog/common.h>
#include <spdlog/details/log_msg.h>
#include <spdlog/details/null_mutex.h>
#include <spdlog/sinks/base_sink.h>

namespace logretry {

// spdlog sink handing each message to a drain. The record gets the raw payload:
// patterns and formatters set on this sink are not applied. A failed emit or
// flush throws spdlog_ex, which the owning logger passes to its error handler.
template<typename Mutex>
class DrainSink : public spdlog::sinks::base_sink<Mutex> {
public:
    explicit DrainSink(std::shared_ptr<Drain> d) : drain {std::move(d)} {
        if (!drain) {
            throw std::invalid_argument("Drain must not be null.");
        }
    }

    static Record toRecord(const spdlog::details::log_msg& msg) {
        Record record;
        record.level = msg.level;
        record.logger.assign(msg.logger_name.data(), msg.logger_name.size());
        record.message.assign(msg.payload.data(), msg.payload.size());
        record.time = msg.time;
        return record;
    }

protected:
    void sink_it_(const spdlog::details::log_msg& msg) override {
        auto result = drain->emit(toRecord(msg));
        if (!result.has_value()) {
            throw spdlog::spdlog_ex(describe(result.error()));
        }
    }

    void flush_() override {
        auto result = drain->flush();
        if (!result.has_value()) {
            throw spdlog::spdlog_ex(describe(result.error()));
        }
    }

private:
    std::shared_ptr<Drain> drain;
};

using DrainSinkMt = DrainSink<std::mutex>;
using DrainSinkSt = DrainSink<spdlog::details::null_mutex>;

} // namespace logretry

#endif // LOGRETRY_DRAIN_SINK_HPP
