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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <stdexcept>
#include <unordered_set>

namespace logretry {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::Unavailable: return "Unavailable";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::Interrupted: return "Interrupted";
        case ErrorCode::WouldBlock: return "WouldBlock";
        case ErrorCode::ConnectFailed: return "ConnectFailed";
        case ErrorCode::InvalidRecord: return "InvalidRecord";
        case ErrorCode::BrokenDestination: return "BrokenDestination";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::RetriesExhausted: return "RetriesExhausted";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

std::string toString(const Outcome& outcome) {
    switch (outcome)
    {
        case Outcome::Delivered: return "Delivered";
        case Outcome::TransientFailure: return "TransientFailure";
        case Outcome::FatalFailure: return "FatalFailure";
    }
    std::unreachable();
}

const std::unordered_set<ErrorCode, ErrorCodeHash> transientErrorCodes = {
    ErrorCode::Unavailable,
    ErrorCode::Timeout,
    ErrorCode::Interrupted,
    ErrorCode::WouldBlock,
    ErrorCode::ConnectFailed,
};

bool isTransient(const Error& error) {
    return transientErrorCodes.contains(error.code);
}

Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, attempts {0}, cause {} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, attempts {0}, cause {} {}

Error exhausted(const Error& last, int attempts) {
    Error error {
        ErrorCode::RetriesExhausted,
        "Run out of retries after " + std::to_string(attempts) + " attempts, last error: " + last.what
    };
    error.attempts = attempts;
    error.cause = std::make_shared<const Error>(last);
    return error;
}

std::string describe(const Error& error) {
    auto out = toString(error.code) + ": " + error.what;
    for (auto c = error.cause; c; c = c->cause) {
        out += " <- " + toString(c->code) + ": " + c->what;
    }
    return out;
}

ErrorCode errorCode(const Result& result) {
    if (result.has_value()) {
        throw std::logic_error("Expected error but got value");
    }
    return result.error().code;
}

} // namespace logretry
