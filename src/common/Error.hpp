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
#ifndef LOGRETRY_COMMON_ERROR_HPP
#define LOGRETRY_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <memory>
#include <unordered_set>
#include <functional>
#include <type_traits>
#include <expected>
#include <variant>

namespace logretry {

enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    Unavailable = 2,
    Timeout = 3,
    Interrupted = 4,
    WouldBlock = 5,
    ConnectFailed = 6,
    InvalidRecord = 7,
    BrokenDestination = 8,
    Internal = 9,
    RetriesExhausted = 10,
    Unknown = 128
};

struct ErrorCodeHash {
    std::size_t operator()(const ErrorCode& code) const noexcept {
        return std::hash<std::underlying_type_t<ErrorCode>>{}(static_cast<std::underlying_type_t<ErrorCode>>(code));
    }
};

// Codes a drain reports for failures that may go away on their own.
extern const std::unordered_set<ErrorCode, ErrorCodeHash> transientErrorCodes;

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    // Number of attempts made, only set on RetriesExhausted.
    int attempts;
    std::shared_ptr<const Error> cause;

    Error(const ErrorCode& c, std::string w);
    explicit Error(const ErrorCode& c);
};

bool isTransient(const Error& error);

// RetriesExhausted error keeping the last transient failure as its cause.
Error exhausted(const Error& last, int attempts);

// One line with the error and every cause below it.
std::string describe(const Error& error);

using Result = std::expected<std::monostate, Error>;

enum class Outcome : char {
    Delivered,
    TransientFailure,
    FatalFailure
};

std::string toString(const Outcome& outcome);

ErrorCode errorCode(const Result& result);

} // namespace logretry

#endif // LOGRETRY_COMMON_ERROR_HPP
