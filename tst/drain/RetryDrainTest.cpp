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
#include <gtest/gtest.h>
#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <thread>
#include <vector>
#include "common/Error.hpp"
#include "common/Record.hpp"
#include "common/RetryPolicy.hpp"
#include "drain/RetryDrain.hpp"
#include "drain/ScriptedDrain.hpp"

using logretry::Error;
using logretry::ErrorCode;
using logretry::Record;
using logretry::RetryDrain;
using logretry::RetryPolicy;

namespace {

Record sampleRecord() {
    Record record;
    record.level = spdlog::level::warn;
    record.logger = "orders";
    record.message = "payment gateway slow";
    record.fields = {{"order", "1042"}, {"latency_ms", "870"}};
    return record;
}

RetryPolicy noDelay(int attempts) {
    return RetryPolicy{attempts, std::chrono::microseconds{0L}};
}

} // namespace

class RetryDrainTest : public ::testing::Test {
protected:
    RetryDrain make(std::vector<logretry::Result> script, const RetryPolicy& policy, logretry::Result fallback = {}) {
        auto scripted = std::make_unique<ScriptedDrain>(std::move(script), std::move(fallback));
        inner = scripted.get();
        return RetryDrain{std::move(scripted), policy};
    }

    ScriptedDrain* inner{nullptr};
    const Record record{sampleRecord()};
};

TEST_F(RetryDrainTest, NullInnerDrainThrows) {
    EXPECT_THROW(RetryDrain(nullptr, noDelay(3)), std::invalid_argument);
}

TEST_F(RetryDrainTest, PolicyModifiedAfterConstructionIsRejected) {
    RetryPolicy emptied = noDelay(3);
    emptied.delays.clear();
    EXPECT_THROW(make({transientFailure()}, emptied), std::invalid_argument);

    RetryPolicy unclassified = noDelay(3);
    unclassified.transient = nullptr;
    EXPECT_THROW(make({transientFailure()}, unclassified), std::invalid_argument);

    RetryPolicy noAttempts = noDelay(3);
    noAttempts.maxAttempts = 0;
    EXPECT_THROW(make({}, noAttempts), std::invalid_argument);

    RetryPolicy negative = noDelay(3);
    negative.delays.push_back(std::chrono::microseconds{-5});
    EXPECT_THROW(make({}, negative), std::invalid_argument);
}

TEST_F(RetryDrainTest, SuccessNeedsOneCallWhateverThePolicy) {
    for (int attempts : {1, 2, 10}) {
        auto drain = make({}, noDelay(attempts));
        EXPECT_TRUE(drain.emit(record).has_value());
        EXPECT_EQ(inner->calls(), 1U);
    }
}

TEST_F(RetryDrainTest, FatalFailureIsNotRetried) {
    // A ten second delay would show if the policy were consulted.
    auto drain = make({}, RetryPolicy{5, std::chrono::seconds{10L}}, fatalFailure("disk full"));
    auto start = std::chrono::steady_clock::now();
    auto result = drain.emit(record);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::BrokenDestination);
    EXPECT_EQ(result.error().what, "disk full");
    EXPECT_EQ(result.error().cause, nullptr);
    EXPECT_EQ(inner->calls(), 1U);
    EXPECT_LT(elapsed, std::chrono::seconds{1L});
}

TEST_F(RetryDrainTest, SucceedsWhenFailuresFitTheBudget) {
    const int n = 4;
    for (std::size_t k = 0; k < static_cast<std::size_t>(n); ++k) {
        auto drain = make(transientFailures(k), noDelay(n));
        EXPECT_TRUE(drain.emit(record).has_value());
        EXPECT_EQ(inner->calls(), k + 1);
    }
}

TEST_F(RetryDrainTest, ExhaustsWhenFailuresOutlastTheBudget) {
    const int n = 3;
    for (std::size_t k = static_cast<std::size_t>(n); k < 6; ++k) {
        auto drain = make(transientFailures(k), noDelay(n));
        auto result = drain.emit(record);
        ASSERT_FALSE(result.has_value());
        EXPECT_EQ(result.error().code, ErrorCode::RetriesExhausted);
        EXPECT_EQ(result.error().attempts, n);
        EXPECT_EQ(inner->calls(), static_cast<std::size_t>(n));
    }
}

TEST_F(RetryDrainTest, ExhaustedErrorKeepsLastCause) {
    auto drain = make({transientFailure("first"), transientFailure("second")}, noDelay(2));
    auto result = drain.emit(record);
    ASSERT_FALSE(result.has_value());
    ASSERT_NE(result.error().cause, nullptr);
    EXPECT_EQ(result.error().cause->code, ErrorCode::Unavailable);
    EXPECT_EQ(result.error().cause->what, "second");
}

TEST_F(RetryDrainTest, RecordIsResubmittedUnchanged) {
    auto drain = make(transientFailures(3), noDelay(5));
    EXPECT_TRUE(drain.emit(record).has_value());
    auto seen = inner->records();
    ASSERT_EQ(seen.size(), 4U);
    for (const auto& r : seen) {
        EXPECT_EQ(r, record);
    }
}

TEST_F(RetryDrainTest, FixedDelayBlocksBetweenAttempts) {
    auto drain = make(transientFailures(2), RetryPolicy{3, std::chrono::milliseconds{10L}});
    auto start = std::chrono::steady_clock::now();
    auto result = drain.emit(record);
    auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_TRUE(result.has_value());
    EXPECT_GE(elapsed, std::chrono::milliseconds{20L});
    auto seen = inner->records();
    ASSERT_EQ(seen.size(), 3U);
    EXPECT_EQ(seen[0], seen[1]);
    EXPECT_EQ(seen[1], seen[2]);
}

TEST_F(RetryDrainTest, LastDelayIsReusedForLaterAttempts) {
    const RetryPolicy policy{5, std::vector<std::chrono::microseconds>{
        std::chrono::milliseconds{1L}, std::chrono::milliseconds{15L}}};
    auto drain = make({}, policy, transientFailure());
    auto start = std::chrono::steady_clock::now();
    auto result = drain.emit(record);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(inner->calls(), 5U);
    // 1ms, then 15ms before each of attempts 3, 4 and 5
    EXPECT_GE(elapsed, std::chrono::milliseconds{1L + 15L * 3L});
}

TEST_F(RetryDrainTest, SingleAttemptExhaustsWithoutDelay) {
    auto drain = make({}, RetryPolicy{1, std::chrono::seconds{10L}}, transientFailure());
    auto start = std::chrono::steady_clock::now();
    auto result = drain.emit(record);
    auto elapsed = std::chrono::steady_clock::now() - start;
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(result.error().attempts, 1);
    EXPECT_EQ(inner->calls(), 1U);
    EXPECT_LT(elapsed, std::chrono::seconds{1L});
}

TEST_F(RetryDrainTest, NoStateCarriesOverBetweenEmits) {
    auto drain = make({transientFailure(), transientFailure(), delivered(), transientFailure(), transientFailure()},
        noDelay(3));
    EXPECT_TRUE(drain.emit(record).has_value());
    EXPECT_TRUE(drain.emit(record).has_value());
    EXPECT_EQ(inner->calls(), 6U);
}

TEST_F(RetryDrainTest, ClassifierSuppliedByPolicy) {
    const RetryPolicy policy{3, std::chrono::microseconds{0L}, false,
        [](const Error& e) { return e.code == ErrorCode::BrokenDestination; }};
    auto drain = make({fatalFailure(), fatalFailure()}, policy);
    EXPECT_TRUE(drain.emit(record).has_value());
    EXPECT_EQ(inner->calls(), 3U);
}

TEST_F(RetryDrainTest, FlushIsForwardedOnceWithoutRetry) {
    auto drain = make({}, noDelay(5));
    inner->flushResult = transientFailure("flush pending");
    auto result = drain.flush();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::Unavailable);
    EXPECT_EQ(inner->flushes, 1);
    EXPECT_EQ(inner->calls(), 0U);
}

TEST_F(RetryDrainTest, NestedRetryDrainDoesNotMultiplyBudget) {
    auto scripted = std::make_unique<ScriptedDrain>(std::vector<logretry::Result>{}, transientFailure());
    auto* probe = scripted.get();
    RetryDrain outer{std::make_unique<RetryDrain>(std::move(scripted), noDelay(2)), noDelay(3)};
    auto result = outer.emit(record);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::RetriesExhausted);
    EXPECT_EQ(result.error().attempts, 2);
    EXPECT_EQ(probe->calls(), 2U);
}

TEST_F(RetryDrainTest, ConcurrentEmitsRetryIndependently) {
    // Enough attempts that no thread runs out whichever failures it draws.
    auto drain = make(transientFailures(8), RetryPolicy{9, std::chrono::milliseconds{1L}});
    std::vector<std::thread> threads;
    std::vector<int> succeeded(4, 0);
    for (std::size_t i = 0; i < succeeded.size(); ++i) {
        threads.emplace_back([&, i] {
            succeeded[i] = drain.emit(record).has_value() ? 1 : 0;
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    for (int d : succeeded) {
        EXPECT_EQ(d, 1);
    }
    EXPECT_EQ(inner->calls(), 12U);
}
