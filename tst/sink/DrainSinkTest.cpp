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
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <spdlog/logger.h>
#include "common/Error.hpp"
#include "common/Record.hpp"
#include "common/RetryPolicy.hpp"
#include "drain/RetryDrain.hpp"
#include "drain/ScriptedDrain.hpp"
#include "sink/DrainSink.hpp"

using logretry::DrainSinkMt;
using logretry::DrainSinkSt;
using logretry::RetryDrain;
using logretry::RetryPolicy;

class DrainSinkTest : public ::testing::Test {
protected:
    std::shared_ptr<spdlog::logger> loggerOver(std::vector<logretry::Result> script, int attempts,
                                               logretry::Result fallback = {}) {
        auto scripted = std::make_unique<ScriptedDrain>(std::move(script), std::move(fallback));
        inner = scripted.get();
        auto drain = std::make_shared<RetryDrain>(std::move(scripted),
            RetryPolicy{attempts, std::chrono::microseconds{0L}});
        auto sink = std::make_shared<DrainSinkMt>(drain);
        sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");
        auto logger = std::make_shared<spdlog::logger>("drain_sink_test", sink);
        logger->set_level(spdlog::level::trace);
        logger->set_error_handler([this](const std::string& msg) { errors.push_back(msg); });
        return logger;
    }

    ScriptedDrain* inner{nullptr};
    std::vector<std::string> errors;
};

TEST_F(DrainSinkTest, NullDrainThrows) {
    EXPECT_THROW(DrainSinkSt(nullptr), std::invalid_argument);
}

TEST_F(DrainSinkTest, MessageBecomesRecord) {
    auto logger = loggerOver({}, 1);
    logger->warn("disk {} at {}%", "sda", 93);
    auto records = inner->records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].level, spdlog::level::warn);
    EXPECT_EQ(records[0].logger, "drain_sink_test");
    EXPECT_EQ(records[0].message, "disk sda at 93%");
    EXPECT_TRUE(errors.empty());
}

TEST_F(DrainSinkTest, PatternDoesNotReachTheRecord) {
    auto logger = loggerOver({}, 1);
    logger->set_pattern(">>> %v <<<");
    logger->info("plain text");
    auto records = inner->records();
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(records[0].message, "plain text");
    EXPECT_TRUE(errors.empty());
}

TEST_F(DrainSinkTest, TransientFailuresAreRetriedBehindTheLogger) {
    auto logger = loggerOver(transientFailures(2), 3);
    logger->info("eventually delivered");
    EXPECT_EQ(inner->calls(), 3U);
    EXPECT_TRUE(errors.empty());
}

TEST_F(DrainSinkTest, ExhaustedRetriesReachTheErrorHandler) {
    auto logger = loggerOver({}, 2, transientFailure("socket busy"));
    logger->error("never delivered");
    EXPECT_EQ(inner->calls(), 2U);
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_NE(errors[0].find("RetriesExhausted"), std::string::npos);
    EXPECT_NE(errors[0].find("socket busy"), std::string::npos);
}

TEST_F(DrainSinkTest, FatalFailureReachesTheErrorHandler) {
    auto logger = loggerOver({fatalFailure("file removed")}, 5);
    logger->info("dropped");
    EXPECT_EQ(inner->calls(), 1U);
    ASSERT_EQ(errors.size(), 1U);
    EXPECT_NE(errors[0].find("file removed"), std::string::npos);
}

TEST_F(DrainSinkTest, FlushIsForwarded) {
    auto logger = loggerOver({}, 3);
    logger->flush();
    EXPECT_EQ(inner->flushes, 1);
    EXPECT_TRUE(errors.empty());
}
