// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * PGShield a resilient PostgreSQL access service.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include <gtest/gtest.h>
#include "common/Error.hpp"
#include "common/ErrorClassifier.hpp"
#include <cstddef>
#include <string>

using pgshield::Classification;
using pgshield::Error;
using pgshield::ErrorCode;
using pgshield::classify;

TEST(ErrorClassifierTest, TransientSqlStatesAreTransient) {
    for (const auto& state : pgshield::transientSqlStates) {
        const auto c = classify(Error {ErrorCode::Database, "server error", state});
        EXPECT_TRUE(c.transient()) << state;
        ASSERT_TRUE(c.diagnosticCode.has_value());
        EXPECT_EQ(c.diagnosticCode.value(), state);
        EXPECT_FALSE(c.networkLevel);
    }
    EXPECT_EQ(pgshield::transientSqlStates.size(), 11U);
}

TEST(ErrorClassifierTest, OtherSqlStatesArePermanent) {
    for (const std::string state : {"42P01", "42601", "23505", "28P01", "3D000", "57014"}) {
        const auto c = classify(Error {ErrorCode::Database, "server error", state});
        EXPECT_EQ(c.kind, Classification::Kind::Permanent) << state;
        EXPECT_EQ(c.diagnosticCode, state);
    }
}

TEST(ErrorClassifierTest, NetworkLevelFailuresWithoutCodeAreTransient) {
    for (const auto code : {ErrorCode::Socket, ErrorCode::IO, ErrorCode::Timeout}) {
        const auto c = classify(Error {code, "connection reset"});
        EXPECT_TRUE(c.transient()) << code;
        EXPECT_TRUE(c.networkLevel);
        EXPECT_FALSE(c.diagnosticCode.has_value());
    }
}

TEST(ErrorClassifierTest, UnrecognisedFailuresArePermanent) {
    for (const auto code : {ErrorCode::InvalidArg, ErrorCode::NotFound, ErrorCode::Internal,
                            ErrorCode::HandleUnusable, ErrorCode::Unknown}) {
        const auto c = classify(Error {code});
        EXPECT_FALSE(c.transient()) << code;
        EXPECT_FALSE(c.networkLevel);
        EXPECT_FALSE(c.diagnosticCode.has_value());
    }
}

TEST(ErrorClassifierTest, BrokenConnectionWinsOverWrappedSqlState) {
    const Error wrapped {ErrorCode::Socket, "connection lost", Error {ErrorCode::Database, "syntax", "42601"}};
    const auto c = classify(wrapped);
    EXPECT_TRUE(c.transient());
    EXPECT_TRUE(c.networkLevel);
    EXPECT_FALSE(c.diagnosticCode.has_value());
}

TEST(ErrorClassifierTest, InnerSqlStateDecidesUnderNonNetworkLink) {
    const Error wrapped {ErrorCode::Internal, "operation failed", Error {ErrorCode::Database, "syntax", "42601"}};
    const auto c = classify(wrapped);
    EXPECT_FALSE(c.transient());
    EXPECT_FALSE(c.networkLevel);
    EXPECT_EQ(c.diagnosticCode, "42601");
}

TEST(ErrorClassifierTest, SqlStateOnOuterLinkWins) {
    const Error wrapped {
        ErrorCode::Database, "deadlock", "40P01"};
    EXPECT_TRUE(classify(wrapped).transient());
}

TEST(ErrorClassifierTest, CauseChainIsInspected) {
    const Error wrapped {ErrorCode::Internal, "operation failed",
                         Error {ErrorCode::Unknown, "driver", Error {ErrorCode::Database, "conflict", "40001"}}};
    const auto c = classify(wrapped);
    EXPECT_TRUE(c.transient());
    EXPECT_EQ(c.diagnosticCode, "40001");
}

TEST(ErrorClassifierTest, NetworkCauseIsTransient) {
    const Error wrapped {ErrorCode::Internal, "operation failed", Error {ErrorCode::IO, "broken pipe"}};
    const auto c = classify(wrapped);
    EXPECT_TRUE(c.transient());
    EXPECT_TRUE(c.networkLevel);
}

TEST(ErrorClassifierTest, CauseChainDepthIsBounded) {
    Error chain {ErrorCode::Socket, "deep"};
    for (std::size_t i = 0; i < pgshield::maxCauseDepth; ++i) {
        chain = Error {ErrorCode::Internal, "wrapper", chain};
    }
    const auto c = classify(chain);
    EXPECT_FALSE(c.transient());

    Error shallow {ErrorCode::Socket, "deep"};
    for (std::size_t i = 0; i + 1 < pgshield::maxCauseDepth; ++i) {
        shallow = Error {ErrorCode::Internal, "wrapper", shallow};
    }
    EXPECT_TRUE(classify(shallow).transient());
}

TEST(ErrorClassifierTest, DescribeRendersCauses) {
    const Error wrapped {ErrorCode::Socket, "connection lost", Error {ErrorCode::Database, "terminated", "57P01"}};
    const auto text = pgshield::describe(wrapped);
    EXPECT_NE(text.find("Socket: connection lost"), std::string::npos);
    EXPECT_NE(text.find("caused by: Database: terminated (SQLSTATE 57P01)"), std::string::npos);
}
