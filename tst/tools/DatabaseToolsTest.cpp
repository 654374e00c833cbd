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
#include "client/RetryExecutor.hpp"
#include "common/RetryPolicy.hpp"
#include "config/LayeredSettings.hpp"
#include "config/ProfileResolver.hpp"
#include "pg/PgHandle.hpp"
#include "pg/PgHandlePool.hpp"
#include "tools/DatabaseTools.hpp"
#include <google/protobuf/struct.pb.h>
#include <libpq-fe.h>
#include <array>
#include <chrono>
#include <string>

using pgshield::DatabaseTools;
using pgshield::LayeredSettings;
using pgshield::PgHandle;
using pgshield::PgHandlePool;
using pgshield::PgResult;
using pgshield::ProfilePolicy;
using pgshield::ProfileResolver;
using pgshield::RetryExecutor;
using pgshield::RetryPolicy;

namespace {

LayeredSettings localSettings() {
    LayeredSettings settings {};
    // Nothing listens on port 1, so every connect is refused.
    settings.set("refused", "Host=127.0.0.1;Port=1;Database=none;Username=nobody");
    settings.set("reporting", "postgresql://reader@127.0.0.1:1/warehouse");
    return settings;
}

ProfilePolicy quickPolicy() {
    ProfilePolicy policy {};
    policy.connectTimeout = std::chrono::seconds{2};
    return policy;
}

} // namespace

class DatabaseToolsTest : public ::testing::Test {
protected:
    LayeredSettings settings {localSettings()};
    ProfileResolver resolver {settings, quickPolicy()};
    PgHandlePool pool {};
    RetryExecutor<PgHandle> executor {resolver, pool, RetryPolicy {}, [this](std::chrono::milliseconds) { sleeps++; }};
    DatabaseTools tools {settings, resolver, executor};
    int sleeps {0};
};

TEST_F(DatabaseToolsTest, ListsConfiguredDatabases) {
    const auto result = tools.listAvailableDatabases();
    ASSERT_TRUE(result.success());
    const auto& fields = result.data().fields();
    const auto& names = fields.at("availableDatabases").list_value();
    ASSERT_EQ(names.values_size(), 2);
    EXPECT_EQ(names.values(0).string_value(), "refused");
    EXPECT_EQ(names.values(1).string_value(), "reporting");
    EXPECT_EQ(fields.at("credentialsSource").string_value(), "appsettings.json");
    const auto& resilience = fields.at("resilienceSettings").struct_value().fields();
    EXPECT_EQ(resilience.at("maxRetryAttempts").number_value(), 3);
    EXPECT_EQ(resilience.at("commandTimeoutSeconds").number_value(), 120);
    EXPECT_EQ(resilience.at("connectionTimeoutSeconds").number_value(), 2);
    EXPECT_TRUE(resilience.at("poolingEnabled").bool_value());
    EXPECT_EQ(resilience.at("keepAliveSeconds").number_value(), 30);
}

TEST_F(DatabaseToolsTest, UnknownDatabaseIsPermanent) {
    const auto result = tools.executeQuery("SELECT 1", "staging");
    EXPECT_FALSE(result.success());
    EXPECT_FALSE(result.is_transient());
    EXPECT_FALSE(result.has_diagnostic_code());
    EXPECT_EQ(result.attempts(), 1);
    EXPECT_NE(result.error().find("listAvailableDatabases()"), std::string::npos);
    EXPECT_EQ(result.suggestion(), pgshield::defaultAdvice().permanent);
    EXPECT_EQ(sleeps, 0);
}

TEST_F(DatabaseToolsTest, EmptySqlIsRejected) {
    for (const std::string sql : {"", "   \n\t"}) {
        const auto query = tools.executeQuery(sql, "refused");
        EXPECT_FALSE(query.success());
        EXPECT_FALSE(query.is_transient());
        EXPECT_EQ(query.attempts(), 1);
        const auto command = tools.executeNonQuery(sql, "refused");
        EXPECT_FALSE(command.success());
        EXPECT_FALSE(command.is_transient());
    }
    EXPECT_EQ(sleeps, 0);
}

TEST_F(DatabaseToolsTest, RefusedConnectionIsRetried) {
    const auto result = tools.executeQuery("SELECT 1", "refused");
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.is_transient());
    EXPECT_FALSE(result.has_diagnostic_code());
    EXPECT_EQ(result.attempts(), 3);
    EXPECT_EQ(result.suggestion(), pgshield::defaultAdvice().transient);
    EXPECT_EQ(sleeps, 2);
    EXPECT_EQ(pool.inUse("refused"), 0);
}

TEST_F(DatabaseToolsTest, RefusedUriConnectionIsRetried) {
    const auto result = tools.executeNonQuery("DELETE FROM t", "reporting");
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.is_transient());
    EXPECT_EQ(result.attempts(), 3);
}

TEST_F(DatabaseToolsTest, ConnectionTestUsesItsOwnAdvice) {
    const auto result = tools.testConnection("refused");
    EXPECT_FALSE(result.success());
    EXPECT_TRUE(result.is_transient());
    EXPECT_EQ(result.attempts(), 3);
    EXPECT_EQ(result.suggestion(), "Connection test failed with a transient error. Retrying automatically.");

    const auto missing = tools.testConnection("staging");
    EXPECT_FALSE(missing.success());
    EXPECT_EQ(missing.suggestion(),
        "Connection test failed. Please check your connection string and database availability.");
}

class ToRowsTest : public ::testing::Test {
protected:
    void SetUp() override {
        result.reset(PQmakeEmptyPGresult(nullptr, PGRES_TUPLES_OK));
        ASSERT_NE(result, nullptr);
        std::array<PGresAttDesc, 5> attrs {{
            {id.data(), 0, 0, 0, 23, 4, -1},
            {name.data(), 0, 0, 0, 25, -1, -1},
            {active.data(), 0, 0, 0, 16, 1, -1},
            {created.data(), 0, 0, 0, 1114, 8, -1},
            {price.data(), 0, 0, 0, 1700, -1, -1},
        }};
        ASSERT_NE(PQsetResultAttrs(result.get(), static_cast<int>(attrs.size()), attrs.data()), 0);
    }

    void set(int row, int field, const char* value) {
        ASSERT_NE(PQsetvalue(result.get(), row, field, const_cast<char*>(value), value == nullptr ? -1 : static_cast<int>(std::char_traits<char>::length(value))), 0);
    }

    std::string id {"id"};
    std::string name {"name"};
    std::string active {"active"};
    std::string created {"created"};
    std::string price {"price"};
    PgResult result;
};

TEST_F(ToRowsTest, MapsColumnsByType) {
    set(0, 0, "7");
    set(0, 1, "widget");
    set(0, 2, "t");
    set(0, 3, "2024-03-01 12:34:56.789123");
    set(0, 4, "19.50");
    const auto rows = pgshield::toRows(result.get());
    ASSERT_EQ(rows.values_size(), 1);
    const auto& row = rows.values(0).struct_value().fields();
    EXPECT_EQ(row.at("id").number_value(), 7);
    EXPECT_EQ(row.at("name").string_value(), "widget");
    EXPECT_TRUE(row.at("active").bool_value());
    EXPECT_EQ(row.at("created").string_value(), "2024-03-01 12:34:56");
    EXPECT_DOUBLE_EQ(row.at("price").number_value(), 19.5);
}

TEST_F(ToRowsTest, NullsAndSpecialNumbers) {
    set(0, 0, nullptr);
    set(0, 1, nullptr);
    set(0, 2, "f");
    set(0, 3, nullptr);
    set(0, 4, "NaN");
    const auto rows = pgshield::toRows(result.get());
    ASSERT_EQ(rows.values_size(), 1);
    const auto& row = rows.values(0).struct_value().fields();
    EXPECT_EQ(row.at("id").kind_case(), google::protobuf::Value::kNullValue);
    EXPECT_EQ(row.at("name").kind_case(), google::protobuf::Value::kNullValue);
    EXPECT_FALSE(row.at("active").bool_value());
    EXPECT_EQ(row.at("active").kind_case(), google::protobuf::Value::kBoolValue);
    EXPECT_EQ(row.at("price").string_value(), "NaN");
}

TEST_F(ToRowsTest, EmptyResultHasNoRows) {
    EXPECT_EQ(pgshield::toRows(result.get()).values_size(), 0);
}
