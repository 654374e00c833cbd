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
#include "tools/DatabaseTools.hpp"
#include "common/Error.hpp"
#include "common/Outcome.hpp"
#include "common/Util.hpp"
#include "pg/PgHandle.hpp"
#include "proto/result.pb.h"
#include <google/protobuf/struct.pb.h>
#include <libpq-fe.h>
#include <spdlog/spdlog.h>
#include <charconv>
#include <chrono>
#include <cstdlib>
#include <exception>
#include <expected>
#include <string>
#include <string_view>

namespace pgshield {

namespace {

// Type OIDs from pg_type.
constexpr Oid boolOid = 16;
constexpr Oid int8Oid = 20;
constexpr Oid int2Oid = 21;
constexpr Oid int4Oid = 23;
constexpr Oid oidOid = 26;
constexpr Oid float4Oid = 700;
constexpr Oid float8Oid = 701;
constexpr Oid numericOid = 1700;
constexpr Oid timestampOid = 1114;
constexpr Oid timestamptzOid = 1184;

constexpr std::chrono::milliseconds connectionTestTimeout {10000L};

void setCell(google::protobuf::Value& cell, Oid type, std::string_view text) {
    switch (type) {
        case boolOid:
            cell.set_bool_value(text == "t");
            return;
        case int2Oid:
        case int4Oid:
        case int8Oid:
        case oidOid:
        case float4Oid:
        case float8Oid:
        case numericOid:
        {
            double number = 0;
            auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), number);
            if (ec == std::errc {} && ptr == text.data() + text.size()) {
                cell.set_number_value(number);
            } else {
                // NaN, Infinity and friends.
                cell.set_string_value(std::string(text));
            }
            return;
        }
        case timestampOid:
        case timestamptzOid:
            // yyyy-MM-dd HH:mm:ss
            cell.set_string_value(std::string(text.substr(0, 19)));
            return;
        default:
            cell.set_string_value(std::string(text));
    }
}

const char* const connectionTestSql =
    "SELECT to_char(now(), 'YYYY-MM-DD HH24:MI:SS'), current_database(), pg_backend_pid(), version()";

void logFailure(const FailureReport& report, const char* op, const std::string& database, const std::string& sql) {
    spdlog::error("{} on '{}' failed after {} attempt(s): {} [SQLSTATE {}, {}] SQL: {}",
                  op, database, report.attempts, report.message,
                  report.classification.diagnosticCode.value_or("none"),
                  report.classification.transient() ? "transient" : "permanent", sql);
}

std::expected<void, Error> requireSql(const std::string& sql) {
    if (trim(sql).empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "SQL statement must not be empty"}};
    }
    return {};
}

} // namespace

google::protobuf::ListValue toRows(const PGresult* result) {
    google::protobuf::ListValue rows;
    const int rowCount = PQntuples(result);
    const int fieldCount = PQnfields(result);
    for (int row = 0; row < rowCount; ++row) {
        auto& fields = *rows.add_values()->mutable_struct_value()->mutable_fields();
        for (int field = 0; field < fieldCount; ++field) {
            auto& cell = fields[PQfname(result, field)];
            if (PQgetisnull(result, row, field) != 0) {
                cell.set_null_value(google::protobuf::NULL_VALUE);
                continue;
            }
            setCell(cell, PQftype(result, field),
                    std::string_view {PQgetvalue(result, row, field), static_cast<size_t>(PQgetlength(result, row, field))});
        }
    }
    return rows;
}

DatabaseTools::DatabaseTools(const LayeredSettings& s, ProfileResolver& r, const RetryExecutor<PgHandle>& e)
    : settings {s},
      resolver {r},
      executor {e},
      reporter {},
      connectionReporter {Advice {
          "Connection test failed with a transient error. Retrying automatically.",
          "Connection test failed. Please check your connection string and database availability."
      }} {}

proto::StructuredResult DatabaseTools::executeQuery(const std::string& sql, const std::string& database) const {
    spdlog::debug("executeQuery on {}: {}", database, sql);
    if (auto valid = requireSql(sql); !valid.has_value()) {
        const auto report = toFailureReport(valid.error(), 1);
        logFailure(report, "executeQuery", database, sql);
        return reporter.failure(report);
    }
    auto outcome = executor.run("executeQuery", database, [&sql](PgHandle& handle) -> std::expected<google::protobuf::ListValue, Error> {
        auto result = handle.execute(sql);
        if (!result.has_value()) {
            return std::unexpected {result.error()};
        }
        return toRows(result.value().get());
    });
    if (!outcome.has_value()) {
        logFailure(outcome.error(), "executeQuery", database, sql);
    }
    return reporter.render(outcome, [&database](const google::protobuf::ListValue& rows, google::protobuf::Struct& data) {
        auto& fields = *data.mutable_fields();
        fields["rowCount"].set_number_value(rows.values_size());
        fields["database"].set_string_value(database);
        *fields["data"].mutable_list_value() = rows;
    });
}

proto::StructuredResult DatabaseTools::executeNonQuery(const std::string& sql, const std::string& database) const {
    spdlog::debug("executeNonQuery on {}: {}", database, sql);
    if (auto valid = requireSql(sql); !valid.has_value()) {
        const auto report = toFailureReport(valid.error(), 1);
        logFailure(report, "executeNonQuery", database, sql);
        return reporter.failure(report);
    }
    auto outcome = executor.run("executeNonQuery", database, [&sql](PgHandle& handle) -> std::expected<long, Error> {
        auto result = handle.execute(sql);
        if (!result.has_value()) {
            return std::unexpected {result.error()};
        }
        const char* affected = PQcmdTuples(result.value().get());
        if (affected == nullptr || *affected == '\0') {
            return 0L;
        }
        return std::strtol(affected, nullptr, 10);
    });
    if (!outcome.has_value()) {
        logFailure(outcome.error(), "executeNonQuery", database, sql);
    }
    return reporter.render(outcome, [&database](long rowsAffected, google::protobuf::Struct& data) {
        auto& fields = *data.mutable_fields();
        fields["rowsAffected"].set_number_value(static_cast<double>(rowsAffected));
        fields["database"].set_string_value(database);
        fields["message"].set_string_value("Command executed successfully. " + std::to_string(rowsAffected) + " rows affected.");
    });
}

proto::StructuredResult DatabaseTools::testConnection(const std::string& database) const {
    auto outcome = executor.run("testConnection", database, [&database](PgHandle& handle) -> std::expected<google::protobuf::Struct, Error> {
        auto result = handle.execute(connectionTestSql, connectionTestTimeout);
        if (!result.has_value()) {
            return std::unexpected {result.error()};
        }
        const PGresult* r = result.value().get();
        if (PQntuples(r) < 1 || PQnfields(r) < 4) {
            return std::unexpected {Error {ErrorCode::Internal, "Unexpected connection test result"}};
        }
        const auto& profile = handle.profile();
        google::protobuf::Struct data;
        auto& fields = *data.mutable_fields();
        fields["message"].set_string_value("Connection successful");
        fields["database"].set_string_value(database);
        fields["serverTime"].set_string_value(PQgetvalue(r, 0, 0));
        fields["databaseName"].set_string_value(PQgetvalue(r, 0, 1));
        fields["processId"].set_number_value(std::strtod(PQgetvalue(r, 0, 2), nullptr));
        fields["serverVersion"].set_string_value(PQgetvalue(r, 0, 3));
        fields["poolingEnabled"].set_bool_value(true);
        fields["connectionTimeout"].set_number_value(static_cast<double>(profile.connectTimeout.count()));
        fields["commandTimeout"].set_number_value(static_cast<double>(profile.operationTimeout.count()));
        fields["keepAlive"].set_number_value(static_cast<double>(profile.keepAlive.count()));
        fields["maxPoolSize"].set_number_value(profile.pool.max);
        return data;
    });
    if (!outcome.has_value()) {
        logFailure(outcome.error(), "testConnection", database, connectionTestSql);
    }
    return connectionReporter.render(outcome);
}

proto::StructuredResult DatabaseTools::listAvailableDatabases() const {
    try {
        proto::StructuredResult result;
        result.set_success(true);
        auto& fields = *result.mutable_data()->mutable_fields();
        auto& databases = *fields["availableDatabases"].mutable_list_value();
        for (const auto& name : settings.names()) {
            databases.add_values()->set_string_value(name);
        }
        const auto& sources = settings.sources();
        fields["credentialsSource"].set_string_value(sources.empty() ? std::string {LayeredSettings::appSettingsFile} : sources.back());

        const auto& retry = executor.retryPolicy();
        const auto& profile = resolver.policy();
        auto& resilience = *fields["resilienceSettings"].mutable_struct_value()->mutable_fields();
        resilience["maxRetryAttempts"].set_number_value(retry.maxAttempts);
        resilience["commandTimeoutSeconds"].set_number_value(static_cast<double>(profile.operationTimeout.count()));
        resilience["connectionTimeoutSeconds"].set_number_value(static_cast<double>(profile.connectTimeout.count()));
        resilience["poolingEnabled"].set_bool_value(true);
        resilience["keepAliveSeconds"].set_number_value(static_cast<double>(profile.keepAlive.count()));
        return result;
    } catch (const std::exception& e) {
        spdlog::error("listAvailableDatabases failed: {}", e.what());
        return reporter.failure(toFailureReport(Error {ErrorCode::Internal, e.what()}, 1));
    }
}

} // namespace pgshield
