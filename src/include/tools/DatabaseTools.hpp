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
#ifndef PGSHIELD_DATABASE_TOOLS_H
#define PGSHIELD_DATABASE_TOOLS_H

#include "client/RetryExecutor.hpp"
#include "config/LayeredSettings.hpp"
#include "config/ProfileResolver.hpp"
#include "pg/PgHandle.hpp"
#include "report/OutcomeReporter.hpp"
#include <proto/result.pb.h>
#include <google/protobuf/struct.pb.h>
#include <libpq-fe.h>
#include <string>

namespace pgshield {

// Converts a PGresult into a list of column -> value objects.
google::protobuf::ListValue toRows(const PGresult* result);

class DatabaseTools {
public:
    DatabaseTools(const LayeredSettings& s, ProfileResolver& r, const RetryExecutor<PgHandle>& e);
    DatabaseTools(const DatabaseTools&) = delete;
    DatabaseTools& operator=(const DatabaseTools&) = delete;

    proto::StructuredResult executeQuery(const std::string& sql, const std::string& database) const;
    proto::StructuredResult executeNonQuery(const std::string& sql, const std::string& database) const;
    proto::StructuredResult testConnection(const std::string& database) const;
    proto::StructuredResult listAvailableDatabases() const;

private:
    const LayeredSettings& settings;
    ProfileResolver& resolver;
    const RetryExecutor<PgHandle>& executor;
    OutcomeReporter reporter;
    OutcomeReporter connectionReporter;
};

} // namespace pgshield

#endif // PGSHIELD_DATABASE_TOOLS_H
