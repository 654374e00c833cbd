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
#include "server/DatabaseToolsServiceImpl.hpp"
#include "tools/DatabaseTools.hpp"
#include <grpcpp/support/status.h>
#include "proto/tools.pb.h"
#include "proto/result.pb.h"
#include <tuple>

namespace pgshield {

DatabaseToolsServiceImpl::DatabaseToolsServiceImpl(const DatabaseTools& t)
    : tools {t} {}

grpc::Status DatabaseToolsServiceImpl::executeQuery(
    grpc::ServerContext* context,
    const proto::SqlRequest* request,
    proto::StructuredResult* reply) {
    std::ignore = context;
    *reply = tools.executeQuery(request->sql(), request->database());
    return grpc::Status::OK;
}

grpc::Status DatabaseToolsServiceImpl::executeNonQuery(
    grpc::ServerContext* context,
    const proto::SqlRequest* request,
    proto::StructuredResult* reply) {
    std::ignore = context;
    *reply = tools.executeNonQuery(request->sql(), request->database());
    return grpc::Status::OK;
}

grpc::Status DatabaseToolsServiceImpl::testConnection(
    grpc::ServerContext* context,
    const proto::DatabaseRequest* request,
    proto::StructuredResult* reply) {
    std::ignore = context;
    *reply = tools.testConnection(request->database());
    return grpc::Status::OK;
}

grpc::Status DatabaseToolsServiceImpl::listAvailableDatabases(
    grpc::ServerContext* context,
    const proto::ListDatabasesRequest* request,
    proto::StructuredResult* reply) {
    std::ignore = context;
    std::ignore = request;
    *reply = tools.listAvailableDatabases();
    return grpc::Status::OK;
}

} // namespace pgshield
