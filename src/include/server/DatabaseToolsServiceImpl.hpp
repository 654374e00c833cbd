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
#ifndef PGSHIELD_DATABASE_TOOLS_SERVICE_IMPL_H
#define PGSHIELD_DATABASE_TOOLS_SERVICE_IMPL_H

#include "server/RPCServer.hpp"
#include "tools/DatabaseTools.hpp"
#include <grpcpp/grpcpp.h>
#include <proto/tools.grpc.pb.h>
#include <proto/tools.pb.h>

namespace pgshield {

// Tool failures travel inside StructuredResult; the RPC status stays OK.
class DatabaseToolsServiceImpl final : public proto::DatabaseTools::Service {
public:
    explicit DatabaseToolsServiceImpl(const DatabaseTools& t);
    grpc::Status executeQuery(
        grpc::ServerContext* context,
        const proto::SqlRequest* request,
        proto::StructuredResult* reply) override;
    grpc::Status executeNonQuery(
        grpc::ServerContext* context,
        const proto::SqlRequest* request,
        proto::StructuredResult* reply) override;
    grpc::Status testConnection(
        grpc::ServerContext* context,
        const proto::DatabaseRequest* request,
        proto::StructuredResult* reply) override;
    grpc::Status listAvailableDatabases(
        grpc::ServerContext* context,
        const proto::ListDatabasesRequest* request,
        proto::StructuredResult* reply) override;
private:
    const DatabaseTools& tools;
};

using DatabaseToolsServer = RPCServer<DatabaseToolsServiceImpl>;

} // namespace pgshield

#endif // PGSHIELD_DATABASE_TOOLS_SERVICE_IMPL_H
