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
#ifndef PGSHIELD_RPC_SERVER_H
#define PGSHIELD_RPC_SERVER_H

#include <memory>
#include <grpcpp/grpcpp.h>
#include <spdlog/spdlog.h>
#include <thread>
#include <stdexcept>
#include <string>
#include <chrono>

namespace pgshield {

// Runs a synchronous gRPC service on its own thread. Every request is served
// on a gRPC worker thread, which is where retries and their backoff run.
template<typename Service>
class RPCServer {
public:
    RPCServer(const std::string& address, Service& s, std::chrono::milliseconds grace = std::chrono::milliseconds{1000L});
    ~RPCServer();
    RPCServer(const RPCServer&) = delete;
    RPCServer& operator=(const RPCServer&) = delete;
    RPCServer(RPCServer&&) = delete;
    RPCServer& operator=(RPCServer&&) = delete;
    void shutdown();
    const std::string& address() const;
    // The bound port, which differs from the requested one for ":0".
    int port() const;
private:
    std::string addr;
    Service& service;
    std::chrono::milliseconds shutdownGrace;
    int selectedPort {0};
    std::unique_ptr<grpc::Server> server;
    std::thread serverThread;
};

template<typename Service>
RPCServer<Service>::RPCServer(const std::string& address, Service& s, std::chrono::milliseconds grace)
    : addr{address}, service {s}, shutdownGrace {grace} {
    grpc::ServerBuilder sb{};
    sb.AddListeningPort(addr, grpc::InsecureServerCredentials(), &selectedPort);
    sb.RegisterService(&service);
    server = sb.BuildAndStart();
    if (!server || selectedPort == 0) {
        throw std::runtime_error("Failed to start gRPC server on address: " + address);
    }
    spdlog::info("RPCServer: listening on {} (port {})", addr, selectedPort);
    serverThread = std::thread([this]() { server->Wait(); });
}

template<typename Service>
void RPCServer<Service>::shutdown() {
    if (server) {
        spdlog::info("RPCServer: shutting down {}", addr);
        server->Shutdown(std::chrono::system_clock::now() + shutdownGrace);
    }
    if (serverThread.joinable()) {
        serverThread.join();
    }
    server.reset();
}

template<typename Service>
const std::string& RPCServer<Service>::address() const {
    return addr;
}

template<typename Service>
int RPCServer<Service>::port() const {
    return selectedPort;
}

template<typename Service>
RPCServer<Service>::~RPCServer() {
    shutdown();
}

} // namespace pgshield

#endif // PGSHIELD_RPC_SERVER_H
