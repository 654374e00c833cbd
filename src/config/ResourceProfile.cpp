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
#include "config/ResourceProfile.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

namespace pgshield {

namespace {

const std::unordered_map<std::string, std::string>& keywordAliases() {
    static const std::unordered_map<std::string, std::string> aliases {
        {"host", "host"},
        {"server", "host"},
        {"port", "port"},
        {"database", "dbname"},
        {"db", "dbname"},
        {"username", "user"},
        {"user name", "user"},
        {"user id", "user"},
        {"userid", "user"},
        {"user", "user"},
        {"password", "password"},
        {"pwd", "password"},
        {"ssl mode", "sslmode"},
        {"sslmode", "sslmode"},
        {"application name", "application_name"},
        {"target session attributes", "target_session_attrs"},
        {"passfile", "passfile"},
    };
    return aliases;
}

bool isUri(const std::string& raw) {
    return raw.starts_with("postgresql://") || raw.starts_with("postgres://");
}

} // namespace

void ProfilePolicy::validate() const {
    if (connectTimeout <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Connect timeout must be > zero.");
    }
    if (operationTimeout <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Operation timeout must be > zero.");
    }
    if (idleLifetime <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Idle lifetime must be > zero.");
    }
    if (pruningInterval <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Pruning interval must be > zero.");
    }
    if (keepAlive <= std::chrono::seconds::zero() || keepAliveInterval <= std::chrono::seconds::zero()) {
        throw std::invalid_argument("Keepalive intervals must be > zero.");
    }
    if (pool.min < 0) {
        throw std::invalid_argument("Min pool size must be >= zero.");
    }
    if (pool.max < 1) {
        throw std::invalid_argument("Max pool size must be >= one.");
    }
    if (pool.max < pool.min) {
        throw std::invalid_argument("Max pool size must be >= min pool size.");
    }
    if (statementCache.maxCached < 0 || statementCache.minUsages < 1) {
        throw std::invalid_argument("Statement cache thresholds are out of range.");
    }
}

ResourceProfile::ResourceProfile(std::string n, std::string raw, const ProfilePolicy& p)
    : name {std::move(n)},
      connectionString {std::move(raw)},
      connectTimeout {p.connectTimeout},
      operationTimeout {p.operationTimeout},
      pool {p.pool},
      idleLifetime {p.idleLifetime},
      pruningInterval {p.pruningInterval},
      keepAlive {p.keepAlive},
      keepAliveInterval {p.keepAliveInterval},
      statementCache {p.statementCache},
      loadBalanceHosts {p.loadBalanceHosts} {}

std::vector<std::pair<std::string, std::string>> ResourceProfile::connectionParameters() const {
    std::vector<std::pair<std::string, std::string>> params;
    bool hasApplicationName = false;
    if (isUri(connectionString)) {
        params.emplace_back("dbname", connectionString);
    } else {
        std::string_view rest {connectionString};
        while (!rest.empty()) {
            const auto end = rest.find(';');
            const auto pair = rest.substr(0, end);
            rest = end == std::string_view::npos ? std::string_view {} : rest.substr(end + 1);
            const auto eq = pair.find('=');
            if (eq == std::string_view::npos) {
                continue;
            }
            const auto key = toLower(trim(pair.substr(0, eq)));
            const auto value = trim(pair.substr(eq + 1));
            const auto& aliases = keywordAliases();
            if (auto it = aliases.find(key); it != aliases.end()) {
                hasApplicationName = hasApplicationName || it->second == "application_name";
                params.emplace_back(it->second, value);
            } else {
                spdlog::debug("Profile {}: ignoring connection string key '{}'", name, key);
            }
        }
    }
    params.emplace_back("connect_timeout", std::to_string(connectTimeout.count()));
    params.emplace_back("keepalives", "1");
    params.emplace_back("keepalives_idle", std::to_string(keepAlive.count()));
    params.emplace_back("keepalives_interval", std::to_string(keepAliveInterval.count()));
    params.emplace_back("options", "-c statement_timeout=" +
        std::to_string(std::chrono::duration_cast<std::chrono::milliseconds>(operationTimeout).count()));
    if (!hasApplicationName) {
        params.emplace_back("application_name", "pgshield");
    }
    if (loadBalanceHosts) {
        // Needs libpq 16 or newer.
        params.emplace_back("load_balance_hosts", "random");
    }
    return params;
}

} // namespace pgshield
