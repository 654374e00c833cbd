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
#ifndef PGSHIELD_RESOURCE_PROFILE_H
#define PGSHIELD_RESOURCE_PROFILE_H

#include <chrono>
#include <string>
#include <utility>
#include <vector>

namespace pgshield {

struct PoolBounds {
    int min{1};
    int max{20};
    bool operator==(const PoolBounds&) const = default;
};

struct StatementCache {
    int maxCached{10};
    int minUsages{2};
    bool operator==(const StatementCache&) const = default;
};

// Enrichment applied to every raw connection string.
struct ProfilePolicy {
    std::chrono::seconds connectTimeout{30};
    std::chrono::seconds operationTimeout{120};
    PoolBounds pool{};
    std::chrono::seconds idleLifetime{300};
    std::chrono::seconds pruningInterval{10};
    std::chrono::seconds keepAlive{30};
    std::chrono::seconds keepAliveInterval{10};
    StatementCache statementCache{};
    bool loadBalanceHosts{false};

    // Throws std::invalid_argument when bounds or timeouts are out of range.
    void validate() const;
    bool operator==(const ProfilePolicy&) const = default;
};

struct ResourceProfile {
    ResourceProfile(std::string n, std::string raw, const ProfilePolicy& p);

    std::string name;
    std::string connectionString;
    std::chrono::seconds connectTimeout;
    std::chrono::seconds operationTimeout;
    PoolBounds pool;
    std::chrono::seconds idleLifetime;
    std::chrono::seconds pruningInterval;
    std::chrono::seconds keepAlive;
    std::chrono::seconds keepAliveInterval;
    StatementCache statementCache;
    bool loadBalanceHosts;

    // libpq keyword/value pairs. The raw string comes first (a postgres://
    // URI is passed through as an expandable dbname, Key=Value; pairs are
    // translated), the enrichment follows and therefore wins.
    std::vector<std::pair<std::string, std::string>> connectionParameters() const;

    bool operator==(const ResourceProfile&) const = default;
};

} // namespace pgshield

#endif // PGSHIELD_RESOURCE_PROFILE_H
