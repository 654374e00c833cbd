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
#ifndef PGSHIELD_PG_HANDLE_POOL_H
#define PGSHIELD_PG_HANDLE_POOL_H

#include "client/ResourceHandle.hpp"
#include "common/Error.hpp"
#include "config/ProfileResolver.hpp"
#include "pg/PgHandle.hpp"
#include <condition_variable>
#include <expected>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace pgshield {

// Opens a fresh libpq connection per acquisition and closes it on release.
// At most profile.pool.max handles per profile are out at once; acquire
// waits up to the profile's connect timeout for a slot.
class PgHandlePool : public HandlePool<PgHandle> {
public:
    PgHandlePool() = default;
    PgHandlePool(const PgHandlePool&) = delete;
    PgHandlePool& operator=(const PgHandlePool&) = delete;
    std::expected<HandlePtr, Error> acquire(const ProfilePtr& profile) override;
    int inUse(const std::string& name) const;
private:
    struct Gate {
        std::mutex m;
        std::condition_variable cv;
        int inUse{0};
    };
    std::shared_ptr<Gate> gate(const std::string& name) const;
    mutable std::mutex m;
    mutable std::unordered_map<std::string, std::shared_ptr<Gate>> gates;
};

} // namespace pgshield

#endif // PGSHIELD_PG_HANDLE_POOL_H
