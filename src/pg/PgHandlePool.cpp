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
#include "pg/PgHandlePool.hpp"
#include "common/Error.hpp"
#include "pg/PgHandle.hpp"
#include <spdlog/spdlog.h>
#include <expected>
#include <memory>
#include <mutex>
#include <string>

namespace pgshield {

std::shared_ptr<PgHandlePool::Gate> PgHandlePool::gate(const std::string& name) const {
    std::lock_guard lock{m};
    auto& g = gates[name];
    if (!g) {
        g = std::make_shared<Gate>();
    }
    return g;
}

std::expected<PgHandlePool::HandlePtr, Error> PgHandlePool::acquire(const ProfilePtr& profile) {
    auto g = gate(profile->name);
    auto release = [g] {
        {
            std::lock_guard lock{g->m};
            --g->inUse;
        }
        g->cv.notify_one();
    };
    std::unique_lock lock{g->m};
    const int limit = profile->pool.max;
    if (!g->cv.wait_for(lock, profile->connectTimeout, [&g, limit] { return g->inUse < limit; })) {
        return std::unexpected {Error {ErrorCode::Timeout,
            "Timed out waiting for a free connection to '" + profile->name + "'"}};
    }
    // Built under the gate lock so the slot is only taken once the handle exists.
    auto handle = std::make_unique<PgHandle>(profile, release);
    ++g->inUse;
    spdlog::debug("PgHandlePool: {} handles in use for {}", g->inUse, profile->name);
    return handle;
}

int PgHandlePool::inUse(const std::string& name) const {
    auto g = gate(name);
    std::lock_guard lock{g->m};
    return g->inUse;
}

} // namespace pgshield
