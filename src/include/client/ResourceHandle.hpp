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
#ifndef PGSHIELD_RESOURCE_HANDLE_H
#define PGSHIELD_RESOURCE_HANDLE_H

#include "common/Error.hpp"
#include "config/ProfileResolver.hpp"
#include <chrono>
#include <expected>
#include <memory>
#include <type_traits>

namespace pgshield {

// A live connection to a data store, as far as the resilience layer cares.
class ResourceHandle {
public:
    virtual ~ResourceHandle() = default;
    [[nodiscard]] virtual bool isOpen() const = 0;
    virtual std::expected<void, Error> open() = 0;
    // Minimal round trip that does no real work.
    virtual std::expected<void, Error> ping(std::chrono::milliseconds timeout) = 0;
};

// Hands out handles for a profile. Destroying the returned pointer releases
// the handle back to the pool. acquire may block while the pool is at
// capacity.
template<typename Handle>
class HandlePool {
public:
    static_assert(std::is_base_of_v<ResourceHandle, Handle>, "Handle must derive from ResourceHandle");
    using HandlePtr = std::unique_ptr<Handle>;
    virtual ~HandlePool() = default;
    virtual std::expected<HandlePtr, Error> acquire(const ProfilePtr& profile) = 0;
};

} // namespace pgshield

#endif // PGSHIELD_RESOURCE_HANDLE_H
