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
#ifndef PGSHIELD_PROFILE_RESOLVER_H
#define PGSHIELD_PROFILE_RESOLVER_H

#include "common/Error.hpp"
#include "common/LockedUnorderedMap.hpp"
#include "config/ConnectionSource.hpp"
#include "config/ResourceProfile.hpp"
#include <expected>
#include <memory>
#include <string>

namespace pgshield {

using ProfilePtr = std::shared_ptr<const ResourceProfile>;

// Maps a logical resource name to its enriched profile. The first successful
// resolution of a name is cached for the lifetime of the resolver and every
// later call returns that same profile.
class ProfileResolver {
public:
    explicit ProfileResolver(const ConnectionSource& s, const ProfilePolicy p = {});
    ProfileResolver(const ProfileResolver&) = delete;
    ProfileResolver& operator=(const ProfileResolver&) = delete;
    std::expected<ProfilePtr, Error> resolve(const std::string& name);
    const ProfilePolicy& policy() const;
    size_t cached() const;
private:
    const ConnectionSource& source;
    const ProfilePolicy profilePolicy;
    LockedUnorderedMap<std::string, ProfilePtr> profiles;
};

} // namespace pgshield

#endif // PGSHIELD_PROFILE_RESOLVER_H
