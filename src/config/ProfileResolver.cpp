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
#include "config/ProfileResolver.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <expected>
#include <memory>
#include <string>

namespace pgshield {

ProfileResolver::ProfileResolver(const ConnectionSource& s, const ProfilePolicy p)
    : source {s},
      profilePolicy {p} {
    profilePolicy.validate();
}

std::expected<ProfilePtr, Error> ProfileResolver::resolve(const std::string& name) {
    if (name.empty()) {
        return std::unexpected {Error {ErrorCode::InvalidArg, "Database name must not be empty"}};
    }
    if (auto cachedProfile = profiles.get(name); cachedProfile.has_value()) {
        return cachedProfile.value();
    }
    auto raw = source.connectionString(name);
    if (!raw.has_value()) {
        return std::unexpected {Error {ErrorCode::NotFound,
            "No connection string found for database '" + name +
            "'. Available databases can be found using listAvailableDatabases()"}};
    }
    auto profile = profiles.tryEmplace(name, std::make_shared<const ResourceProfile>(name, raw.value(), profilePolicy));
    spdlog::debug("ProfileResolver: resolved profile {}", name);
    return profile;
}

const ProfilePolicy& ProfileResolver::policy() const {
    return profilePolicy;
}

size_t ProfileResolver::cached() const {
    return profiles.size();
}

} // namespace pgshield
