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
#ifndef PGSHIELD_LAYERED_SETTINGS_H
#define PGSHIELD_LAYERED_SETTINGS_H

#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "config/ConnectionSource.hpp"
#include "config/ResourceProfile.hpp"
#include <proto/settings.pb.h>
#include <expected>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pgshield {

// Connection strings and resilience overrides merged from JSON layers. Later
// layers win per connection name and per resilience field. Populate before
// sharing across threads; lookups are read-only.
class LayeredSettings : public ConnectionSource {
public:
    static constexpr const char* appSettingsFile = "appsettings.json";
    static constexpr const char* credentialsFile = "~/.postgres-mcp-server-creds.json";

    LayeredSettings() = default;

    // A missing file is an error only when the layer is required.
    std::expected<void, Error> addFile(const std::string& path, bool required);
    std::expected<void, Error> addJson(const std::string& json, const std::string& origin);
    void set(const std::string& name, const std::string& connection);

    std::optional<std::string> connectionString(const std::string& name) const override;
    std::vector<std::string> names() const override;

    ProfilePolicy profilePolicy(ProfilePolicy base = {}) const;
    RetryPolicy retryPolicy(const RetryPolicy& base = {}) const;

    // Origins of the layers that were merged, in order.
    const std::vector<std::string>& sources() const;

private:
    std::map<std::string, std::string> connections;
    proto::ResilienceSettings resilience;
    std::vector<std::string> loaded;
};

} // namespace pgshield

#endif // PGSHIELD_LAYERED_SETTINGS_H
