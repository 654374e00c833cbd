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
#ifndef PGSHIELD_CONNECTION_SOURCE_H
#define PGSHIELD_CONNECTION_SOURCE_H

#include <optional>
#include <string>
#include <vector>

namespace pgshield {

// Raw lookup of connection strings by logical resource name.
class ConnectionSource {
public:
    virtual ~ConnectionSource() = default;
    virtual std::optional<std::string> connectionString(const std::string& name) const = 0;
    virtual std::vector<std::string> names() const = 0;
};

} // namespace pgshield

#endif // PGSHIELD_CONNECTION_SOURCE_H
