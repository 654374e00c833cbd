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
#ifndef PGSHIELD_TST_FAKE_CONNECTION_SOURCE_H
#define PGSHIELD_TST_FAKE_CONNECTION_SOURCE_H

#include "config/ConnectionSource.hpp"
#include <atomic>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace pgshield {

class FakeConnectionSource : public ConnectionSource {
public:
    explicit FakeConnectionSource(std::map<std::string, std::string> c) : connections {std::move(c)} {}
    std::optional<std::string> connectionString(const std::string& name) const override {
        lookups++;
        auto it = connections.find(name);
        if (it == connections.end()) {
            return std::nullopt;
        }
        return it->second;
    }
    std::vector<std::string> names() const override {
        std::vector<std::string> result;
        for (const auto& [name, conn] : connections) {
            result.push_back(name);
        }
        return result;
    }
    mutable std::atomic<int> lookups {0};
private:
    std::map<std::string, std::string> connections;
};

} // namespace pgshield

#endif // PGSHIELD_TST_FAKE_CONNECTION_SOURCE_H
