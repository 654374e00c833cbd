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
#ifndef PGSHIELD_LOCKED_UNORDERED_MAP_H
#define PGSHIELD_LOCKED_UNORDERED_MAP_H

#include <cstddef>
#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <utility>

namespace pgshield {

template <typename Key, typename Value>
class LockedUnorderedMap {
public:
    // Inserts only when the key is absent. Returns the value stored under key,
    // which is the earlier one when another writer got there first.
    template<typename... Args>
    Value tryEmplace(const Key& key, Args&&... args) {
        std::unique_lock lock{mutex};
        return map.try_emplace(key, std::forward<Args>(args)...).first->second;
    }

    std::optional<Value> get(const Key& key) const {
        std::shared_lock lock{mutex};
        auto it = map.find(key);
        if (it == map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::size_t size() const {
        std::shared_lock lock{mutex};
        return map.size();
    }

private:
    std::unordered_map<Key, Value> map;
    mutable std::shared_mutex mutex;
};

} // namespace pgshield

#endif // PGSHIELD_LOCKED_UNORDERED_MAP_H
