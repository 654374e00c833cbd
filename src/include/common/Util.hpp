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
#ifndef PGSHIELD_UTIL_H
#define PGSHIELD_UTIL_H

#include <random>
#include <array>
#include <algorithm>
#include <functional>
#include <string>
#include <string_view>

template <typename T = std::mt19937>
auto random_generator() -> T {
    auto constexpr seed_bytes = sizeof(typename T::result_type) * T::state_size;
    auto constexpr seed_len = seed_bytes / sizeof(std::seed_seq::result_type);
    auto seed = std::array<std::seed_seq::result_type, seed_len>();
    auto dev = std::random_device();
    std::generate_n(begin(seed), seed_len, std::ref(dev));
    auto seed_seq = std::seed_seq(begin(seed), end(seed));
    return T{seed_seq};
}

namespace pgshield {

std::string trim(std::string_view s);

std::string toLower(std::string_view s);

// Expands a leading "~/" using $HOME.
std::string expandHome(const std::string& path);

// Resolves a relative file name against the directory of the running
// executable (/proc/self/exe, else argv0). Absolute paths pass through.
std::string besideExecutable(const std::string& file, const char* argv0 = nullptr);

} // namespace pgshield

#endif // PGSHIELD_UTIL_H
