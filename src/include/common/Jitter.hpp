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
#ifndef PGSHIELD_JITTER_H
#define PGSHIELD_JITTER_H

#include <random>
#include <chrono>

namespace pgshield {

// Uniform jitter in [0, ceiling).
class Jitter {
public:
    explicit Jitter(const std::chrono::milliseconds c);
    std::chrono::milliseconds next();
private:
    std::chrono::milliseconds ceiling;
    std::mt19937 rng;
};

} // namespace pgshield

#endif // PGSHIELD_JITTER_H
