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
#include "common/Jitter.hpp"
#include <chrono>
#include <stdexcept>
#include <random>
#include "common/Util.hpp"

namespace pgshield {

Jitter::Jitter(const std::chrono::milliseconds c) : ceiling {c}, rng(random_generator()) {
    if (c < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Negative duration is not supported");
    }
}

std::chrono::milliseconds Jitter::next() {
    if (ceiling <= std::chrono::milliseconds::zero()) {
        return std::chrono::milliseconds::zero();
    }
    std::uniform_int_distribution<std::chrono::milliseconds::rep> dist(0, ceiling.count() - 1);
    return std::chrono::milliseconds(dist(rng));
}

} // namespace pgshield
