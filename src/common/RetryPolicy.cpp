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
#include "common/RetryPolicy.hpp"
#include <stdexcept>
#include <chrono>

namespace pgshield {

RetryPolicy::RetryPolicy()
    : RetryPolicy(
        3,
        std::chrono::milliseconds{500L},
        std::chrono::milliseconds{5000L},
        std::chrono::milliseconds{100L},
        std::chrono::milliseconds{5000L}) {}

RetryPolicy::RetryPolicy(
    int attempts,
    std::chrono::milliseconds initial,
    std::chrono::milliseconds cap,
    std::chrono::milliseconds jitter,
    std::chrono::milliseconds probe)
    : maxAttempts(attempts),
      initialDelay(initial),
      delayCap(cap),
      jitterCeiling(jitter),
      probeTimeout(probe) {
    if (attempts < 1) {
        throw std::invalid_argument("Max attempts must be >= one.");
    }
    if (initial < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Initial delay must be >= zero.");
    }
    if (cap < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Delay cap must be >= zero.");
    }
    if (jitter < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Jitter ceiling must be >= zero.");
    }
    if (probe <= std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Probe timeout must be > zero.");
    }
    if (cap < initial) {
        throw std::invalid_argument("Delay cap must be >= initial delay.");
    }
}

} // namespace pgshield
