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
#include "common/ExponentialBackoff.hpp"
#include "common/RetryPolicy.hpp"

#include <algorithm>
#include <optional>
#include <chrono>
#include <cstdint>
#include <spdlog/spdlog.h>

namespace pgshield {

namespace {
// 2^30 times any sane initial delay is already far past every cap.
constexpr int maxShift = 30;
} // namespace

ExponentialBackoff::ExponentialBackoff(const RetryPolicy p)
    : policy {p} {}

std::optional<std::chrono::milliseconds> ExponentialBackoff::nextDelay() {
    if (attempt >= policy.maxAttempts - 1) {
        return std::nullopt;
    }
    auto baseCount = static_cast<uint64_t>(policy.initialDelay.count());
    auto delay = baseCount << static_cast<unsigned int>(std::min(attempt, maxShift));
    attempt++;
    spdlog::debug("ExponentialBackoff: Attempt {}, delay: {}ms, delayCap: {}ms", attempt, delay, policy.delayCap.count());
    return std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(
        std::min(delay, static_cast<uint64_t>(policy.delayCap.count()))));
}

} // namespace pgshield
