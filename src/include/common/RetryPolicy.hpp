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
#ifndef PGSHIELD_RETRY_POLICY_H
#define PGSHIELD_RETRY_POLICY_H

#include <chrono>

namespace pgshield {

struct RetryPolicy {
    // 3 attempts, 500ms initial delay capped at 5s, up to 100ms of jitter,
    // 5s health probe.
    RetryPolicy();
    RetryPolicy(
        int attempts,
        std::chrono::milliseconds initial,
        std::chrono::milliseconds cap,
        std::chrono::milliseconds jitter,
        std::chrono::milliseconds probe
    );
    int maxAttempts;
    std::chrono::milliseconds initialDelay;
    std::chrono::milliseconds delayCap;
    std::chrono::milliseconds jitterCeiling;
    std::chrono::milliseconds probeTimeout;
};

} // namespace pgshield

#endif // PGSHIELD_RETRY_POLICY_H
