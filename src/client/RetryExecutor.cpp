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
#include "client/RetryExecutor.hpp"
#include <chrono>
#include <thread>
#include <utility>

namespace pgshield {

void sleepFor(std::chrono::milliseconds delay) {
    if (delay > std::chrono::milliseconds::zero()) {
        std::this_thread::sleep_for(delay);
    }
}

const char* toString(RetryState::Phase phase) {
    switch (phase) {
        case RetryState::Phase::Idle: return "Idle";
        case RetryState::Phase::Attempting: return "Attempting";
        case RetryState::Phase::BackingOff: return "BackingOff";
        case RetryState::Phase::Succeeded: return "Succeeded";
        case RetryState::Phase::Failed: return "Failed";
    }
    std::unreachable();
}

} // namespace pgshield
