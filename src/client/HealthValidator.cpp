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
#include "client/HealthValidator.hpp"
#include "client/ResourceHandle.hpp"
#include "common/Error.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>

namespace pgshield {

std::expected<bool, Error> ensureLive(ResourceHandle& handle, std::chrono::milliseconds probeTimeout) {
    if (!handle.isOpen()) {
        auto opened = handle.open();
        if (!opened.has_value()) {
            return std::unexpected {opened.error()};
        }
    }
    auto probe = handle.ping(probeTimeout);
    if (!probe.has_value()) {
        spdlog::debug("HealthValidator: probe failed: {}", describe(probe.error()));
        return false;
    }
    return true;
}

} // namespace pgshield
