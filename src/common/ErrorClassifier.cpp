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
#include "common/ErrorClassifier.hpp"
#include "common/Error.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <unordered_set>

namespace pgshield {

std::ostream& operator<<(std::ostream& os, const Classification::Kind& kind) {
    switch (kind) {
        case Classification::Kind::Transient:
            os << "Transient";
            break;
        case Classification::Kind::Permanent:
            os << "Permanent";
            break;
    }
    return os;
}

const std::unordered_set<std::string> transientSqlStates = {
    // connection_exception
    "08000",
    // connection_does_not_exist
    "08003",
    // connection_failure
    "08006",
    // sqlclient_unable_to_establish_sqlconnection
    "08001",
    // sqlserver_rejected_establishment_of_sqlconnection
    "08004",
    // serialization_failure
    "40001",
    // deadlock_detected
    "40P01",
    // insufficient_resources
    "53000",
    // disk_full
    "53100",
    // out_of_memory
    "53200",
    // too_many_connections
    "53300",
};

bool isTransientSqlState(const std::string& state) {
    return transientSqlStates.contains(state);
}

bool isNetworkLevel(const ErrorCode& code) {
    switch (code) {
        case ErrorCode::Socket:
        case ErrorCode::IO:
        case ErrorCode::Timeout:
            return true;
        default:
            return false;
    }
}

Classification classify(const Error& failure) {
    const Error* link = &failure;
    for (std::size_t depth = 0; link != nullptr && depth < maxCauseDepth; ++depth) {
        if (link->sqlState.has_value()) {
            const auto& state = link->sqlState.value();
            return Classification {
                isTransientSqlState(state) ? Classification::Kind::Transient : Classification::Kind::Permanent,
                state,
                false
            };
        }
        if (isNetworkLevel(link->code)) {
            return Classification {Classification::Kind::Transient, std::nullopt, true};
        }
        link = link->cause.get();
    }
    return Classification {Classification::Kind::Permanent, std::nullopt, false};
}

} // namespace pgshield
