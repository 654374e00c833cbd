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
#ifndef PGSHIELD_ERROR_CLASSIFIER_H
#define PGSHIELD_ERROR_CLASSIFIER_H

#include "common/Error.hpp"
#include <optional>
#include <ostream>
#include <string>
#include <unordered_set>

namespace pgshield {

struct Classification {
    enum class Kind : char {
        Transient,
        Permanent
    };
    Kind kind;
    std::optional<std::string> diagnosticCode;
    bool networkLevel;

    [[nodiscard]] bool transient() const {
        return kind == Kind::Transient;
    }
};

std::ostream& operator<<(std::ostream& os, const Classification::Kind& kind);

// SQLSTATE codes worth retrying: connection, serialization/deadlock and
// resource exhaustion classes.
extern const std::unordered_set<std::string> transientSqlStates;

bool isTransientSqlState(const std::string& state);

bool isNetworkLevel(const ErrorCode& code);

// Walks the cause chain, at most maxCauseDepth links. A link with a SQLSTATE
// decides the result on its own; a network-level link without one is
// transient; anything else defers to its cause. No decision means permanent.
Classification classify(const Error& failure);

} // namespace pgshield

#endif // PGSHIELD_ERROR_CLASSIFIER_H
