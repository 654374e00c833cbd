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
#ifndef PGSHIELD_OUTCOME_H
#define PGSHIELD_OUTCOME_H

#include "common/Error.hpp"
#include "common/ErrorClassifier.hpp"
#include <expected>
#include <string>

namespace pgshield {

// Terminal failure of a call, after all attempts it was allowed.
struct FailureReport {
    Classification classification;
    std::string message;
    int attempts;
};

FailureReport toFailureReport(const Error& error, int attempts);

// The only shape that crosses the executor boundary.
template<typename T>
using Outcome = std::expected<T, FailureReport>;

} // namespace pgshield

#endif // PGSHIELD_OUTCOME_H
