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
#ifndef PGSHIELD_COMMON_ERROR_HPP
#define PGSHIELD_COMMON_ERROR_HPP

#include <string>
#include <ostream>
#include <optional>
#include <memory>
#include <cstddef>

namespace pgshield {

// Failure kinds. Client libraries map their own faults into this vocabulary.
enum class ErrorCode {
    OK = 0,
    InvalidArg = 1,
    NotFound = 2,
    Database = 3,
    Socket = 4,
    IO = 5,
    Timeout = 6,
    HandleUnusable = 7,
    Internal = 9,
    Unknown = 128
};

// Cause chains longer than this are not inspected.
inline constexpr std::size_t maxCauseDepth = 10;

std::ostream& operator<<(std::ostream& os, const ErrorCode& code);

std::string toString(const ErrorCode& code);

struct Error {
    ErrorCode code;
    std::string what;
    std::optional<std::string> sqlState;
    std::shared_ptr<const Error> cause;

    Error(const ErrorCode& c, std::string w);
    Error(const ErrorCode& c, std::string w, std::string state);
    Error(const ErrorCode& c, std::string w, Error inner);
    explicit Error(const ErrorCode& c);
};

// One line per link of the cause chain, outermost first.
std::string describe(const Error& error);

} // namespace pgshield

#endif // PGSHIELD_COMMON_ERROR_HPP
