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
#include "common/Error.hpp"
#include <utility>
#include <string>
#include <ostream>
#include <sstream>
#include <memory>

namespace pgshield {

std::ostream& operator<<(std::ostream& os, const ErrorCode& code) {
    os << toString(code);
    return os;
}

std::string toString(const ErrorCode& code) {
    switch (code)
    {
        case ErrorCode::OK: return "OK";
        case ErrorCode::InvalidArg: return "InvalidArgument";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::Database: return "Database";
        case ErrorCode::Socket: return "Socket";
        case ErrorCode::IO: return "IO";
        case ErrorCode::Timeout: return "Timeout";
        case ErrorCode::HandleUnusable: return "HandleUnusable";
        case ErrorCode::Internal: return "Internal";
        case ErrorCode::Unknown: return "Unknown";
    }
    std::unreachable();
}

Error::Error(const ErrorCode& c, std::string w) : code {c}, what {std::move(w)}, sqlState {}, cause {} {}
Error::Error(const ErrorCode& c, std::string w, std::string state) : code {c}, what {std::move(w)}, sqlState {std::move(state)}, cause {} {}
Error::Error(const ErrorCode& c, std::string w, Error inner)
    : code {c}, what {std::move(w)}, sqlState {}, cause {std::make_shared<const Error>(std::move(inner))} {}
Error::Error(const ErrorCode& c) : code {c}, what {toString(c)}, sqlState {}, cause {} {}

std::string describe(const Error& error) {
    std::ostringstream os;
    const Error* link = &error;
    for (std::size_t depth = 0; link != nullptr && depth < maxCauseDepth; ++depth) {
        if (depth > 0) {
            os << "\n  caused by: ";
        }
        os << link->code << ": " << link->what;
        if (link->sqlState.has_value()) {
            os << " (SQLSTATE " << link->sqlState.value() << ")";
        }
        link = link->cause.get();
    }
    if (link != nullptr) {
        os << "\n  ...";
    }
    return os.str();
}

} // namespace pgshield
