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
#ifndef PGSHIELD_OUTCOME_REPORTER_H
#define PGSHIELD_OUTCOME_REPORTER_H

#include "common/Outcome.hpp"
#include <proto/result.pb.h>
#include <google/protobuf/struct.pb.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <string>

namespace pgshield {

struct Advice {
    std::string transient;
    std::string permanent;
};

const Advice& defaultAdvice();

// Turns an Outcome into the external result shape. Never throws: a fault
// while rendering yields a minimal failure result instead.
class OutcomeReporter {
public:
    explicit OutcomeReporter(Advice a = defaultAdvice());

    // encode: (const T&, google::protobuf::Struct&) -> void
    template<typename T, typename Encoder>
    proto::StructuredResult render(const Outcome<T>& outcome, Encoder&& encode) const;

    proto::StructuredResult render(const Outcome<google::protobuf::Struct>& outcome) const;

    proto::StructuredResult failure(const FailureReport& report) const;

    static std::string toJson(const proto::StructuredResult& result);

private:
    proto::StructuredResult fallback(const std::string& what) const;
    Advice advice;
};

template<typename T, typename Encoder>
proto::StructuredResult OutcomeReporter::render(const Outcome<T>& outcome, Encoder&& encode) const {
    try {
        if (!outcome.has_value()) {
            return failure(outcome.error());
        }
        proto::StructuredResult result;
        result.set_success(true);
        encode(outcome.value(), *result.mutable_data());
        return result;
    } catch (const std::exception& e) {
        spdlog::error("OutcomeReporter: failed to render result: {}", e.what());
        return fallback(e.what());
    } catch (...) {
        spdlog::error("OutcomeReporter: failed to render result: unknown error");
        return fallback("unknown error");
    }
}

} // namespace pgshield

#endif // PGSHIELD_OUTCOME_REPORTER_H
