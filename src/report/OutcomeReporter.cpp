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
#include "report/OutcomeReporter.hpp"
#include "common/Outcome.hpp"
#include "proto/result.pb.h"
#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <string>
#include <utility>

namespace pgshield {

const Advice& defaultAdvice() {
    static const Advice advice {
        "This appears to be a transient error. The operation was retried automatically.",
        "This error requires attention and cannot be automatically retried."
    };
    return advice;
}

OutcomeReporter::OutcomeReporter(Advice a)
    : advice {std::move(a)} {}

proto::StructuredResult OutcomeReporter::render(const Outcome<google::protobuf::Struct>& outcome) const {
    return render(outcome, [](const google::protobuf::Struct& value, google::protobuf::Struct& data) {
        data = value;
    });
}

proto::StructuredResult OutcomeReporter::failure(const FailureReport& report) const {
    try {
        proto::StructuredResult result;
        result.set_success(false);
        result.set_error(report.message);
        if (report.classification.diagnosticCode.has_value()) {
            result.set_diagnostic_code(report.classification.diagnosticCode.value());
        }
        result.set_is_transient(report.classification.transient());
        result.set_suggestion(report.classification.transient() ? advice.transient : advice.permanent);
        result.set_attempts(report.attempts);
        return result;
    } catch (const std::exception& e) {
        spdlog::error("OutcomeReporter: failed to render failure: {}", e.what());
        return fallback(e.what());
    }
}

std::string OutcomeReporter::toJson(const proto::StructuredResult& result) {
    std::string json;
    google::protobuf::util::JsonPrintOptions options;
    options.add_whitespace = true;
    options.always_print_primitive_fields = true;
    auto status = google::protobuf::util::MessageToJsonString(result, &json, options);
    if (!status.ok()) {
        spdlog::error("OutcomeReporter: failed to print result as JSON: {}", std::string(status.message()));
        return R"({"success": false, "error": "Failed to render result"})";
    }
    return json;
}

proto::StructuredResult OutcomeReporter::fallback(const std::string& what) const {
    proto::StructuredResult result;
    result.set_success(false);
    result.set_error("Failed to render result: " + what);
    result.set_is_transient(false);
    result.set_suggestion(advice.permanent);
    return result;
}

} // namespace pgshield
