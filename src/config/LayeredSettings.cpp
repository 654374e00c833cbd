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
#include "config/LayeredSettings.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include "proto/settings.pb.h"
#include <google/protobuf/util/json_util.h>
#include <spdlog/spdlog.h>
#include <chrono>
#include <expected>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

namespace pgshield {

std::expected<void, Error> LayeredSettings::addFile(const std::string& path, bool required) {
    const auto expanded = expandHome(path);
    std::ifstream in {expanded};
    if (!in) {
        if (required) {
            return std::unexpected {Error {ErrorCode::NotFound, "The configuration file '" + expanded + "' was not found"}};
        }
        spdlog::warn("Settings: optional layer {} not found, skipping", expanded);
        return {};
    }
    std::ostringstream content;
    content << in.rdbuf();
    if (in.bad()) {
        return std::unexpected {Error {ErrorCode::IO, "Failed to read configuration file '" + expanded + "'"}};
    }
    return addJson(content.str(), expanded);
}

std::expected<void, Error> LayeredSettings::addJson(const std::string& json, const std::string& origin) {
    proto::Settings layer;
    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = true;
    auto status = google::protobuf::util::JsonStringToMessage(json, &layer, options);
    if (!status.ok()) {
        return std::unexpected {Error {ErrorCode::InvalidArg,
            "Malformed settings in '" + origin + "': " + std::string(status.message())}};
    }
    for (const auto& [name, connection] : layer.connection_strings()) {
        connections[name] = connection;
    }
    if (layer.has_resilience()) {
        resilience.MergeFrom(layer.resilience());
    }
    loaded.push_back(origin);
    spdlog::info("Settings: loaded {} connection(s) from {}", layer.connection_strings_size(), origin);
    return {};
}

void LayeredSettings::set(const std::string& name, const std::string& connection) {
    connections[name] = connection;
}

std::optional<std::string> LayeredSettings::connectionString(const std::string& name) const {
    auto it = connections.find(name);
    if (it == connections.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> LayeredSettings::names() const {
    std::vector<std::string> result;
    result.reserve(connections.size());
    for (const auto& [name, connection] : connections) {
        result.push_back(name);
    }
    return result;
}

ProfilePolicy LayeredSettings::profilePolicy(ProfilePolicy base) const {
    if (resilience.has_command_timeout_seconds()) {
        base.operationTimeout = std::chrono::seconds {resilience.command_timeout_seconds()};
    }
    if (resilience.has_connection_timeout_seconds()) {
        base.connectTimeout = std::chrono::seconds {resilience.connection_timeout_seconds()};
    }
    if (resilience.has_min_pool_size()) {
        base.pool.min = resilience.min_pool_size();
    }
    if (resilience.has_max_pool_size()) {
        base.pool.max = resilience.max_pool_size();
    }
    if (resilience.has_keep_alive_seconds()) {
        base.keepAlive = std::chrono::seconds {resilience.keep_alive_seconds()};
    }
    return base;
}

RetryPolicy LayeredSettings::retryPolicy(const RetryPolicy& base) const {
    return RetryPolicy {
        resilience.has_max_retry_attempts() ? resilience.max_retry_attempts() : base.maxAttempts,
        resilience.has_initial_retry_delay_ms()
            ? std::chrono::milliseconds {resilience.initial_retry_delay_ms()} : base.initialDelay,
        resilience.has_max_retry_delay_ms()
            ? std::chrono::milliseconds {resilience.max_retry_delay_ms()} : base.delayCap,
        base.jitterCeiling,
        base.probeTimeout
    };
}

const std::vector<std::string>& LayeredSettings::sources() const {
    return loaded;
}

} // namespace pgshield
