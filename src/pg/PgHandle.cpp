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
#include "pg/PgHandle.hpp"
#include "common/Error.hpp"
#include "common/Util.hpp"
#include <libpq-fe.h>
#include <spdlog/spdlog.h>
#include <poll.h>
#include <algorithm>
#include <array>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <expected>
#include <limits>
#include <string>
#include <utility>
#include <vector>

namespace pgshield {

namespace {

struct FatalMessage {
    const char* fragment;
    const char* sqlState;
};

// libpq reports connection-time rejections as text only. These are the ones
// that will not go away on retry.
constexpr std::array<FatalMessage, 4> fatalConnectMessages {{
    {"password authentication failed", "28P01"},
    {"no pg_hba.conf entry", "28000"},
    {"role \"", "28000"},
    {"database \"", "3D000"},
}};

} // namespace

int pollTimeout(std::chrono::milliseconds remaining) {
    constexpr auto maxTimeout = std::chrono::milliseconds {std::numeric_limits<int>::max()};
    return static_cast<int>(std::clamp(remaining, std::chrono::milliseconds::zero(), maxTimeout).count());
}

PgHandle::PgHandle(ProfilePtr p, std::function<void()> release)
    : resourceProfile {std::move(p)},
      onRelease {std::move(release)} {}

PgHandle::~PgHandle() {
    close();
    if (onRelease) {
        onRelease();
    }
}

bool PgHandle::isOpen() const {
    return conn != nullptr && PQstatus(conn) == CONNECTION_OK;
}

std::expected<void, Error> PgHandle::open() {
    close();
    const auto params = resourceProfile->connectionParameters();
    std::vector<const char*> keywords;
    std::vector<const char*> values;
    keywords.reserve(params.size() + 1);
    values.reserve(params.size() + 1);
    for (const auto& [keyword, value] : params) {
        keywords.push_back(keyword.c_str());
        values.push_back(value.c_str());
    }
    keywords.push_back(nullptr);
    values.push_back(nullptr);

    conn = PQconnectdbParams(keywords.data(), values.data(), 1);
    if (conn == nullptr) {
        return std::unexpected {Error {ErrorCode::Internal, "libpq could not allocate a connection"}};
    }
    if (PQstatus(conn) != CONNECTION_OK) {
        auto error = connectionError("Failed to connect to '" + resourceProfile->name + "'");
        close();
        return std::unexpected {error};
    }
    spdlog::debug("PgHandle: connected to {} (backend pid {})", resourceProfile->name, PQbackendPID(conn));
    return {};
}

std::expected<void, Error> PgHandle::ping(std::chrono::milliseconds timeout) {
    auto result = execute("SELECT 1", timeout);
    if (!result.has_value()) {
        return std::unexpected {result.error()};
    }
    return {};
}

std::expected<PgResult, Error> PgHandle::execute(const std::string& sql) {
    return execute(sql, std::chrono::duration_cast<std::chrono::milliseconds>(resourceProfile->operationTimeout));
}

std::expected<PgResult, Error> PgHandle::execute(const std::string& sql, std::chrono::milliseconds timeout) {
    if (conn == nullptr) {
        return std::unexpected {Error {ErrorCode::Socket, "Connection to '" + resourceProfile->name + "' is not open"}};
    }
    if (PQsendQuery(conn, sql.c_str()) == 0) {
        if (PQstatus(conn) == CONNECTION_BAD) {
            return std::unexpected {connectionError("Connection lost")};
        }
        return std::unexpected {Error {ErrorCode::InvalidArg, trim(PQerrorMessage(conn))}};
    }
    return awaitResult(timeout);
}

const ResourceProfile& PgHandle::profile() const {
    return *resourceProfile;
}

std::expected<PgResult, Error> PgHandle::awaitResult(std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    PgResult last;
    PgResult failed;
    while (true) {
        if (PQconsumeInput(conn) == 0) {
            return std::unexpected {connectionError("Connection lost")};
        }
        while (PQisBusy(conn) == 0) {
            PGresult* r = PQgetResult(conn);
            if (r == nullptr) {
                if (failed) {
                    return std::unexpected {resultError(failed.get())};
                }
                if (!last) {
                    return std::unexpected {Error {ErrorCode::Internal, "Statement produced no result"}};
                }
                return std::move(last);
            }
            const auto status = PQresultStatus(r);
            if ((status == PGRES_FATAL_ERROR || status == PGRES_BAD_RESPONSE) && !failed) {
                failed.reset(r);
            } else {
                last.reset(r);
            }
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now());
        if (remaining <= std::chrono::milliseconds::zero()) {
            cancel();
            // The connection is left in an unknown state; never hand it out again.
            close();
            return std::unexpected {Error {ErrorCode::Timeout,
                "Statement timed out after " + std::to_string(timeout.count()) + "ms"}};
        }
        pollfd pfd {PQsocket(conn), POLLIN, 0};
        const int rc = ::poll(&pfd, 1, pollTimeout(remaining));
        if (rc < 0 && errno != EINTR) {
            return std::unexpected {Error {ErrorCode::IO, std::string("poll failed: ") + std::strerror(errno)}};
        }
    }
}

Error PgHandle::connectionError(const std::string& context) const {
    const std::string message = context + ": " + (conn != nullptr ? trim(PQerrorMessage(conn)) : std::string {"no connection"});
    for (const auto& fatal : fatalConnectMessages) {
        if (message.find(fatal.fragment) != std::string::npos) {
            return Error {ErrorCode::Database, message, fatal.sqlState};
        }
    }
    return Error {ErrorCode::Socket, message};
}

Error PgHandle::resultError(const PGresult* result) const {
    const char* state = PQresultErrorField(result, PG_DIAG_SQLSTATE);
    const char* primary = PQresultErrorField(result, PG_DIAG_MESSAGE_PRIMARY);
    std::string message = primary != nullptr ? std::string {primary} : trim(PQresultErrorMessage(result));
    if (state == nullptr) {
        if (PQstatus(conn) == CONNECTION_BAD) {
            return Error {ErrorCode::Socket, "Connection lost: " + message};
        }
        return Error {ErrorCode::Unknown, message};
    }
    Error error {ErrorCode::Database, message, state};
    if (PQstatus(conn) == CONNECTION_BAD) {
        return Error {ErrorCode::Socket, "Connection lost: " + message, error};
    }
    return error;
}

void PgHandle::cancel() {
    PGcancel* c = PQgetCancel(conn);
    if (c == nullptr) {
        return;
    }
    std::array<char, 256> buffer {};
    if (PQcancel(c, buffer.data(), static_cast<int>(buffer.size())) == 0) {
        spdlog::warn("PgHandle: cancel request to {} failed: {}", resourceProfile->name, buffer.data());
    }
    PQfreeCancel(c);
}

void PgHandle::close() {
    if (conn != nullptr) {
        PQfinish(conn);
        conn = nullptr;
    }
}

} // namespace pgshield
