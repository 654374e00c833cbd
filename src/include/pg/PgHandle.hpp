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
#ifndef PGSHIELD_PG_HANDLE_H
#define PGSHIELD_PG_HANDLE_H

#include "client/ResourceHandle.hpp"
#include "common/Error.hpp"
#include "config/ProfileResolver.hpp"
#include <libpq-fe.h>
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>

namespace pgshield {

struct PgResultDeleter {
    void operator()(PGresult* r) const noexcept {
        PQclear(r);
    }
};

using PgResult = std::unique_ptr<PGresult, PgResultDeleter>;

// poll(2) timeout for the time left before a deadline, clamped to [0, INT_MAX].
int pollTimeout(std::chrono::milliseconds remaining);

// One libpq connection. Faults are mapped into Error: server errors keep
// their SQLSTATE, a lost connection is a Socket error, and an expired client
// deadline is a Timeout.
class PgHandle : public ResourceHandle {
public:
    PgHandle(ProfilePtr p, std::function<void()> release = {});
    ~PgHandle() override;
    PgHandle(const PgHandle&) = delete;
    PgHandle& operator=(const PgHandle&) = delete;
    PgHandle(PgHandle&&) = delete;
    PgHandle& operator=(PgHandle&&) = delete;

    [[nodiscard]] bool isOpen() const override;
    std::expected<void, Error> open() override;
    std::expected<void, Error> ping(std::chrono::milliseconds timeout) override;

    // Runs sql and returns the last result. Uses the profile's operation
    // timeout unless one is given.
    std::expected<PgResult, Error> execute(const std::string& sql);
    std::expected<PgResult, Error> execute(const std::string& sql, std::chrono::milliseconds timeout);

    const ResourceProfile& profile() const;

private:
    std::expected<PgResult, Error> awaitResult(std::chrono::milliseconds timeout);
    Error connectionError(const std::string& context) const;
    Error resultError(const PGresult* result) const;
    void cancel();
    void close();

    ProfilePtr resourceProfile;
    PGconn* conn{nullptr};
    std::function<void()> onRelease;
};

} // namespace pgshield

#endif // PGSHIELD_PG_HANDLE_H
