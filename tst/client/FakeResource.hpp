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
#ifndef PGSHIELD_TST_FAKE_RESOURCE_H
#define PGSHIELD_TST_FAKE_RESOURCE_H

#include "client/ResourceHandle.hpp"
#include "common/Error.hpp"
#include "config/ProfileResolver.hpp"
#include <chrono>
#include <deque>
#include <expected>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace pgshield {

// How one acquired handle behaves.
struct HandleScript {
    std::optional<Error> acquireError;
    std::optional<Error> openError;
    bool startsOpen {false};
    bool pingFails {false};
};

class FakeHandle : public ResourceHandle {
public:
    FakeHandle(HandleScript s, std::function<void()> release)
        : script {std::move(s)}, open_ {script.startsOpen}, onRelease {std::move(release)} {}
    ~FakeHandle() override {
        if (onRelease) {
            onRelease();
        }
    }
    FakeHandle(const FakeHandle&) = delete;
    FakeHandle& operator=(const FakeHandle&) = delete;

    [[nodiscard]] bool isOpen() const override {
        return open_;
    }
    std::expected<void, Error> open() override {
        opens++;
        if (script.openError.has_value()) {
            return std::unexpected {script.openError.value()};
        }
        open_ = true;
        return {};
    }
    std::expected<void, Error> ping(std::chrono::milliseconds timeout) override {
        pings++;
        lastProbeTimeout = timeout;
        if (script.pingFails) {
            return std::unexpected {Error {ErrorCode::Socket, "probe failed"}};
        }
        return {};
    }

    int opens {0};
    int pings {0};
    std::chrono::milliseconds lastProbeTimeout {0};
private:
    HandleScript script;
    bool open_;
    std::function<void()> onRelease;
};

// Hands out FakeHandles following a per-acquire script; once the script is
// exhausted every handle is healthy.
class FakePool : public HandlePool<FakeHandle> {
public:
    FakePool() = default;
    explicit FakePool(std::deque<HandleScript> s) : scripts {std::move(s)} {}

    std::expected<HandlePtr, Error> acquire(const ProfilePtr& profile) override {
        std::lock_guard lock {m};
        acquired++;
        lastProfile = profile;
        HandleScript script {};
        if (!scripts.empty()) {
            script = scripts.front();
            scripts.pop_front();
        }
        if (script.acquireError.has_value()) {
            return std::unexpected {script.acquireError.value()};
        }
        outstanding++;
        return std::make_unique<FakeHandle>(script, [this]() {
            std::lock_guard releaseLock {m};
            outstanding--;
            released++;
        });
    }

    int acquired {0};
    int released {0};
    int outstanding {0};
    ProfilePtr lastProfile;
private:
    std::mutex m;
    std::deque<HandleScript> scripts;
};

} // namespace pgshield

#endif // PGSHIELD_TST_FAKE_RESOURCE_H
