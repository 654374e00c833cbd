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
#ifndef PGSHIELD_RETRY_EXECUTOR_H
#define PGSHIELD_RETRY_EXECUTOR_H

#include "client/HealthValidator.hpp"
#include "client/ResourceHandle.hpp"
#include "common/Error.hpp"
#include "common/ErrorClassifier.hpp"
#include "common/ExponentialBackoff.hpp"
#include "common/Jitter.hpp"
#include "common/Outcome.hpp"
#include "common/RetryPolicy.hpp"
#include "config/ProfileResolver.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <exception>
#include <expected>
#include <functional>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>

namespace pgshield {

void sleepFor(std::chrono::milliseconds delay);

// Bookkeeping of one run() call. Never shared between calls.
struct RetryState {
    enum class Phase : char {
        Idle,
        Attempting,
        BackingOff,
        Succeeded,
        Failed
    };
    Phase phase{Phase::Idle};
    int attempt{1};
    std::chrono::milliseconds currentDelay{0};
    std::optional<Error> lastFailure;
};

const char* toString(RetryState::Phase phase);

template<typename Handle>
class RetryExecutor {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;

    RetryExecutor(ProfileResolver& r, HandlePool<Handle>& p, const RetryPolicy rp = {}, Sleeper s = sleepFor)
        : resolver {r},
          pool {p},
          policy {rp},
          sleeper {std::move(s)} {}
    RetryExecutor(const RetryExecutor&) = delete;
    RetryExecutor& operator=(const RetryExecutor&) = delete;

    // operation: Handle& -> std::expected<T, Error>.
    template<typename F>
    auto run(const std::string& op, const std::string& resource, F&& operation) const {
        return run(op, resource, std::forward<F>(operation), policy);
    }

    template<typename F>
    auto run(const std::string& op, const std::string& resource, F&& operation, const RetryPolicy& p) const
        -> Outcome<typename std::invoke_result_t<F&, Handle&>::value_type>;

    const RetryPolicy& retryPolicy() const {
        return policy;
    }

private:
    template<typename T, typename F>
    std::expected<T, Error> attempt(const ProfilePtr& profile, F& operation, const RetryPolicy& p) const;

    static void transition(const std::string& op, RetryState& state, RetryState::Phase next) {
        spdlog::debug("RetryExecutor: {} {} -> {}", op, toString(state.phase), toString(next));
        state.phase = next;
    }

    ProfileResolver& resolver;
    HandlePool<Handle>& pool;
    const RetryPolicy policy;
    Sleeper sleeper;
};

template<typename Handle>
template<typename F>
auto RetryExecutor<Handle>::run(const std::string& op, const std::string& resource, F&& operation, const RetryPolicy& p) const
    -> Outcome<typename std::invoke_result_t<F&, Handle&>::value_type> {
    using T = typename std::invoke_result_t<F&, Handle&>::value_type;
    RetryState state;
    transition(op, state, RetryState::Phase::Attempting);

    auto profile = resolver.resolve(resource);
    if (!profile.has_value()) {
        transition(op, state, RetryState::Phase::Failed);
        spdlog::error("{} failed: {}", op, describe(profile.error()));
        return std::unexpected {toFailureReport(profile.error(), state.attempt)};
    }

    ExponentialBackoff backoff {p};
    Jitter jitter {p.jitterCeiling};
    while (true) {
        auto result = attempt<T>(profile.value(), operation, p);
        if (result.has_value()) {
            transition(op, state, RetryState::Phase::Succeeded);
            return std::move(result.value());
        }
        state.lastFailure = result.error();
        const auto classification = classify(result.error());
        std::optional<std::chrono::milliseconds> delay;
        if (classification.transient()) {
            delay = backoff.nextDelay().transform([&](std::chrono::milliseconds base) {
                return std::min(p.delayCap, base + jitter.next());
            });
        }
        // Permanent, or the attempt budget is spent.
        if (!delay.has_value()) {
            transition(op, state, RetryState::Phase::Failed);
            spdlog::error("{} failed after {} attempt(s) [{}]: {}",
                          op, state.attempt, classification.kind == Classification::Kind::Transient ? "transient" : "permanent",
                          describe(result.error()));
            return std::unexpected {FailureReport {classification, result.error().what, state.attempt}};
        }
        state.currentDelay = delay.value();
        spdlog::warn("[Retry] {} attempt {}/{} failed: {}", op, state.attempt, p.maxAttempts, result.error().what);
        spdlog::warn("[Retry] Waiting {}ms before retry...", state.currentDelay.count());
        transition(op, state, RetryState::Phase::BackingOff);
        sleeper(state.currentDelay);
        ++state.attempt;
        transition(op, state, RetryState::Phase::Attempting);
    }
}

template<typename Handle>
template<typename T, typename F>
std::expected<T, Error> RetryExecutor<Handle>::attempt(const ProfilePtr& profile, F& operation, const RetryPolicy& p) const {
    // The handle is released when this scope ends, before any backoff sleep.
    try {
        auto handle = pool.acquire(profile);
        if (!handle.has_value()) {
            return std::unexpected {handle.error()};
        }
        if (!handle.value()) {
            return std::unexpected {Error {ErrorCode::HandleUnusable, "Pool returned no connection"}};
        }
        auto live = ensureLive(*handle.value(), p.probeTimeout);
        if (!live.has_value()) {
            return std::unexpected {live.error()};
        }
        if (!live.value()) {
            return std::unexpected {Error {ErrorCode::HandleUnusable, "Failed to establish valid database connection"}};
        }
        return std::invoke(operation, *handle.value());
    } catch (const std::exception& e) {
        return std::unexpected {Error {ErrorCode::Internal, e.what()}};
    } catch (...) {
        return std::unexpected {Error {ErrorCode::Internal, "Unknown exception"}};
    }
}

} // namespace pgshield

#endif // PGSHIELD_RETRY_EXECUTOR_H
