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
#include <gtest/gtest.h>
#include "common/Error.hpp"
#include "config/FakeConnectionSource.hpp"
#include "config/ProfileResolver.hpp"
#include "config/ResourceProfile.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using pgshield::ErrorCode;
using pgshield::FakeConnectionSource;
using pgshield::ProfilePolicy;
using pgshield::ProfilePtr;
using pgshield::ProfileResolver;

class ProfileResolverTest : public ::testing::Test {
protected:
    FakeConnectionSource source {{
        {"prod", "Host=db.internal;Port=5432;Database=app;Username=svc;Password=pw"},
        {"analytics", "postgresql://reader@replica/warehouse"}
    }};
};

TEST_F(ProfileResolverTest, AppliesDefaultPolicy) {
    ProfileResolver resolver {source};
    auto profile = resolver.resolve("prod");
    ASSERT_TRUE(profile.has_value());
    const auto& p = *profile.value();
    EXPECT_EQ(p.name, "prod");
    EXPECT_EQ(p.connectionString, "Host=db.internal;Port=5432;Database=app;Username=svc;Password=pw");
    EXPECT_EQ(p.connectTimeout, std::chrono::seconds{30});
    EXPECT_EQ(p.operationTimeout, std::chrono::seconds{120});
    EXPECT_EQ(p.pool.min, 1);
    EXPECT_EQ(p.pool.max, 20);
    EXPECT_EQ(p.idleLifetime, std::chrono::seconds{300});
    EXPECT_EQ(p.pruningInterval, std::chrono::seconds{10});
    EXPECT_EQ(p.keepAlive, std::chrono::seconds{30});
    EXPECT_EQ(p.keepAliveInterval, std::chrono::seconds{10});
    EXPECT_EQ(p.statementCache.maxCached, 10);
    EXPECT_EQ(p.statementCache.minUsages, 2);
    EXPECT_FALSE(p.loadBalanceHosts);
}

TEST_F(ProfileResolverTest, UnknownNameIsNotFound) {
    ProfileResolver resolver {source};
    auto profile = resolver.resolve("staging");
    ASSERT_FALSE(profile.has_value());
    EXPECT_EQ(profile.error().code, ErrorCode::NotFound);
    EXPECT_EQ(profile.error().what,
        "No connection string found for database 'staging'. "
        "Available databases can be found using listAvailableDatabases()");
    EXPECT_FALSE(profile.error().sqlState.has_value());
    EXPECT_EQ(resolver.cached(), 0U);
}

TEST_F(ProfileResolverTest, EmptyNameIsInvalidArgument) {
    ProfileResolver resolver {source};
    auto profile = resolver.resolve("");
    ASSERT_FALSE(profile.has_value());
    EXPECT_EQ(profile.error().code, ErrorCode::InvalidArg);
}

TEST_F(ProfileResolverTest, ResolutionIsIdempotent) {
    ProfileResolver resolver {source};
    auto first = resolver.resolve("prod");
    auto second = resolver.resolve("prod");
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first.value().get(), second.value().get());
    EXPECT_EQ(source.lookups.load(), 1);
    EXPECT_EQ(resolver.cached(), 1U);
}

TEST_F(ProfileResolverTest, ConcurrentResolutionYieldsOneProfile) {
    ProfileResolver resolver {source};
    constexpr int threads = 16;
    std::vector<ProfilePtr> seen(threads);
    std::vector<std::thread> workers;
    for (int i = 0; i < threads; ++i) {
        workers.emplace_back([&resolver, &seen, i]() {
            auto profile = resolver.resolve("analytics");
            if (profile.has_value()) {
                seen[static_cast<size_t>(i)] = profile.value();
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }
    ASSERT_NE(seen[0], nullptr);
    for (const auto& p : seen) {
        EXPECT_EQ(p.get(), seen[0].get());
    }
    EXPECT_EQ(resolver.cached(), 1U);
}

TEST_F(ProfileResolverTest, CustomPolicyIsApplied) {
    ProfilePolicy policy {};
    policy.operationTimeout = std::chrono::seconds{45};
    policy.pool.max = 4;
    policy.loadBalanceHosts = true;
    ProfileResolver resolver {source, policy};
    auto profile = resolver.resolve("prod");
    ASSERT_TRUE(profile.has_value());
    EXPECT_EQ(profile.value()->operationTimeout, std::chrono::seconds{45});
    EXPECT_EQ(profile.value()->pool.max, 4);
    EXPECT_TRUE(profile.value()->loadBalanceHosts);
    EXPECT_EQ(resolver.policy(), policy);
}

TEST_F(ProfileResolverTest, InvalidPolicyThrows) {
    ProfilePolicy policy {};
    policy.pool.min = 10;
    policy.pool.max = 5;
    EXPECT_THROW(ProfileResolver(source, policy), std::invalid_argument);
    ProfilePolicy zeroTimeout {};
    zeroTimeout.connectTimeout = std::chrono::seconds{0};
    EXPECT_THROW(ProfileResolver(source, zeroTimeout), std::invalid_argument);
}
