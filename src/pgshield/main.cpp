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
#include "client/RetryExecutor.hpp"
#include "common/Util.hpp"
#include "config/LayeredSettings.hpp"
#include "config/ProfileResolver.hpp"
#include "pg/PgHandle.hpp"
#include "pg/PgHandlePool.hpp"
#include "server/DatabaseToolsServiceImpl.hpp"
#include "tools/DatabaseTools.hpp"
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/cfg/env.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include "spdlog/spdlog.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

using pgshield::DatabaseTools;
using pgshield::DatabaseToolsServer;
using pgshield::DatabaseToolsServiceImpl;
using pgshield::LayeredSettings;
using pgshield::PgHandle;
using pgshield::PgHandlePool;
using pgshield::ProfileResolver;
using pgshield::RetryExecutor;

namespace {

std::atomic<bool> stopRequested {false};

void onSignal(int /*signal*/) {
    stopRequested.store(true);
}

struct Options {
    std::string listen {"localhost:50051"};
    std::string settings {};
};

void usage(const char* prog) {
    std::cerr << "Usage: " << prog << " [--listen host:port] [--settings path]\n";
}

bool parse(int argc, char** argv, Options& options) {
    for (int i = 1; i < argc; ++i) {
        const std::string_view arg {argv[i]};
        if ((arg == "--listen" || arg == "--settings") && i + 1 < argc) {
            (arg == "--listen" ? options.listen : options.settings) = argv[++i];
        } else {
            return false;
        }
    }
    return true;
}

void setupLogging() {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/pgshield.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "gAsync", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);
    // e.g. SPDLOG_LEVEL=debug
    spdlog::cfg::load_env_levels();
}

int serve(const Options& options) {
    LayeredSettings settings {};
    if (auto loaded = settings.addFile(options.settings, true); !loaded.has_value()) {
        spdlog::warn("Settings: {}", pgshield::describe(loaded.error()));
    }
    if (auto loaded = settings.addFile(pgshield::expandHome(LayeredSettings::credentialsFile), false); !loaded.has_value()) {
        spdlog::warn("Credentials: {}", pgshield::describe(loaded.error()));
    }
    spdlog::info("Configured databases: {}", settings.names().size());

    ProfileResolver resolver {settings, settings.profilePolicy()};
    PgHandlePool pool {};
    const RetryExecutor<PgHandle> executor {resolver, pool, settings.retryPolicy()};
    const DatabaseTools tools {settings, resolver, executor};
    DatabaseToolsServiceImpl service {tools};
    DatabaseToolsServer server {options.listen, service};
    spdlog::info("PGShield serving DatabaseTools on {}", server.address());

    while (!stopRequested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    spdlog::info("PGShield stopping...");
    server.shutdown();
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    Options options {};
    if (!parse(argc, argv, options)) {
        usage(argv[0]);
        return 2;
    }
    if (options.settings.empty()) {
        options.settings = pgshield::besideExecutable(LayeredSettings::appSettingsFile, argv[0]);
    }
    setupLogging();
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);
    spdlog::info("PGShield! Starting...");
    int rc = 0;
    try {
        rc = serve(options);
    } catch (const std::exception& e) {
        spdlog::critical("PGShield: {}", e.what());
        rc = 1;
    }
    spdlog::shutdown();
    return rc;
}
