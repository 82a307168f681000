// SPDX-License-Identifier: AGPL-3.0-or-later
/*
 * MeshCore a service-mesh communication layer.
 * Copyright (C) 2025 Ahmed Refaat Gadalla Mohamed
 *
 * This program is free software: you can redistribute it and/or modify it under the terms of the GNU Affero General Public License as published by the Free Software Foundation, either version 3 of the License, or (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful, but WITHOUT ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public License along with this program. If not, see <https://www.gnu.org/licenses/>.
 */
#include "mesh/MeshConfig.hpp"
#include "mesh/MeshRuntime.hpp"
#include "client/ChannelManager.hpp"
#include "common/Health.hpp"
#include "proto/probe.grpc.pb.h"
#include <spdlog/common.h>
#include "spdlog/async.h"
#include "spdlog/async_logger.h"
#include "spdlog/spdlog.h"
#include "spdlog/sinks/rotating_file_sink.h"
#include "spdlog/sinks/stdout_color_sinks.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <exception>
#include <memory>
#include <string>
#include <thread>
#include <utility>
#include <vector>

using mesh::MeshConfig;
using mesh::MeshRuntime;
using mesh::CallOptions;
using mesh::probe::Probe;
using mesh::probe::PingRequest;
using mesh::probe::PingReply;

namespace {

std::atomic<bool> stopRequested {false};

extern "C" void onSignal(int /*signal*/) {
    stopRequested.store(true);
}

void setupLogging() {
    spdlog::init_thread_pool(8192, 1);
    auto consoleSink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto fileSink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        "logs/mesh.txt", 1024 * 1024 * 5, 3);
    std::vector<spdlog::sink_ptr> sinks {consoleSink, fileSink};
    const auto asyncLogger = std::make_shared<spdlog::async_logger>(
        "meshd", sinks.begin(), sinks.end(),
        spdlog::thread_pool(), spdlog::async_overflow_policy::overrun_oldest);
    spdlog::register_logger(asyncLogger);
    spdlog::set_default_logger(asyncLogger);
}

void sleepUnlessStopped(std::chrono::milliseconds d) {
    const auto until = std::chrono::steady_clock::now() + d;
    while (!stopRequested.load() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds{50});
    }
}

void pingPeers(MeshRuntime& runtime, const std::vector<std::string>& peers) {
    const CallOptions options {std::chrono::seconds{2}, 1, &stopRequested};
    while (!stopRequested.load()) {
        for (const auto& peer : peers) {
            PingRequest request;
            request.set_from(runtime.config().nodeId);
            request.set_message("PING");
            auto reply = runtime.channels().call(peer, "ping", &Probe::Stub::ping, request, options);
            if (reply.has_value()) {
                spdlog::info("[{}] {} answered {} (served {})",
                    runtime.config().nodeId, peer, reply->message(), reply->served());
            } else {
                spdlog::warn("[{}] ping {} failed: {} ({})", runtime.config().nodeId, peer,
                    reply.error().what, mesh::toString(reply.error().code));
            }
            spdlog::info("[{}] {} is {}", runtime.config().nodeId, peer,
                mesh::toString(runtime.dependencyHealth(peer)));
        }
        sleepUnlessStopped(std::chrono::seconds{3});
    }
}

} // namespace

int main(int argc, char** argv) {
    if (argc < 2) {
        spdlog::error("usage: {} <listen-address> [service=host:port ...]", argv[0]);
        return 2;
    }
    setupLogging();
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    MeshConfig config;
    try {
        config.server = mesh::ServerConfig {argv[1], 10, true};
        config.nodeId = argv[1];
        config.endpoints.clear();
        std::vector<std::string> peers;
        for (int i = 2; i < argc; ++i) {
            const std::string arg {argv[i]};
            auto eq = arg.find('=');
            if (eq == std::string::npos || eq == 0) {
                spdlog::error("invalid peer '{}', expected service=host:port", arg);
                spdlog::shutdown();
                return 2;
            }
            config.endpoints.insert_or_assign(arg.substr(0, eq), arg.substr(eq + 1));
            peers.push_back(arg.substr(0, eq));
        }

        MeshRuntime runtime {config};
        for (const auto& peer : peers) {
            auto stub = runtime.channels().createServiceStub<Probe>(peer);
            if (!stub.has_value()) {
                spdlog::error("no stub for {}: {}", peer, stub.error().what);
            }
        }
        auto started = runtime.start();
        if (!started.has_value()) {
            spdlog::error("failed to start: {}", started.error().what);
            spdlog::shutdown();
            return 1;
        }
        spdlog::info("meshd {} listening on port {}", config.nodeId, runtime.server().boundPort());

        pingPeers(runtime, peers);

        spdlog::info("meshd {} shutting down", config.nodeId);
        auto stopped = runtime.stop();
        if (!stopped.has_value()) {
            spdlog::error("stop failed: {}", stopped.error().what);
        }
    } catch (const std::exception& e) {
        spdlog::error("meshd: {}", e.what());
        spdlog::shutdown();
        return 1;
    }
    spdlog::shutdown();
    return 0;
}
