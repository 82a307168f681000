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
#ifndef MESH_TST_SCRIPTED_PROBE_SERVICE_HPP
#define MESH_TST_SCRIPTED_PROBE_SERVICE_HPP

#include "proto/probe.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <atomic>
#include <cstdint>
#include <chrono>
#include <mutex>
#include <string>
#include <thread>
#include <utility>

// Probe whose first failures() calls fail with a chosen status; later calls
// succeed after an optional delay.
class ScriptedProbeService final : public mesh::probe::Probe::Service {
public:
    void failNext(int n, grpc::Status status) {
        std::lock_guard lock {m};
        remaining = n;
        failure = std::move(status);
    }

    void delayBy(std::chrono::milliseconds d) {
        std::lock_guard lock {m};
        delay = d;
    }

    grpc::Status ping(
        grpc::ServerContext* /*context*/,
        const mesh::probe::PingRequest* request,
        mesh::probe::PingReply* reply) override {
        auto n = ++calls;
        std::chrono::milliseconds wait {0};
        {
            std::lock_guard lock {m};
            if (remaining != 0) {
                if (remaining > 0) {
                    remaining--;
                }
                return failure;
            }
            wait = delay;
        }
        if (wait.count() > 0) {
            std::this_thread::sleep_for(wait);
        }
        reply->set_from("scripted");
        reply->set_message("PONG:" + request->message());
        reply->set_served(static_cast<uint64_t>(n));
        return grpc::Status::OK;
    }

    std::atomic<int> calls {0};
private:
    std::mutex m;
    // Negative fails forever.
    int remaining {0};
    grpc::Status failure;
    std::chrono::milliseconds delay {0};
};

#endif // MESH_TST_SCRIPTED_PROBE_SERVICE_HPP
