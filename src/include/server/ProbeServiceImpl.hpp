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
#ifndef MESH_PROBE_SERVICE_IMPL_H
#define MESH_PROBE_SERVICE_IMPL_H

#include "proto/probe.grpc.pb.h"
#include <grpcpp/grpcpp.h>
#include <atomic>
#include <cstdint>
#include <string>

namespace mesh {

// Diagnostic Probe service every mesh node mounts.
class ProbeServiceImpl final : public probe::Probe::Service {
public:
    explicit ProbeServiceImpl(std::string nodeId);
    grpc::Status ping(
        grpc::ServerContext* context,
        const probe::PingRequest* request,
        probe::PingReply* reply) override;
    [[nodiscard]] uint64_t served() const;
    [[nodiscard]] const std::string& nodeId() const;
private:
    const std::string id;
    std::atomic<uint64_t> count {0};
};

} // namespace mesh

#endif // MESH_PROBE_SERVICE_IMPL_H
