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
#include "server/ProbeServiceImpl.hpp"
#include "common/Error.hpp"
#include "common/ErrorConverter.hpp"
#include <spdlog/spdlog.h>
#include <string>
#include <utility>

namespace mesh {

ProbeServiceImpl::ProbeServiceImpl(std::string nodeId)
    : id {std::move(nodeId)} {}

grpc::Status ProbeServiceImpl::ping(
    grpc::ServerContext* /*context*/,
    const probe::PingRequest* request,
    probe::PingReply* reply) {
    if (request->from().empty()) {
        return toGrpcStatus(Error{ErrorCode::InvalidArg, "ping without sender", id});
    }
    auto n = count.fetch_add(1, std::memory_order_relaxed) + 1;
    spdlog::debug("[{}] ping from {}: {}", id, request->from(), request->message());
    reply->set_from(id);
    reply->set_message("PONG");
    reply->set_served(n);
    return grpc::Status::OK;
}

uint64_t ProbeServiceImpl::served() const {
    return count.load(std::memory_order_relaxed);
}

const std::string& ProbeServiceImpl::nodeId() const {
    return id;
}

} // namespace mesh
