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
#include "client/ChannelOptions.hpp"
#include <grpc/grpc.h>
#include <grpcpp/support/channel_arguments.h>

namespace mesh {

namespace {

int toMillis(std::chrono::milliseconds d) {
    return static_cast<int>(d.count());
}

} // namespace

grpc::ChannelArguments KeepAliveOptions::toChannelArguments() const {
    grpc::ChannelArguments args;
    args.SetInt(GRPC_ARG_KEEPALIVE_TIME_MS, toMillis(pingInterval));
    args.SetInt(GRPC_ARG_KEEPALIVE_TIMEOUT_MS, toMillis(pingTimeout));
    args.SetInt(GRPC_ARG_KEEPALIVE_PERMIT_WITHOUT_CALLS, permitWithoutCalls ? 1 : 0);
    args.SetInt(GRPC_ARG_HTTP2_MIN_SENT_PING_INTERVAL_WITHOUT_DATA_MS, toMillis(minPingInterval));
    return args;
}

} // namespace mesh
