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
#ifndef MESH_CHANNEL_OPTIONS_H
#define MESH_CHANNEL_OPTIONS_H

#include <chrono>
#include <grpcpp/support/channel_arguments.h>

namespace mesh {

struct KeepAliveOptions {
    std::chrono::milliseconds pingInterval {30000};
    std::chrono::milliseconds pingTimeout {5000};
    bool permitWithoutCalls {true};
    std::chrono::milliseconds minPingInterval {10000};

    [[nodiscard]] grpc::ChannelArguments toChannelArguments() const;
};

} // namespace mesh

#endif // MESH_CHANNEL_OPTIONS_H
