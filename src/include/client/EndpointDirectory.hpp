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
#ifndef MESH_ENDPOINT_DIRECTORY_H
#define MESH_ENDPOINT_DIRECTORY_H

#include "common/LockedUnorderedMap.hpp"
#include <map>
#include <optional>
#include <string>
#include <unordered_map>

namespace mesh {

// Static service name -> "host:port" table consulted when a channel is
// created without an explicit endpoint.
class EndpointDirectory {
public:
    EndpointDirectory();
    explicit EndpointDirectory(const std::unordered_map<std::string, std::string>& endpoints);
    EndpointDirectory(const EndpointDirectory&) = delete;
    EndpointDirectory& operator=(const EndpointDirectory&) = delete;

    void addEndpoint(const std::string& service, const std::string& endpoint);
    bool removeEndpoint(const std::string& service);
    [[nodiscard]] std::optional<std::string> endpointFor(const std::string& service) const;
    [[nodiscard]] std::map<std::string, std::string> listEndpoints() const;

    static const std::unordered_map<std::string, std::string>& defaultEndpoints();
private:
    LockedUnorderedMap<std::string, std::string> endpoints;
};

} // namespace mesh

#endif // MESH_ENDPOINT_DIRECTORY_H
