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
#include "client/EndpointDirectory.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <cstdint>
#include <map>
#include <stdexcept>
#include <string>
#include <unordered_map>

namespace mesh {

const std::unordered_map<std::string, std::string>& EndpointDirectory::defaultEndpoints() {
    static const std::unordered_map<std::string, std::string> map {
        {"api-gateway", "api-gateway:50051"},
        {"auth-service", "auth-service:50052"},
        {"session-service", "session-service:50053"},
        {"blockchain-service", "blockchain-service:50054"},
        {"node-service", "node-service:50055"},
        {"admin-service", "admin-service:50056"},
    };
    return map;
}

EndpointDirectory::EndpointDirectory()
    : EndpointDirectory(defaultEndpoints()) {}

EndpointDirectory::EndpointDirectory(const std::unordered_map<std::string, std::string>& e) {
    for (const auto& [service, endpoint] : e) {
        addEndpoint(service, endpoint);
    }
}

void EndpointDirectory::addEndpoint(const std::string& service, const std::string& endpoint) {
    std::string host;
    uint16_t port = 0;
    if (service.empty() || !split_host_port(endpoint, host, port)) {
        throw std::invalid_argument("EndpointDirectory: invalid endpoint '" + endpoint + "' for service '" + service + "'");
    }
    endpoints.insertOrAssign(service, endpoint);
    spdlog::debug("EndpointDirectory: {} -> {}", service, endpoint);
}

bool EndpointDirectory::removeEndpoint(const std::string& service) {
    return endpoints.erase(service);
}

std::optional<std::string> EndpointDirectory::endpointFor(const std::string& service) const {
    return endpoints.get(service);
}

std::map<std::string, std::string> EndpointDirectory::listEndpoints() const {
    auto snapshot = endpoints.snapshot();
    return {snapshot.begin(), snapshot.end()};
}

} // namespace mesh
