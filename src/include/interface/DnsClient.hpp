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
#ifndef MESH_DNS_CLIENT_HPP
#define MESH_DNS_CLIENT_HPP

#include "common/Error.hpp"
#include "discovery/DnsRecord.hpp"
#include <expected>
#include <string>
#include <vector>

namespace mesh {

class DnsClient {
public:
    virtual ~DnsClient() = default;

    // An empty answer is a value, not an error.
    virtual std::expected<std::vector<ServiceEndpointRecord>, Error> query(const std::string& domain, RecordType type) = 0;
};

} // namespace mesh

#endif // MESH_DNS_CLIENT_HPP
