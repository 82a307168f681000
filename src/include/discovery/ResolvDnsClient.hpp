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
#ifndef MESH_RESOLV_DNS_CLIENT_HPP
#define MESH_RESOLV_DNS_CLIENT_HPP

#include "interface/DnsClient.hpp"
#include "common/Error.hpp"
#include "discovery/DnsRecord.hpp"
#include <chrono>
#include <expected>
#include <string>
#include <vector>

namespace mesh {

// Queries the system resolver (/etc/resolv.conf) through libresolv. Every
// query gets its own resolver state, so one client can be shared by threads.
class ResolvDnsClient final : public DnsClient {
public:
    explicit ResolvDnsClient(std::chrono::seconds timeout = std::chrono::seconds{2L}, int attempts = 2);
    std::expected<std::vector<ServiceEndpointRecord>, Error> query(const std::string& domain, RecordType type) override;
private:
    std::chrono::seconds timeout;
    int attempts;
};

} // namespace mesh

#endif // MESH_RESOLV_DNS_CLIENT_HPP
