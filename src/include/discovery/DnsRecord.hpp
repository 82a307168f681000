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
#ifndef MESH_DNS_RECORD_HPP
#define MESH_DNS_RECORD_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <ostream>

namespace mesh {

enum class RecordType : char {
    A,
    AAAA,
    SRV
};

std::string toString(const RecordType& type);

// Case-insensitive; nullopt for anything but A, AAAA and SRV.
std::optional<RecordType> parseRecordType(const std::string& s);

struct ServiceEndpointRecord {
    RecordType type;
    // Address for A/AAAA, target host for SRV.
    std::string address;
    uint16_t port = 0;
    uint16_t priority = 0;
    uint16_t weight = 0;
    uint32_t ttl = 0;

    bool operator==(const ServiceEndpointRecord& other) const = default;
};

struct Endpoint {
    std::string host;
    uint16_t port;

    bool operator==(const Endpoint& other) const = default;
};

std::ostream& operator<<(std::ostream& os, const ServiceEndpointRecord& record);
std::ostream& operator<<(std::ostream& os, const Endpoint& endpoint);

} // namespace mesh

#endif // MESH_DNS_RECORD_HPP
