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
#include "discovery/DnsRecord.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <ostream>
#include <string>
#include <utility>

namespace mesh {

std::string toString(const RecordType& type) {
    switch (type) {
        case RecordType::A: return "A";
        case RecordType::AAAA: return "AAAA";
        case RecordType::SRV: return "SRV";
    }
    std::unreachable();
}

std::optional<RecordType> parseRecordType(const std::string& s) {
    std::string upper {s};
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char c) {
        return static_cast<char>(std::toupper(c));
    });
    if (upper == "A") {
        return RecordType::A;
    }
    if (upper == "AAAA") {
        return RecordType::AAAA;
    }
    if (upper == "SRV") {
        return RecordType::SRV;
    }
    return std::nullopt;
}

std::ostream& operator<<(std::ostream& os, const ServiceEndpointRecord& record) {
    os << toString(record.type) << " " << record.address;
    if (record.type == RecordType::SRV) {
        os << ":" << record.port << " priority=" << record.priority << " weight=" << record.weight;
    }
    os << " ttl=" << record.ttl;
    return os;
}

std::ostream& operator<<(std::ostream& os, const Endpoint& endpoint) {
    os << endpoint.host << ":" << endpoint.port;
    return os;
}

} // namespace mesh
