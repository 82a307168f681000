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
#include "discovery/ResolvDnsClient.hpp"
#include "common/Error.hpp"
#include "discovery/DnsRecord.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <expected>
#include <string>
#include <vector>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <arpa/nameser.h>
#include <netdb.h>
#include <resolv.h>

namespace mesh {

namespace {

int toNsType(RecordType type) {
    switch (type) {
        case RecordType::A: return ns_t_a;
        case RecordType::AAAA: return ns_t_aaaa;
        case RecordType::SRV: return ns_t_srv;
    }
    return ns_t_a;
}

bool extractRecord(const ns_msg& handle, const ns_rr& record, RecordType type, ServiceEndpointRecord& out) {
    const unsigned char* rdata = ns_rr_rdata(record);
    const auto rdlen = ns_rr_rdlen(record);
    out.type = type;
    out.ttl = ns_rr_ttl(record);
    if (type == RecordType::A && ns_rr_type(record) == ns_t_a && rdlen == sizeof(in_addr)) {
        std::array<char, INET_ADDRSTRLEN> buf{};
        if (inet_ntop(AF_INET, rdata, buf.data(), buf.size()) == nullptr) {
            return false;
        }
        out.address = buf.data();
        return true;
    }
    if (type == RecordType::AAAA && ns_rr_type(record) == ns_t_aaaa && rdlen == sizeof(in6_addr)) {
        std::array<char, INET6_ADDRSTRLEN> buf{};
        if (inet_ntop(AF_INET6, rdata, buf.data(), buf.size()) == nullptr) {
            return false;
        }
        out.address = buf.data();
        return true;
    }
    if (type == RecordType::SRV && ns_rr_type(record) == ns_t_srv && rdlen > 6) {
        // priority, weight, port, then the (possibly compressed) target name
        out.priority = static_cast<uint16_t>(ns_get16(rdata));
        out.weight = static_cast<uint16_t>(ns_get16(rdata + 2));
        out.port = static_cast<uint16_t>(ns_get16(rdata + 4));
        std::array<char, NS_MAXDNAME> target{};
        if (dn_expand(ns_msg_base(handle), ns_msg_end(handle), rdata + 6, target.data(), static_cast<int>(target.size())) < 0) {
            return false;
        }
        out.address = target.data();
        return true;
    }
    return false;
}

} // namespace

ResolvDnsClient::ResolvDnsClient(std::chrono::seconds t, int a)
    : timeout {t},
      attempts {a} {}

std::expected<std::vector<ServiceEndpointRecord>, Error> ResolvDnsClient::query(const std::string& domain, RecordType type) {
    struct __res_state resolver{};
    if (res_ninit(&resolver) != 0) {
        return std::unexpected {Error{ErrorCode::ResolutionFailure, "res_ninit failed", domain}};
    }
    resolver.retrans = static_cast<int>(timeout.count());
    resolver.retry = attempts;

    std::array<unsigned char, 4096> buffer{};
    const int len = res_nquery(&resolver, domain.c_str(), ns_c_in, toNsType(type), buffer.data(), static_cast<int>(buffer.size()));
    if (len < 0) {
        const int herr = resolver.res_h_errno;
        res_nclose(&resolver);
        if (herr == NO_DATA) {
            return std::vector<ServiceEndpointRecord>{};
        }
        return std::unexpected {Error{ErrorCode::ResolutionFailure, std::string{"DNS query failed: "} + hstrerror(herr), domain}};
    }
    res_nclose(&resolver);

    ns_msg handle;
    if (ns_initparse(buffer.data(), std::min(len, static_cast<int>(buffer.size())), &handle) < 0) {
        return std::unexpected {Error{ErrorCode::ResolutionFailure, "Malformed DNS response", domain}};
    }
    std::vector<ServiceEndpointRecord> records;
    const int count = ns_msg_count(handle, ns_s_an);
    for (int i = 0; i < count; ++i) {
        ns_rr record;
        if (ns_parserr(&handle, ns_s_an, i, &record) != 0) {
            continue;
        }
        ServiceEndpointRecord out {type, {}};
        if (extractRecord(handle, record, type, out)) {
            records.push_back(out);
        }
    }
    spdlog::debug("ResolvDnsClient: {} {} -> {} records", toString(type), domain, records.size());
    return records;
}

} // namespace mesh
