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
#ifndef MESH_SERVICE_RESOLVER_HPP
#define MESH_SERVICE_RESOLVER_HPP

#include "interface/DnsClient.hpp"
#include "discovery/DnsRecord.hpp"
#include "common/LockedUnorderedMap.hpp"
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace mesh {

struct ResolverConfig {
    ResolverConfig();
    ResolverConfig(std::chrono::milliseconds ttl, std::string suffix, std::unordered_map<std::string, std::string> domains = {});
    std::chrono::milliseconds cacheTtl;
    // <service>.<domainSuffix> unless overridden per service.
    std::string domainSuffix;
    std::unordered_map<std::string, std::string> serviceDomains;
};

struct CacheStats {
    std::size_t total;
    std::size_t valid;
    std::size_t expired;
    std::chrono::milliseconds ttl;
};

class ServiceResolver {
public:
    using clock = std::chrono::steady_clock;

    ServiceResolver(std::shared_ptr<DnsClient> dns, const ResolverConfig config = ResolverConfig{});
    ServiceResolver(const ServiceResolver&) = delete;
    ServiceResolver& operator=(const ServiceResolver&) = delete;

    // Never fails: an unknown record type or a failed query yields an empty
    // list and a log line.
    std::vector<ServiceEndpointRecord> resolve(const std::string& service, const std::string& recordType = "A");
    std::vector<ServiceEndpointRecord> resolve(const std::string& service, RecordType type);

    // SRV targets when there are any, otherwise A addresses with defaultPort.
    std::vector<Endpoint> resolveWithPort(const std::string& service, uint16_t defaultPort);

    // Uniform random pick over resolveWithPort().
    std::optional<Endpoint> resolveRandom(const std::string& service, uint16_t defaultPort);

    void clearCache();
    [[nodiscard]] CacheStats cacheStats() const;

    void addServiceDomain(const std::string& service, const std::string& domain);
    bool removeServiceDomain(const std::string& service);
    [[nodiscard]] std::string domainFor(const std::string& service) const;
private:
    struct CacheEntry {
        std::shared_ptr<const std::vector<ServiceEndpointRecord>> records;
        clock::time_point timestamp;
    };
    using CacheKey = std::pair<std::string, RecordType>;

    [[nodiscard]] bool fresh(const CacheEntry& entry, clock::time_point now) const;

    std::shared_ptr<DnsClient> dns;
    const std::chrono::milliseconds cacheTtl;
    const std::string domainSuffix;
    LockedUnorderedMap<std::string, std::string> domains;
    mutable std::mutex cacheMutex;
    std::map<CacheKey, CacheEntry> cache;
};

} // namespace mesh

#endif // MESH_SERVICE_RESOLVER_HPP
