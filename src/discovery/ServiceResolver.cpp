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
#include "discovery/ServiceResolver.hpp"
#include "discovery/DnsRecord.hpp"
#include "common/Util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace mesh {

ResolverConfig::ResolverConfig()
    : ResolverConfig(std::chrono::seconds{300L}, "mesh.internal") {}

ResolverConfig::ResolverConfig(std::chrono::milliseconds ttl, std::string suffix, std::unordered_map<std::string, std::string> d)
    : cacheTtl {ttl},
      domainSuffix {std::move(suffix)},
      serviceDomains {std::move(d)} {
    if (ttl < std::chrono::milliseconds::zero()) {
        throw std::invalid_argument("Cache TTL must be >= zero.");
    }
}

ServiceResolver::ServiceResolver(std::shared_ptr<DnsClient> d, const ResolverConfig config)
    : dns {std::move(d)},
      cacheTtl {config.cacheTtl},
      domainSuffix {config.domainSuffix} {
    if (!dns) {
        throw std::invalid_argument("ServiceResolver: DNS client is required");
    }
    for (const auto& [service, domain] : config.serviceDomains) {
        domains.insertOrAssign(service, domain);
    }
}

std::vector<ServiceEndpointRecord> ServiceResolver::resolve(const std::string& service, const std::string& recordType) {
    auto type = parseRecordType(recordType);
    if (!type.has_value()) {
        spdlog::error("ServiceResolver: unsupported record type {} for {}", recordType, service);
        return {};
    }
    return resolve(service, type.value());
}

std::vector<ServiceEndpointRecord> ServiceResolver::resolve(const std::string& service, RecordType type) {
    const CacheKey key {service, type};
    {
        std::lock_guard lock {cacheMutex};
        auto it = cache.find(key);
        if (it != cache.end() && fresh(it->second, clock::now())) {
            spdlog::debug("ServiceResolver: cache hit {} {}", toString(type), service);
            return *it->second.records;
        }
    }

    const auto domain = domainFor(service);
    auto result = dns->query(domain, type);
    if (!result.has_value()) {
        spdlog::warn("ServiceResolver: {} lookup for {} ({}) failed: {}", toString(type), service, domain, result.error().what);
        return {};
    }
    auto records = std::make_shared<const std::vector<ServiceEndpointRecord>>(std::move(result.value()));
    {
        std::lock_guard lock {cacheMutex};
        cache.insert_or_assign(key, CacheEntry{records, clock::now()});
    }
    spdlog::debug("ServiceResolver: {} {} -> {} records", toString(type), service, records->size());
    return *records;
}

std::vector<Endpoint> ServiceResolver::resolveWithPort(const std::string& service, uint16_t defaultPort) {
    std::vector<Endpoint> endpoints;
    auto srv = resolve(service, RecordType::SRV);
    if (!srv.empty()) {
        for (const auto& record : srv) {
            endpoints.push_back(Endpoint{record.address, record.port});
        }
        return endpoints;
    }
    for (const auto& record : resolve(service, RecordType::A)) {
        endpoints.push_back(Endpoint{record.address, defaultPort});
    }
    return endpoints;
}

std::optional<Endpoint> ServiceResolver::resolveRandom(const std::string& service, uint16_t defaultPort) {
    auto endpoints = resolveWithPort(service, defaultPort);
    if (endpoints.empty()) {
        spdlog::warn("ServiceResolver: no addresses for {}", service);
        return std::nullopt;
    }
    return endpoints[random_index(endpoints.size())];
}

void ServiceResolver::clearCache() {
    std::lock_guard lock {cacheMutex};
    cache.clear();
    spdlog::info("ServiceResolver: cache cleared");
}

CacheStats ServiceResolver::cacheStats() const {
    std::lock_guard lock {cacheMutex};
    const auto now = clock::now();
    std::size_t valid = 0;
    for (const auto& [key, entry] : cache) {
        if (fresh(entry, now)) {
            valid++;
        }
    }
    return CacheStats{cache.size(), valid, cache.size() - valid, cacheTtl};
}

void ServiceResolver::addServiceDomain(const std::string& service, const std::string& domain) {
    domains.insertOrAssign(service, domain);
}

bool ServiceResolver::removeServiceDomain(const std::string& service) {
    return domains.erase(service);
}

std::string ServiceResolver::domainFor(const std::string& service) const {
    auto domain = domains.get(service);
    if (domain.has_value()) {
        return domain.value();
    }
    if (domainSuffix.empty()) {
        return service;
    }
    return service + "." + domainSuffix;
}

bool ServiceResolver::fresh(const CacheEntry& entry, clock::time_point now) const {
    return now - entry.timestamp < cacheTtl;
}

} // namespace mesh
