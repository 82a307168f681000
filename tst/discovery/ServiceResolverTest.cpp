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
#include <gtest/gtest.h>
#include <chrono>
#include <memory>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>
#include "discovery/FakeDnsClient.hpp"
#include "discovery/ServiceResolver.hpp"

using mesh::CacheStats;
using mesh::Endpoint;
using mesh::RecordType;
using mesh::ResolverConfig;
using mesh::ServiceResolver;

class ServiceResolverTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDnsClient> dns = std::make_shared<FakeDnsClient>();
    ServiceResolver resolver {dns, ResolverConfig{std::chrono::seconds{300L}, "mesh.internal"}};
};

TEST_F(ServiceResolverTest, ResolvesAndCaches) {
    dns->set("orders.mesh.internal", RecordType::A, std::vector{aRecord("10.0.0.1"), aRecord("10.0.0.2")});
    auto first = resolver.resolve("orders");
    ASSERT_EQ(first.size(), 2U);
    EXPECT_EQ(first[0].address, "10.0.0.1");
    auto second = resolver.resolve("orders", "a");
    EXPECT_EQ(second, first);
    EXPECT_EQ(dns->queries.load(), 1);
}

TEST_F(ServiceResolverTest, RecordTypesAreCachedSeparately) {
    dns->set("orders.mesh.internal", RecordType::A, std::vector{aRecord("10.0.0.1")});
    dns->set("orders.mesh.internal", RecordType::AAAA, std::vector{
        mesh::ServiceEndpointRecord{RecordType::AAAA, "fd00::1", 0, 0, 0, 60}});
    resolver.resolve("orders", "A");
    auto v6 = resolver.resolve("orders", "AAAA");
    ASSERT_EQ(v6.size(), 1U);
    EXPECT_EQ(v6[0].address, "fd00::1");
    EXPECT_EQ(dns->queries.load(), 2);
    EXPECT_EQ(resolver.cacheStats().total, 2U);
}

TEST_F(ServiceResolverTest, FailureIsEmptyAndNotCached) {
    EXPECT_TRUE(resolver.resolve("missing").empty());
    EXPECT_TRUE(resolver.resolve("missing").empty());
    EXPECT_EQ(dns->queries.load(), 2);
    EXPECT_EQ(resolver.cacheStats().total, 0U);
}

TEST_F(ServiceResolverTest, EmptyAnswerIsCached) {
    dns->set("quiet.mesh.internal", RecordType::A, std::vector<mesh::ServiceEndpointRecord>{});
    EXPECT_TRUE(resolver.resolve("quiet").empty());
    EXPECT_TRUE(resolver.resolve("quiet").empty());
    EXPECT_EQ(dns->queries.load(), 1);
}

TEST_F(ServiceResolverTest, UnknownRecordTypeNeverQueries) {
    EXPECT_TRUE(resolver.resolve("orders", "MX").empty());
    EXPECT_EQ(dns->queries.load(), 0);
}

TEST_F(ServiceResolverTest, ExpiredEntriesAreRefreshed) {
    ServiceResolver shortLived {dns, ResolverConfig{std::chrono::milliseconds{50L}, "mesh.internal"}};
    dns->set("orders.mesh.internal", RecordType::A, std::vector{aRecord("10.0.0.1")});
    shortLived.resolve("orders");
    auto stats = shortLived.cacheStats();
    EXPECT_EQ(stats.valid, 1U);
    std::this_thread::sleep_for(std::chrono::milliseconds{80L});
    stats = shortLived.cacheStats();
    EXPECT_EQ(stats.total, 1U);
    EXPECT_EQ(stats.valid, 0U);
    EXPECT_EQ(stats.expired, 1U);
    dns->set("orders.mesh.internal", RecordType::A, std::vector{aRecord("10.0.0.9")});
    auto refreshed = shortLived.resolve("orders");
    ASSERT_EQ(refreshed.size(), 1U);
    EXPECT_EQ(refreshed[0].address, "10.0.0.9");
    EXPECT_EQ(dns->queries.load(), 2);
}

TEST_F(ServiceResolverTest, ClearCacheForcesQuery) {
    dns->set("orders.mesh.internal", RecordType::A, std::vector{aRecord("10.0.0.1")});
    resolver.resolve("orders");
    resolver.clearCache();
    EXPECT_EQ(resolver.cacheStats().total, 0U);
    resolver.resolve("orders");
    EXPECT_EQ(dns->queries.load(), 2);
}

TEST_F(ServiceResolverTest, SrvPreferredOverDefaultPort) {
    dns->set("auth-service.mesh.internal", RecordType::SRV, std::vector{srvRecord("10.0.0.5", 50051)});
    dns->set("auth-service.mesh.internal", RecordType::A, std::vector{aRecord("10.0.0.7")});
    auto endpoints = resolver.resolveWithPort("auth-service", 9000);
    ASSERT_EQ(endpoints.size(), 1U);
    EXPECT_EQ(endpoints[0], (Endpoint{"10.0.0.5", 50051}));
}

TEST_F(ServiceResolverTest, FallsBackToAWithDefaultPort) {
    dns->set("orders.mesh.internal", RecordType::A, std::vector{aRecord("10.0.0.1"), aRecord("10.0.0.2")});
    auto endpoints = resolver.resolveWithPort("orders", 8080);
    ASSERT_EQ(endpoints.size(), 2U);
    EXPECT_EQ(endpoints[0], (Endpoint{"10.0.0.1", 8080}));
    EXPECT_EQ(endpoints[1], (Endpoint{"10.0.0.2", 8080}));
}

TEST_F(ServiceResolverTest, RandomPickCoversAllEndpoints) {
    dns->set("orders.mesh.internal", RecordType::A, std::vector{aRecord("10.0.0.1"), aRecord("10.0.0.2"), aRecord("10.0.0.3")});
    std::set<std::string> seen;
    for (int i = 0; i < 200; ++i) {
        auto picked = resolver.resolveRandom("orders", 50051);
        ASSERT_TRUE(picked.has_value());
        EXPECT_EQ(picked->port, 50051);
        seen.insert(picked->host);
    }
    EXPECT_EQ(seen.size(), 3U);
}

TEST_F(ServiceResolverTest, RandomPickOnNothingIsEmpty) {
    EXPECT_FALSE(resolver.resolveRandom("missing", 50051).has_value());
}

TEST_F(ServiceResolverTest, DomainOverrides) {
    EXPECT_EQ(resolver.domainFor("orders"), "orders.mesh.internal");
    resolver.addServiceDomain("orders", "orders.prod.example");
    EXPECT_EQ(resolver.domainFor("orders"), "orders.prod.example");
    dns->set("orders.prod.example", RecordType::A, std::vector{aRecord("192.0.2.1")});
    auto records = resolver.resolve("orders");
    ASSERT_EQ(records.size(), 1U);
    EXPECT_EQ(dns->history().back().first, "orders.prod.example");
    EXPECT_TRUE(resolver.removeServiceDomain("orders"));
    EXPECT_FALSE(resolver.removeServiceDomain("orders"));
    EXPECT_EQ(resolver.domainFor("orders"), "orders.mesh.internal");
}

TEST_F(ServiceResolverTest, ConfiguredDomainsApply) {
    ServiceResolver custom {dns, ResolverConfig{std::chrono::seconds{1L}, "svc.local", {{"db", "db.primary.local"}}}};
    EXPECT_EQ(custom.domainFor("db"), "db.primary.local");
    EXPECT_EQ(custom.domainFor("web"), "web.svc.local");
}

TEST(ServiceResolverConfigTest, Validation) {
    EXPECT_THROW(ServiceResolver(nullptr), std::invalid_argument);
    EXPECT_THROW(ResolverConfig(std::chrono::milliseconds{-1L}, "x"), std::invalid_argument);
    const ResolverConfig defaults;
    EXPECT_EQ(defaults.cacheTtl, std::chrono::seconds{300L});
    EXPECT_EQ(defaults.domainSuffix, "mesh.internal");
}
