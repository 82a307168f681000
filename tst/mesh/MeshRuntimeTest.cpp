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
#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>
#include "common/BreakerConfig.hpp"
#include "common/Error.hpp"
#include "common/Health.hpp"
#include "common/RetryPolicy.hpp"
#include "discovery/FakeDnsClient.hpp"
#include "mesh/MeshConfig.hpp"
#include "mesh/MeshRuntime.hpp"
#include "proto/probe.grpc.pb.h"

using mesh::BreakerConfig;
using mesh::CallOptions;
using mesh::ErrorCode;
using mesh::HealthState;
using mesh::MeshConfig;
using mesh::MeshRuntime;
using mesh::RetryPolicy;
using mesh::ServerConfig;
using mesh::probe::PingRequest;
using mesh::probe::Probe;

namespace {

MeshConfig testConfig(const std::string& nodeId) {
    MeshConfig config;
    config.nodeId = nodeId;
    config.server = ServerConfig {"127.0.0.1:0", 4, true};
    config.breaker = BreakerConfig {2, std::chrono::seconds{30L}, 1, std::chrono::seconds{2L}};
    config.retry = RetryPolicy {std::chrono::milliseconds{1L}, std::chrono::milliseconds{2L}, 1};
    config.endpoints.clear();
    return config;
}

PingRequest ping(const std::string& from) {
    PingRequest request;
    request.set_from(from);
    request.set_message("PING");
    return request;
}

} // namespace

class MeshRuntimeTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeDnsClient> dns = std::make_shared<FakeDnsClient>();
};

TEST_F(MeshRuntimeTest, NodesPingEachOther) {
    MeshRuntime a {testConfig("node-a"), dns};
    MeshRuntime b {testConfig("node-b"), dns};
    ASSERT_TRUE(a.start().has_value());
    ASSERT_TRUE(b.start().has_value());

    const auto bAddress = "127.0.0.1:" + std::to_string(b.server().boundPort());
    ASSERT_TRUE(a.channels().createServiceStub<Probe>("node-b", bAddress).has_value());
    EXPECT_EQ(a.dependencyHealth("node-b"), HealthState::Unknown);

    auto reply = a.channels().call("node-b", "ping", &Probe::Stub::ping, ping("node-a"));
    ASSERT_TRUE(reply.has_value()) << reply.error();
    EXPECT_EQ(reply->from(), "node-b");
    EXPECT_EQ(reply->served(), 1U);
    EXPECT_EQ(a.dependencyHealth("node-b"), HealthState::Serving);

    ASSERT_TRUE(a.stop().has_value());
    ASSERT_TRUE(b.stop().has_value());
}

TEST_F(MeshRuntimeTest, OpenBreakerMeansNotServing) {
    MeshRuntime a {testConfig("node-a"), dns};
    auto& breaker = a.breakers().get("billing");
    for (int i = 0; i < 2; ++i) {
        breaker.call([]() -> std::expected<void, mesh::Error> {
            return std::unexpected {mesh::Error{ErrorCode::Transport, "down"}};
        });
    }
    EXPECT_EQ(a.dependencyHealth("billing"), HealthState::NotServing);
    a.breakers().reset("billing");
    EXPECT_EQ(a.dependencyHealth("billing"), HealthState::Unknown);
}

TEST_F(MeshRuntimeTest, ResolverFallbackUsesDefaultPort) {
    MeshRuntime b {testConfig("node-b"), dns};
    ASSERT_TRUE(b.start().has_value());
    auto config = testConfig("node-a");
    config.defaultPort = static_cast<uint16_t>(b.server().boundPort());
    MeshRuntime a {config, dns};
    dns->set("node-b.mesh.internal", mesh::RecordType::A, std::vector{aRecord("127.0.0.1")});

    ASSERT_TRUE(a.channels().createServiceStub<Probe>("node-b").has_value());
    auto reply = a.channels().call("node-b", "ping", &Probe::Stub::ping, ping("node-a"));
    ASSERT_TRUE(reply.has_value()) << reply.error();
    EXPECT_EQ(reply->from(), "node-b");
}

TEST_F(MeshRuntimeTest, ResolverCanBeDisabled) {
    auto config = testConfig("node-a");
    config.useResolver = false;
    MeshRuntime a {config, dns};
    dns->set("node-b.mesh.internal", mesh::RecordType::A, std::vector{aRecord("127.0.0.1")});
    EXPECT_EQ(a.channels().createChannel("node-b").error().code, ErrorCode::NoChannel);
    EXPECT_EQ(dns->queries.load(), 0);
}

TEST_F(MeshRuntimeTest, ProbeServiceMountedByDefault) {
    MeshRuntime a {testConfig("node-a"), dns};
    auto services = a.server().listServices();
    ASSERT_EQ(services.size(), 1U);
    EXPECT_EQ(services[0], MeshRuntime::probeServiceName);

    auto config = testConfig("bare");
    config.probeService = false;
    MeshRuntime bare {config, dns};
    EXPECT_TRUE(bare.server().listServices().empty());
}

TEST_F(MeshRuntimeTest, StopBeforeStartIsNotRunning) {
    MeshRuntime a {testConfig("node-a"), dns};
    EXPECT_EQ(a.stop().error().code, ErrorCode::NotRunning);
}
