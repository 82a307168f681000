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
#include <sstream>
#include "discovery/DnsRecord.hpp"
#include "discovery/ResolvDnsClient.hpp"

using mesh::RecordType;
using mesh::parseRecordType;
using mesh::ResolvDnsClient;

TEST(DnsRecordTest, ParseRecordType) {
    EXPECT_EQ(parseRecordType("A"), RecordType::A);
    EXPECT_EQ(parseRecordType("aaaa"), RecordType::AAAA);
    EXPECT_EQ(parseRecordType("Srv"), RecordType::SRV);
    EXPECT_FALSE(parseRecordType("MX").has_value());
    EXPECT_FALSE(parseRecordType("").has_value());
}

TEST(DnsRecordTest, PrintsEndpoint) {
    std::ostringstream os;
    os << mesh::Endpoint{"10.0.0.5", 50051};
    EXPECT_EQ(os.str(), "10.0.0.5:50051");
}

// The .invalid TLD never resolves.
TEST(ResolvDnsClientTest, InvalidDomainIsAnError) {
    ResolvDnsClient client {std::chrono::seconds{1L}, 1};
    auto result = client.query("nonexistent.invalid", RecordType::A);
    if (result.has_value()) {
        EXPECT_TRUE(result->empty());
    } else {
        EXPECT_EQ(result.error().code, mesh::ErrorCode::ResolutionFailure);
    }
}
