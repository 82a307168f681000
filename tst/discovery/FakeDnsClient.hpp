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
#ifndef MESH_TST_FAKE_DNS_CLIENT_HPP
#define MESH_TST_FAKE_DNS_CLIENT_HPP

#include "interface/DnsClient.hpp"
#include "discovery/DnsRecord.hpp"
#include "common/Error.hpp"
#include <atomic>
#include <expected>
#include <map>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

// Answers from a scripted table and counts the queries it receives.
class FakeDnsClient : public mesh::DnsClient {
public:
    using answer_t = std::expected<std::vector<mesh::ServiceEndpointRecord>, mesh::Error>;

    void set(const std::string& domain, mesh::RecordType type, answer_t answer) {
        std::lock_guard lock {m};
        answers.insert_or_assign({domain, type}, std::move(answer));
    }

    answer_t query(const std::string& domain, mesh::RecordType type) override {
        queries++;
        std::lock_guard lock {m};
        asked.emplace_back(domain, type);
        auto it = answers.find({domain, type});
        if (it == answers.end()) {
            return std::unexpected {mesh::Error{mesh::ErrorCode::ResolutionFailure, "NXDOMAIN"}};
        }
        return it->second;
    }

    std::vector<std::pair<std::string, mesh::RecordType>> history() const {
        std::lock_guard lock {m};
        return asked;
    }

    std::atomic<int> queries {0};
private:
    mutable std::mutex m;
    std::map<std::pair<std::string, mesh::RecordType>, answer_t> answers;
    std::vector<std::pair<std::string, mesh::RecordType>> asked;
};

inline mesh::ServiceEndpointRecord aRecord(const std::string& address, uint32_t ttl = 60) {
    return mesh::ServiceEndpointRecord{mesh::RecordType::A, address, 0, 0, 0, ttl};
}

inline mesh::ServiceEndpointRecord srvRecord(const std::string& target, uint16_t port, uint16_t priority = 10, uint16_t weight = 5) {
    return mesh::ServiceEndpointRecord{mesh::RecordType::SRV, target, port, priority, weight, 60};
}

#endif // MESH_TST_FAKE_DNS_CLIENT_HPP
