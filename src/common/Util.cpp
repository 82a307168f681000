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
#include "common/Util.hpp"
#include <charconv>
#include <random>
#include <string>
#include <cstdint>

namespace mesh {

std::size_t random_index(std::size_t size) {
    thread_local auto rng = random_generator<>();
    auto dist = std::uniform_int_distribution<std::size_t>{0, size - 1};
    return dist(rng);
}

bool split_host_port(const std::string& endpoint, std::string& host, uint16_t& port) {
    auto colon = endpoint.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == endpoint.size()) {
        return false;
    }
    auto h = endpoint.substr(0, colon);
    if (h.size() >= 2 && h.front() == '[' && h.back() == ']') {
        h = h.substr(1, h.size() - 2);
    }
    unsigned int p = 0;
    const auto* first = endpoint.data() + colon + 1;
    const auto* last = endpoint.data() + endpoint.size();
    auto [ptr, ec] = std::from_chars(first, last, p);
    if (ec != std::errc{} || ptr != last || p > 65535) {
        return false;
    }
    host = h;
    port = static_cast<uint16_t>(p);
    return true;
}

std::string join_host_port(const std::string& host, uint16_t port) {
    if (host.find(':') != std::string::npos) {
        return "[" + host + "]:" + std::to_string(port);
    }
    return host + ":" + std::to_string(port);
}

} // namespace mesh
