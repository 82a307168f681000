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
#ifndef MESH_REPEATER_H
#define MESH_REPEATER_H

#include <functional>
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include "common/ExponentialBackoff.hpp"
#include <expected>
#include <string>
#include <atomic>

namespace mesh {

// Runs an attempt until it succeeds, fails with a non-retriable error, the
// policy's retries are exhausted, or it is stopped/cancelled.
class Repeater {
public:
    using attempt_t = std::function<std::expected<void, Error>()>;
    explicit Repeater(const RetryPolicy p, const std::atomic<bool>* cancel = nullptr);
    std::expected<void, Error> attempt(const std::string& op, const attempt_t& rpc);
    void reset();
    void stop() noexcept;
    // Attempts made by the last call to attempt().
    [[nodiscard]] int attempts() const;
private:
    [[nodiscard]] bool cancelled() const;
    bool sleep(std::chrono::microseconds delay) const;
    ExponentialBackoff backoff;
    const std::atomic<bool>* cancelFlag;
    std::atomic<bool> stopped{false};
    int made{0};
};

} // namespace mesh

#endif // MESH_REPEATER_H
