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
#ifndef MESH_EXPONENTIAL_BACKOFF_H
#define MESH_EXPONENTIAL_BACKOFF_H

#include "common/RetryPolicy.hpp"
#include <optional>
#include <chrono>

namespace mesh {

class ExponentialBackoff {
public:
    explicit ExponentialBackoff(const RetryPolicy policy);
    // nullopt once the policy's retries are used up.
    std::optional<std::chrono::microseconds> nextDelay();
    void reset();
    [[nodiscard]] int attempts() const;
private:
    RetryPolicy policy;
    int attempt{0};
};

} // namespace mesh

#endif // MESH_EXPONENTIAL_BACKOFF_H
