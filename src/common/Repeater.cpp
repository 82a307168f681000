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
#include "common/Repeater.hpp"
#include "common/Error.hpp"
#include "common/RetryPolicy.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <functional>
#include <chrono>
#include <thread>
#include <string>

namespace mesh {

Repeater::Repeater(const RetryPolicy p, const std::atomic<bool>* cancel)
    : backoff {p},
      cancelFlag {cancel} {}

std::expected<void, Error> Repeater::attempt(const std::string& op, const attempt_t& rpc) {
    made = 0;
    backoff.reset();
    while (!cancelled()) {
        auto result = rpc();
        made++;
        if (result.has_value()) {
            return result;
        }
        if (!isRetriable(result.error().code)) {
            return result;
        }
        auto delay = backoff.nextDelay();
        if (!delay.has_value()) {
            spdlog::error("{}: giving up after {} attempts: {}", op, made, result.error().what);
            return result;
        }
        spdlog::warn("{}: attempt {} failed ({}: {}), retrying in {}us",
            op, made, toString(result.error().code), result.error().what, delay->count());
        if (!sleep(delay.value())) {
            break;
        }
    }
    spdlog::warn("{}: retry loop cancelled after {} attempts", op, made);
    return std::unexpected {Error{ErrorCode::Cancelled, "Retry loop cancelled"}};
}

bool Repeater::sleep(std::chrono::microseconds delay) const {
    auto remaining = delay;
    while (!cancelled() && remaining > std::chrono::microseconds::zero()) {
        auto step = std::min<std::chrono::microseconds>(remaining, std::chrono::microseconds{1000});
        std::this_thread::sleep_for(step);
        remaining -= step;
    }
    return !cancelled();
}

bool Repeater::cancelled() const {
    if (stopped.load(std::memory_order_acquire)) {
        return true;
    }
    return cancelFlag != nullptr && cancelFlag->load(std::memory_order_acquire);
}

void Repeater::reset() {
    stopped.store(false, std::memory_order_release);
    backoff.reset();
    made = 0;
}

void Repeater::stop() noexcept {
    stopped = true;
}

int Repeater::attempts() const {
    return made;
}

} // namespace mesh
