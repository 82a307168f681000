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
#ifndef MESH_LOCKED_UNORDERED_MAP_H
#define MESH_LOCKED_UNORDERED_MAP_H

#include <unordered_map>
#include <shared_mutex>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace mesh {

// Values are handed out by copy; no references or iterators escape the lock.
template <typename Key, typename Value>
class LockedUnorderedMap {
public:
    LockedUnorderedMap() = default;
    LockedUnorderedMap(std::initializer_list<std::pair<const Key, Value>> init)
        : map {init} {}

    // Returns true if the key was new.
    bool insertOrAssign(const Key& key, Value value) {
        std::unique_lock lock{mutex};
        return map.insert_or_assign(key, std::move(value)).second;
    }

    bool erase(const Key& key) {
        std::unique_lock lock{mutex};
        return map.erase(key) > 0;
    }

    std::optional<Value> get(const Key& key) const {
        std::shared_lock lock{mutex};
        auto it = map.find(key);
        if (it == map.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    bool contains(const Key& key) const {
        std::shared_lock lock{mutex};
        return map.contains(key);
    }

    size_t size() const {
        std::shared_lock lock{mutex};
        return map.size();
    }

    void clear() {
        std::unique_lock lock{mutex};
        map.clear();
    }

    std::unordered_map<Key, Value> snapshot() const {
        std::shared_lock lock{mutex};
        return map;
    }

    std::vector<Key> keys() const {
        std::shared_lock lock{mutex};
        std::vector<Key> result;
        result.reserve(map.size());
        for (const auto& [k, v] : map) {
            result.push_back(k);
        }
        return result;
    }

private:
    std::unordered_map<Key, Value> map;
    mutable std::shared_mutex mutex;
};

} // namespace mesh

#endif // MESH_LOCKED_UNORDERED_MAP_H
