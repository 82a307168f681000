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
#include <algorithm>
#include <string>
#include <thread>
#include <vector>
#include "common/LockedUnorderedMap.hpp"

using mesh::LockedUnorderedMap;

TEST(LockedUnorderedMapTest, InsertGetErase) {
    LockedUnorderedMap<std::string, int> map;
    EXPECT_TRUE(map.insertOrAssign("a", 1));
    EXPECT_FALSE(map.insertOrAssign("a", 2));
    EXPECT_EQ(map.get("a").value(), 2);
    EXPECT_FALSE(map.get("b").has_value());
    EXPECT_TRUE(map.erase("a"));
    EXPECT_FALSE(map.erase("a"));
    EXPECT_EQ(map.size(), 0U);
}

TEST(LockedUnorderedMapTest, InitializerListAndKeys) {
    LockedUnorderedMap<std::string, int> map {{"x", 1}, {"y", 2}};
    auto keys = map.keys();
    std::sort(keys.begin(), keys.end());
    EXPECT_EQ(keys, (std::vector<std::string>{"x", "y"}));
    EXPECT_TRUE(map.contains("x"));
    map.clear();
    EXPECT_FALSE(map.contains("x"));
}

TEST(LockedUnorderedMapTest, SnapshotIsACopy) {
    LockedUnorderedMap<std::string, int> map {{"x", 1}};
    auto snapshot = map.snapshot();
    map.insertOrAssign("x", 5);
    EXPECT_EQ(snapshot.at("x"), 1);
}

TEST(LockedUnorderedMapTest, ConcurrentWriters) {
    LockedUnorderedMap<int, int> map;
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&map, t] {
            for (int i = 0; i < 100; ++i) {
                map.insertOrAssign(t * 100 + i, i);
                map.get(i);
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    EXPECT_EQ(map.size(), 400U);
}
