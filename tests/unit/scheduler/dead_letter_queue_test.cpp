// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>

#include <qoms/scheduler/DeadLetterQueue.h>

#include <chrono>
#include <string>

using namespace qoms;
using namespace std::chrono_literals;

namespace qoms::test {

namespace {

DLQEntry makeEntry(const std::string& id, WallTime failedAt) {
    DLQEntry e;
    e.id = id;
    e.priority = PriorityTier::Low;
    e.enqueuedAt = failedAt - 5s;
    e.failedAt = failedAt;
    e.retryCount = 3;
    e.lastError = "boom";
    return e;
}

} // namespace

TEST(DeadLetterQueueTest, EvictsOldestWhenFull) {
    DeadLetterQueue dlq(2, 1h);
    const auto now = std::chrono::system_clock::now();

    EXPECT_EQ(dlq.push(makeEntry("a", now)), 0u);
    EXPECT_EQ(dlq.push(makeEntry("b", now)), 0u);
    EXPECT_EQ(dlq.push(makeEntry("c", now)), 1u);

    auto entries = dlq.entries(now);
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].id, "b");
    EXPECT_EQ(entries[1].id, "c");
    EXPECT_EQ(dlq.evictedTotal(), 1u);
}

TEST(DeadLetterQueueTest, PrunesExpiredEntriesOnRead) {
    DeadLetterQueue dlq(10, 1min);
    const auto now = std::chrono::system_clock::now();

    dlq.push(makeEntry("old", now - 2min));
    dlq.push(makeEntry("fresh", now - 10s));
    EXPECT_EQ(dlq.size(), 2u);

    auto entries = dlq.entries(now);
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].id, "fresh");
    EXPECT_EQ(dlq.size(), 1u);
}

TEST(DeadLetterQueueTest, DismissRemovesSingleEntry) {
    DeadLetterQueue dlq(10, 1h);
    const auto now = std::chrono::system_clock::now();
    dlq.push(makeEntry("x", now));
    dlq.push(makeEntry("y", now));

    EXPECT_TRUE(dlq.dismiss("x"));
    EXPECT_FALSE(dlq.dismiss("x"));
    EXPECT_FALSE(dlq.dismiss("missing"));
    ASSERT_EQ(dlq.size(), 1u);
    EXPECT_EQ(dlq.entries(now)[0].id, "y");
}

TEST(DeadLetterQueueTest, ClearReturnsCount) {
    DeadLetterQueue dlq(10, 1h);
    const auto now = std::chrono::system_clock::now();
    dlq.push(makeEntry("x", now));
    dlq.push(makeEntry("y", now));
    EXPECT_EQ(dlq.clear(), 2u);
    EXPECT_EQ(dlq.size(), 0u);
    EXPECT_EQ(dlq.clear(), 0u);
}

} // namespace qoms::test
