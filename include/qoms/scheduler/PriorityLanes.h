// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <qoms/scheduler/PriorityTier.h>
#include <qoms/scheduler/QueueItem.h>

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <memory>
#include <optional>
#include <vector>

namespace qoms {

/**
 * @brief Five FIFO lanes, one per priority tier, holding pending items.
 *
 * ## Selection
 * nextItem() first runs an aging pass, then scans lanes from Critical to
 * Idle and returns the first pending item whose retry delay (if any) has
 * elapsed. Items that never fail and never age are therefore served in exact
 * submission order within a tier, while a retry-delayed item can be
 * overtaken by a later healthy item of the same tier.
 *
 * ## Aging
 * A pending item outside the Critical lane that has waited longer than the
 * promotion threshold moves one tier up (appended to the higher lane). It is
 * then frozen: further promotion waits until the item has been dispatched
 * again, so a dispatcher spinning on a resource-blocked queue cannot lift an
 * item several tiers at once.
 *
 * An item is removed from its lane when dispatched and re-inserted at its
 * submission position if it is retried. Not synchronized.
 */
class PriorityLanes {
public:
    using ItemPtr = std::shared_ptr<QueueItem>;

    explicit PriorityLanes(std::chrono::milliseconds agePromotion);

    /// Appends to the lane of item->priority.
    void push(ItemPtr item);

    /// Re-inserts a retried item ahead of later submissions in its lane.
    void reinsert(ItemPtr item);

    /// Removes an item from whichever lane holds it.
    bool remove(const QueueItem& item);

    /// Aging pass. Returns the number of items promoted.
    std::size_t agePending(SteadyTime now);

    /// Highest-priority, oldest eligible pending item (no aging).
    [[nodiscard]] ItemPtr selectNext(SteadyTime now) const;

    /// Aging pass followed by selection.
    ItemPtr nextItem(SteadyTime now);

    /// Earliest nextRetryAt among pending items, if any is retry-delayed.
    [[nodiscard]] std::optional<SteadyTime> earliestRetryAt() const;

    /// Empties every lane and returns the items that were queued.
    std::vector<ItemPtr> drain();

    [[nodiscard]] std::size_t laneSize(PriorityTier tier) const noexcept;
    [[nodiscard]] std::size_t totalSize() const noexcept;
    [[nodiscard]] bool empty() const noexcept { return totalSize() == 0; }

    /// Pending items that have failed at least once.
    [[nodiscard]] std::size_t pendingRetries() const noexcept;

    [[nodiscard]] std::uint64_t promotions() const noexcept { return promotions_; }

private:
    std::array<std::deque<ItemPtr>, kTierCount> lanes_;
    std::chrono::milliseconds agePromotion_;
    std::uint64_t promotions_{0};
};

} // namespace qoms
