// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <qoms/scheduler/QueueItem.h>

#include <chrono>
#include <cstddef>
#include <deque>
#include <string_view>
#include <vector>

namespace qoms {

/**
 * @brief Bounded, time-retained record of permanently failed items.
 *
 * Append-only from the scheduler's point of view: the oldest entry is evicted
 * once maxSize is exceeded, and entries older than the retention window are
 * pruned lazily when read. Entries are a record only; the operation closure
 * is not kept, so nothing here can be re-run.
 *
 * Not synchronized; the owning OperationQueue serializes access.
 */
class DeadLetterQueue {
public:
    DeadLetterQueue(std::size_t maxSize, std::chrono::milliseconds retention);

    /// Appends an entry, evicting from the front while over capacity.
    /// @return number of entries evicted
    std::size_t push(DLQEntry entry);

    /// Prunes expired entries and returns a copy, oldest first.
    std::vector<DLQEntry> entries(WallTime now = std::chrono::system_clock::now());

    /// Removes one entry by id. Returns false when it is not present.
    bool dismiss(std::string_view id);

    /// Removes everything. Returns the number of entries dropped.
    std::size_t clear();

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] std::size_t evictedTotal() const noexcept { return evicted_; }

private:
    std::size_t prune(WallTime now);

    std::size_t maxSize_;
    std::chrono::milliseconds retention_;
    std::deque<DLQEntry> entries_;
    std::size_t evicted_{0};
};

} // namespace qoms
