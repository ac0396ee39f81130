// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <qoms/scheduler/DeadLetterQueue.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace qoms {

DeadLetterQueue::DeadLetterQueue(std::size_t maxSize, std::chrono::milliseconds retention)
    : maxSize_(std::max<std::size_t>(1, maxSize)), retention_(retention) {}

std::size_t DeadLetterQueue::push(DLQEntry entry) {
    entries_.push_back(std::move(entry));
    std::size_t evicted = 0;
    while (entries_.size() > maxSize_) {
        spdlog::debug("[DeadLetterQueue] Evicting {} (capacity {})", entries_.front().id,
                      maxSize_);
        entries_.pop_front();
        ++evicted;
    }
    evicted_ += evicted;
    return evicted;
}

std::vector<DLQEntry> DeadLetterQueue::entries(WallTime now) {
    prune(now);
    return {entries_.begin(), entries_.end()};
}

bool DeadLetterQueue::dismiss(std::string_view id) {
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [&](const DLQEntry& e) { return e.id == id; });
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

std::size_t DeadLetterQueue::clear() {
    const auto count = entries_.size();
    entries_.clear();
    return count;
}

std::size_t DeadLetterQueue::prune(WallTime now) {
    std::size_t pruned = 0;
    // Entries are appended in failure order, so expired ones are at the front.
    while (!entries_.empty() && now - entries_.front().failedAt > retention_) {
        entries_.pop_front();
        ++pruned;
    }
    if (pruned > 0) {
        spdlog::debug("[DeadLetterQueue] Pruned {} expired entries", pruned);
    }
    return pruned;
}

} // namespace qoms
