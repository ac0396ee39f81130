// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <qoms/scheduler/PriorityLanes.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace qoms {

PriorityLanes::PriorityLanes(std::chrono::milliseconds agePromotion)
    : agePromotion_(agePromotion) {}

void PriorityLanes::push(ItemPtr item) {
    lanes_[tierIndex(item->priority)].push_back(std::move(item));
}

void PriorityLanes::reinsert(ItemPtr item) {
    auto& lane = lanes_[tierIndex(item->priority)];
    auto pos = std::find_if(lane.begin(), lane.end(),
                            [seq = item->seq](const ItemPtr& other) { return other->seq > seq; });
    lane.insert(pos, std::move(item));
}

bool PriorityLanes::remove(const QueueItem& item) {
    for (auto& lane : lanes_) {
        auto it = std::find_if(lane.begin(), lane.end(),
                               [&](const ItemPtr& p) { return p.get() == &item; });
        if (it != lane.end()) {
            lane.erase(it);
            return true;
        }
    }
    return false;
}

std::size_t PriorityLanes::agePending(SteadyTime now) {
    std::size_t count = 0;

    // Critical items have nowhere to go; scan High..Idle.
    for (std::size_t src = 1; src < kTierCount; ++src) {
        auto& lane = lanes_[src];
        auto it = lane.begin();
        while (it != lane.end()) {
            auto& item = *it;
            const bool eligible = item->status == ItemStatus::Pending && !item->agingFrozen &&
                                  now - item->enqueuedAt > agePromotion_;
            if (!eligible) {
                ++it;
                continue;
            }
            auto moved = std::move(item);
            it = lane.erase(it);
            const auto from = moved->priority;
            moved->priority = promoted(from);
            moved->agingFrozen = true;
            spdlog::debug("[PriorityLanes] Aged {} from {} to {} after {}ms", moved->id,
                          tierName(from), tierName(moved->priority),
                          std::chrono::duration_cast<std::chrono::milliseconds>(
                              now - moved->enqueuedAt)
                              .count());
            lanes_[tierIndex(moved->priority)].push_back(std::move(moved));
            ++count;
        }
    }

    promotions_ += count;
    return count;
}

PriorityLanes::ItemPtr PriorityLanes::selectNext(SteadyTime now) const {
    for (const auto& lane : lanes_) {
        for (const auto& item : lane) {
            if (item->status != ItemStatus::Pending) {
                continue;
            }
            if (item->nextRetryAt && now < *item->nextRetryAt) {
                continue; // still backing off
            }
            return item;
        }
    }
    return nullptr;
}

PriorityLanes::ItemPtr PriorityLanes::nextItem(SteadyTime now) {
    agePending(now);
    return selectNext(now);
}

std::optional<SteadyTime> PriorityLanes::earliestRetryAt() const {
    std::optional<SteadyTime> earliest;
    for (const auto& lane : lanes_) {
        for (const auto& item : lane) {
            if (item->status == ItemStatus::Pending && item->nextRetryAt &&
                (!earliest || *item->nextRetryAt < *earliest)) {
                earliest = item->nextRetryAt;
            }
        }
    }
    return earliest;
}

std::vector<PriorityLanes::ItemPtr> PriorityLanes::drain() {
    std::vector<ItemPtr> out;
    out.reserve(totalSize());
    for (auto& lane : lanes_) {
        for (auto& item : lane) {
            out.push_back(std::move(item));
        }
        lane.clear();
    }
    return out;
}

std::size_t PriorityLanes::laneSize(PriorityTier tier) const noexcept {
    return lanes_[tierIndex(tier)].size();
}

std::size_t PriorityLanes::totalSize() const noexcept {
    std::size_t total = 0;
    for (const auto& lane : lanes_) {
        total += lane.size();
    }
    return total;
}

std::size_t PriorityLanes::pendingRetries() const noexcept {
    std::size_t n = 0;
    for (const auto& lane : lanes_) {
        n += static_cast<std::size_t>(std::count_if(lane.begin(), lane.end(), [](const ItemPtr& p) {
            return p->status == ItemStatus::Pending && p->retryCount > 0;
        }));
    }
    return n;
}

} // namespace qoms
