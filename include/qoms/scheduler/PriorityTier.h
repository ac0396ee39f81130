// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace qoms {

/**
 * @brief Priority tiers for queued operations.
 *
 * Lower numeric value means higher priority. Lanes are drained strictly in
 * this order; within a tier items are processed FIFO. Aging may promote a
 * long-waiting item one tier up.
 */
enum class PriorityTier : std::uint8_t {
    Critical = 0, ///< Never gated by admission control
    High = 1,
    Medium = 2, ///< Default tier for enqueue()
    Low = 3,
    Idle = 4 ///< Only runs on a near-idle host
};

inline constexpr std::size_t kTierCount = 5;

inline constexpr std::array<PriorityTier, kTierCount> kAllTiers = {
    PriorityTier::Critical, PriorityTier::High, PriorityTier::Medium, PriorityTier::Low,
    PriorityTier::Idle};

constexpr std::size_t tierIndex(PriorityTier tier) noexcept {
    return static_cast<std::size_t>(tier);
}

constexpr std::string_view tierName(PriorityTier tier) noexcept {
    switch (tier) {
        case PriorityTier::Critical:
            return "critical";
        case PriorityTier::High:
            return "high";
        case PriorityTier::Medium:
            return "medium";
        case PriorityTier::Low:
            return "low";
        case PriorityTier::Idle:
            return "idle";
    }
    return "unknown";
}

/// One tier up, saturating at Critical.
constexpr PriorityTier promoted(PriorityTier tier) noexcept {
    return tier == PriorityTier::Critical
               ? PriorityTier::Critical
               : static_cast<PriorityTier>(static_cast<std::uint8_t>(tier) - 1);
}

/// Case-insensitive parse of a tier name ("high", "IDLE", ...).
std::optional<PriorityTier> parseTier(std::string_view name);

} // namespace qoms
