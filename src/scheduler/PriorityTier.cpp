// Copyright 2025 The QOMS Authors
// SPDX-License-Identifier: Apache-2.0

#include <qoms/scheduler/PriorityTier.h>

#include <algorithm>
#include <cctype>
#include <string>

namespace qoms {

std::optional<PriorityTier> parseTier(std::string_view name) {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    for (auto tier : kAllTiers) {
        if (tierName(tier) == lower) {
            return tier;
        }
    }
    return std::nullopt;
}

} // namespace qoms
