/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "splitledger/accounting/Allocation.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace splitledger::accounting
{

//-------------------------------------------------------------------------

Distribution normalize(const Shares& raw, std::span<const Participant> participants)
{
    auto clampedShareOf = [&](const Participant& p) {
        auto it = raw.find(p);
        return it != raw.end() ? std::max(0.0, it->second) : 0.0;
    };

    const double total = ranges::accumulate(
        participants | views::transform(clampedShareOf), 0.0);

    Distribution distribution;
    distribution.reserve(participants.size());

    if (!(total > 0.0)) {
        const double equalShare =
            1.0 / static_cast<double>(std::max<size_t>(1, participants.size()));
        for (const auto& p : participants) {
            distribution.emplace_back(p, equalShare);
        }
        return distribution;
    }

    for (const auto& p : participants) {
        distribution.emplace_back(p, clampedShareOf(p) / total);
    }
    return distribution;
}

//-------------------------------------------------------------------------

Shares toShares(const Distribution& distribution)
{
    return Shares(distribution.begin(), distribution.end());
}

//-------------------------------------------------------------------------

double weightOf(const Distribution& distribution, std::string_view participant) noexcept
{
    auto it = ranges::find(distribution, participant, [](const auto& entry) -> std::string_view {
        return entry.first;
    });
    return it != distribution.end() ? it->second : 0.0;
}

//-------------------------------------------------------------------------

}  // namespace splitledger::accounting

//-------------------------------------------------------------------------
