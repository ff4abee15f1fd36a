/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "splitledger/accounting/types.hpp"

//-------------------------------------------------------------------------

namespace splitledger::accounting
{

//-------------------------------------------------------------------------

/**
 * Turns raw shares into weights over @p participants.
 *
 * Shares of participants outside the set are ignored, missing ones count as
 * zero and negative ones are clamped to zero. When nothing positive remains,
 * every participant gets 1 / max(1, |participants|). The result follows the
 * order of @p participants and is empty for an empty participant set.
 */
[[nodiscard]] Distribution normalize(const Shares& raw, std::span<const Participant> participants);

[[nodiscard]] Shares toShares(const Distribution& distribution);

[[nodiscard]] double weightOf(const Distribution& distribution, std::string_view participant) noexcept;

//-------------------------------------------------------------------------

}  // namespace splitledger::accounting

//-------------------------------------------------------------------------
