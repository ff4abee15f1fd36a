/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

//-------------------------------------------------------------------------

namespace splitledger::accounting
{

//-------------------------------------------------------------------------

inline constexpr double kDefaultSettlementEps = 1e-6;

// Raw, unnormalized shares as stored on a record.
using Shares = std::map<Participant, double>;

// Normalized weights, ordered like the participant set they were built against.
using Distribution = std::vector<std::pair<Participant, double>>;

// Net balances in participant order; positive is owed money.
using NetBalances = std::vector<std::pair<Participant, double>>;

enum class SettlementBasis
{
    Net,
    NetAfterCashback
};

// Case-insensitive, ignoring '_' and '-', so "net_after_cashback" names NetAfterCashback.
[[nodiscard]] SettlementBasis parseSettlementBasis(std::string_view name);

//-------------------------------------------------------------------------

}  // namespace splitledger::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<splitledger::accounting::SettlementBasis>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(splitledger::accounting::SettlementBasis basis, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", magic_enum::enum_name(basis));
    }
};

//-------------------------------------------------------------------------
