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

struct Transfer
{
    Participant debtor;
    Participant creditor;
    double amount{};

    bool operator==(const Transfer&) const noexcept = default;
};

//-------------------------------------------------------------------------

/**
 * Greedy settlement of net balances.
 *
 * Creditors (net > eps) and debtors (net < -eps) are each ordered by
 * descending amount, ties keeping input order. The largest remaining debtor
 * pays the largest remaining creditor min(debt, credit), and whichever side
 * drops to within eps moves on, until either side runs out. The result
 * discharges every balance within eps, but is not guaranteed to use the
 * fewest possible transfers.
 */
[[nodiscard]] std::vector<Transfer> settle(
    const NetBalances& net, double eps = kDefaultSettlementEps);

//-------------------------------------------------------------------------

}  // namespace splitledger::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<splitledger::accounting::Transfer>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const splitledger::accounting::Transfer& transfer, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(), "{} -> {}: {:.2f}", transfer.debtor, transfer.creditor, transfer.amount);
    }
};

//-------------------------------------------------------------------------
