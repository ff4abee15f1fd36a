/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "splitledger/accounting/Settlement.hpp"

#include <algorithm>

//-------------------------------------------------------------------------

namespace splitledger::accounting
{

//-------------------------------------------------------------------------

namespace
{

struct Position
{
    Participant participant;
    double remaining;
};

}  // namespace

//-------------------------------------------------------------------------

std::vector<Transfer> settle(const NetBalances& net, double eps)
{
    // An exhausted side must satisfy remaining <= eps.
    eps = std::max(eps, 0.0);

    std::vector<Position> creditors;
    std::vector<Position> debtors;
    for (const auto& [participant, balance] : net) {
        if (balance > eps) {
            creditors.push_back({.participant = participant, .remaining = balance});
        } else if (balance < -eps) {
            debtors.push_back({.participant = participant, .remaining = -balance});
        }
    }

    auto byRemainingDesc = [](const Position& lhs, const Position& rhs) {
        return lhs.remaining > rhs.remaining;
    };
    std::ranges::stable_sort(creditors, byRemainingDesc);
    std::ranges::stable_sort(debtors, byRemainingDesc);

    std::vector<Transfer> transfers;
    size_t i{}, j{};
    while (i < debtors.size() && j < creditors.size()) {
        auto& debtor = debtors[i];
        auto& creditor = creditors[j];
        const double amount = std::min(debtor.remaining, creditor.remaining);
        if (amount > eps) {
            transfers.push_back({
                .debtor = debtor.participant,
                .creditor = creditor.participant,
                .amount = amount
            });
        }
        debtor.remaining -= amount;
        creditor.remaining -= amount;
        if (debtor.remaining <= eps) ++i;
        if (creditor.remaining <= eps) ++j;
    }

    return transfers;
}

//-------------------------------------------------------------------------

}  // namespace splitledger::accounting

//-------------------------------------------------------------------------
