/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "splitledger/ledger/ExpenseRecord.hpp"

#include <array>
#include <istream>
#include <ostream>

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

inline constexpr std::array<std::string_view, 9> kExpenseCsvColumns{
    "id", "date", "payer", "card", "merchant", "item", "amount", "allocations", "notes"
};

void exportExpenses(std::span<const ExpenseRecord> records, std::ostream& os);
void exportExpenses(std::span<const ExpenseRecord> records, const fs::path& path);

// The header row is required; its column order is free and "notes" may be
// absent. Allocations are encoded as name:share;name:share.
[[nodiscard]] std::vector<ExpenseRecord> importExpenses(std::istream& is);
[[nodiscard]] std::vector<ExpenseRecord> importExpenses(const fs::path& path);

[[nodiscard]] accounting::Shares parseShares(std::string_view encoded);

/**
 * One expense typed as a CSV line without the id column:
 * date,payer,card,merchant,item,amount,allocations[,notes]
 */
[[nodiscard]] ExpenseRecord parseExpenseLine(std::string_view line);

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
