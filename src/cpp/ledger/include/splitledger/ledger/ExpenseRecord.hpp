/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "splitledger/accounting/types.hpp"

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

struct ExpenseRecord
{
    RecordId id;
    Date date{};
    Participant payer;
    std::string instrument;
    std::string merchant;
    std::string item;
    double amount{};
    accounting::Shares allocations;
    std::string notes;

    bool operator==(const ExpenseRecord&) const = default;

    /**
     * Entry rules of the editing surface: a non-negative finite amount, a
     * payer, and a merchant or an item to describe the expense.
     */
    void validate(std::source_location sl = std::source_location::current()) const;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static ExpenseRecord fromJson(const rapidjson::Value& json);
};

[[nodiscard]] std::string formatShares(const accounting::Shares& shares);

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
