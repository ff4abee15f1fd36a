/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "splitledger/ledger/ExpenseRecord.hpp"

#include "LedgerException.hpp"
#include "util.hpp"

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

void ExpenseRecord::validate(std::source_location sl) const
{
    if (!std::isfinite(amount) || amount < 0.0) {
        throw LedgerException{fmt::format(
            "{}: Amount must be a non-negative number, was {}", sl.function_name(), amount)};
    }
    if (payer.empty()) {
        throw LedgerException{fmt::format("{}: Expense '{}' has no payer", sl.function_name(), id)};
    }
    if (merchant.empty() && item.empty()) {
        throw LedgerException{fmt::format(
            "{}: Expense '{}' needs a merchant or an item", sl.function_name(), id)};
    }
    if (!date.ok()) {
        throw LedgerException{fmt::format("{}: Expense '{}' has no valid date", sl.function_name(), id)};
    }
}

//-------------------------------------------------------------------------

void ExpenseRecord::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        auto str = [&](const std::string& s) { return rapidjson::Value{s.c_str(), allocator}; };
        json.AddMember("id", str(id), allocator);
        json.AddMember("date", str(util::formatDate(date)), allocator);
        json.AddMember("payer", str(payer), allocator);
        json.AddMember("card", str(instrument), allocator);
        json.AddMember("merchant", str(merchant), allocator);
        json.AddMember("item", str(item), allocator);
        json.AddMember("amount", rapidjson::Value{amount}, allocator);
        rapidjson::Value allocationsJson{rapidjson::kObjectType};
        for (const auto& [participant, share] : allocations) {
            allocationsJson.AddMember(str(participant), rapidjson::Value{share}, allocator);
        }
        json.AddMember("allocations", allocationsJson, allocator);
        json.AddMember("notes", str(notes), allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

ExpenseRecord ExpenseRecord::fromJson(const rapidjson::Value& json)
{
    accounting::Shares allocations;
    if (const rapidjson::Value* allocationsJson = json::getObject(json, "allocations")) {
        for (const auto& member : allocationsJson->GetObject()) {
            if (!member.value.IsNumber()) {
                throw std::invalid_argument{fmt::format(
                    "{}: Allocation of '{}' should be a number",
                    std::source_location::current().function_name(),
                    member.name.GetString())};
            }
            allocations[member.name.GetString()] = member.value.GetDouble();
        }
    }

    return ExpenseRecord{
        .id = json::getString(json, "id"),
        .date = util::parseDate(json::getString(json, "date")),
        .payer = json::getString(json, "payer"),
        .instrument = json::getString(json, "card", ""),
        .merchant = json::getString(json, "merchant", ""),
        .item = json::getString(json, "item", ""),
        .amount = json::getDouble(json, "amount"),
        .allocations = std::move(allocations),
        .notes = json::getString(json, "notes", "")
    };
}

//-------------------------------------------------------------------------

std::string formatShares(const accounting::Shares& shares)
{
    return fmt::format(
        "{}",
        fmt::join(
            shares | views::transform([](const auto& entry) {
                return fmt::format("{}:{}", entry.first, entry.second);
            }),
            ";"));
}

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
