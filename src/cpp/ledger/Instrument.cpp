/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "splitledger/ledger/Instrument.hpp"

#include "LedgerException.hpp"

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

void Instrument::validate(std::source_location sl) const
{
    if (name.empty()) {
        throw LedgerException{fmt::format("{}: Instrument name required", sl.function_name())};
    }
    if (!(cashbackRate >= 0.0 && cashbackRate <= 1.0)) {
        throw LedgerException{fmt::format(
            "{}: Cashback rate of '{}' must be within [0, 1], was {}",
            sl.function_name(),
            name,
            cashbackRate)};
    }
}

//-------------------------------------------------------------------------

void Instrument::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("name", rapidjson::Value{name.c_str(), allocator}, allocator);
        json.AddMember("cashback_rate", rapidjson::Value{cashbackRate}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Instrument Instrument::fromJson(const rapidjson::Value& json)
{
    return Instrument{
        .name = json::getString(json, "name"),
        .cashbackRate = json::getDouble(json, "cashback_rate", 0.0)
    };
}

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
