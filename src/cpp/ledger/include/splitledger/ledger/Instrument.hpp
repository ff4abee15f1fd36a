/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

/**
 * A payment instrument ("card"). cashbackRate is the fraction of a charged
 * amount returned to the payer, within [0, 1].
 */
struct Instrument
{
    std::string name;
    double cashbackRate{};

    bool operator==(const Instrument&) const noexcept = default;

    void validate(std::source_location sl = std::source_location::current()) const;

    void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const;

    [[nodiscard]] static Instrument fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<splitledger::ledger::Instrument>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const splitledger::ledger::Instrument& instrument, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{} ({:.2f}%)", instrument.name, instrument.cashbackRate * 100.0);
    }
};

//-------------------------------------------------------------------------
