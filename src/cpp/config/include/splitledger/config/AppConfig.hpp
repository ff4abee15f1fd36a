/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "splitledger/accounting/types.hpp"
#include "splitledger/ledger/Ledger.hpp"

#include <pugixml.hpp>
#include <spdlog/common.h>

//-------------------------------------------------------------------------

namespace splitledger::config
{

//-------------------------------------------------------------------------

struct SettlementConfig
{
    double eps{accounting::kDefaultSettlementEps};
    accounting::SettlementBasis basis{accounting::SettlementBasis::Net};

    [[nodiscard]] static SettlementConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

struct DefaultsConfig
{
    std::vector<Participant> participants;
    std::vector<ledger::Instrument> instruments;
    bool applyCashbackAsDiscount{true};

    [[nodiscard]] static DefaultsConfig fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

class AppConfig
{
public:
    AppConfig() noexcept = default;
    AppConfig(spdlog::level::level_enum logLevel, SettlementConfig settlement, DefaultsConfig defaults);

    [[nodiscard]] auto&& logLevel(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_logLevel);
    }

    [[nodiscard]] auto&& settlement(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_settlement);
    }

    [[nodiscard]] auto&& defaults(this auto&& self) noexcept
    {
        return std::forward_like<decltype(self)>(self.m_defaults);
    }

    /**
     * A fresh ledger seeded from the defaults. Without configured
     * participants or instruments it falls back to a single participant
     * "Me" and a 0% instrument "Default 0%".
     */
    [[nodiscard]] ledger::Ledger makeDefaultLedger() const;

    [[nodiscard]] static AppConfig fromXML(pugi::xml_node node);
    [[nodiscard]] static AppConfig fromFile(const fs::path& path);
    [[nodiscard]] static AppConfig fromString(std::string_view xml);

private:
    spdlog::level::level_enum m_logLevel{spdlog::level::info};
    SettlementConfig m_settlement;
    DefaultsConfig m_defaults;
};

//-------------------------------------------------------------------------

[[nodiscard]] spdlog::level::level_enum parseLogLevel(std::string_view name);

//-------------------------------------------------------------------------

}  // namespace splitledger::config

//-------------------------------------------------------------------------
