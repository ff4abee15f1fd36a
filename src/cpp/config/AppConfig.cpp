/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "splitledger/config/AppConfig.hpp"

#include "util.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace splitledger::config
{

//-------------------------------------------------------------------------

namespace
{

inline constexpr std::string_view kRootNodeName{"SplitLedger"};
inline constexpr std::string_view kFallbackParticipant{"Me"};
inline constexpr std::string_view kFallbackInstrument{"Default 0%"};

[[nodiscard]] AppConfig fromDocument(
    const pugi::xml_document& doc, const pugi::xml_parse_result& parseResult, std::string_view origin)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!parseResult) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to parse config '{}': {} at offset {}",
            ctx,
            origin,
            parseResult.description(),
            parseResult.offset)};
    }
    pugi::xml_node root = doc.child(kRootNodeName.data());
    if (!root) {
        throw std::invalid_argument{fmt::format(
            "{}: Config '{}' lacks a <{}> root element", ctx, origin, kRootNodeName)};
    }
    return AppConfig::fromXML(root);
}

}  // namespace

//-------------------------------------------------------------------------

SettlementConfig SettlementConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    SettlementConfig config;
    if (!node) return config;

    if (pugi::xml_attribute eps = node.attribute("eps")) {
        config.eps = util::parseNumber(eps.as_string(), "settlement eps");
    }
    if (config.eps < 0.0) {
        throw std::invalid_argument{fmt::format(
            "{}: Settlement eps must be a non-negative number, was '{}'",
            ctx,
            node.attribute("eps").as_string())};
    }
    if (pugi::xml_attribute basis = node.attribute("basis")) {
        config.basis = accounting::parseSettlementBasis(basis.as_string());
    }
    return config;
}

//-------------------------------------------------------------------------

DefaultsConfig DefaultsConfig::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    DefaultsConfig config;
    if (!node) return config;

    config.applyCashbackAsDiscount = node.attribute("applyCashbackAsDiscount").as_bool(true);

    for (pugi::xml_node participantNode : node.children("Participant")) {
        auto name = util::trim(participantNode.attribute("name").as_string());
        if (name.empty()) {
            throw std::invalid_argument{fmt::format("{}: <Participant> without a name", ctx)};
        }
        config.participants.push_back(std::move(name));
    }

    for (pugi::xml_node instrumentNode : node.children("Instrument")) {
        pugi::xml_attribute rate = instrumentNode.attribute("cashbackRate");
        ledger::Instrument instrument{
            .name = util::trim(instrumentNode.attribute("name").as_string()),
            .cashbackRate = rate ? util::parseNumber(rate.as_string(), "cashback rate") : 0.0
        };
        if (instrument.name.empty()) {
            throw std::invalid_argument{fmt::format("{}: <Instrument> without a name", ctx)};
        }
        if (!(instrument.cashbackRate >= 0.0 && instrument.cashbackRate <= 1.0)) {
            throw std::invalid_argument{fmt::format(
                "{}: Cashback rate of '{}' must be within [0, 1], was {}",
                ctx,
                instrument.name,
                instrument.cashbackRate)};
        }
        config.instruments.push_back(std::move(instrument));
    }

    return config;
}

//-------------------------------------------------------------------------

AppConfig::AppConfig(
    spdlog::level::level_enum logLevel, SettlementConfig settlement, DefaultsConfig defaults)
    : m_logLevel{logLevel}, m_settlement{settlement}, m_defaults{std::move(defaults)}
{}

//-------------------------------------------------------------------------

ledger::Ledger AppConfig::makeDefaultLedger() const
{
    auto participants = m_defaults.participants;
    if (participants.empty()) {
        participants.emplace_back(kFallbackParticipant);
    }
    auto instruments = m_defaults.instruments;
    if (instruments.empty()) {
        instruments.push_back({.name = std::string{kFallbackInstrument}, .cashbackRate = 0.0});
    }
    return ledger::Ledger{
        std::move(participants), std::move(instruments), {}, m_defaults.applyCashbackAsDiscount};
}

//-------------------------------------------------------------------------

AppConfig AppConfig::fromXML(pugi::xml_node node)
{
    spdlog::level::level_enum logLevel = spdlog::level::info;
    if (pugi::xml_attribute level = node.child("Logging").attribute("level")) {
        logLevel = parseLogLevel(level.as_string());
    }
    return AppConfig{
        logLevel,
        SettlementConfig::fromXML(node.child("Settlement")),
        DefaultsConfig::fromXML(node.child("Defaults"))};
}

//-------------------------------------------------------------------------

AppConfig AppConfig::fromFile(const fs::path& path)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result parseResult = doc.load_file(path.c_str());
    return fromDocument(doc, parseResult, path.string());
}

//-------------------------------------------------------------------------

AppConfig AppConfig::fromString(std::string_view xml)
{
    pugi::xml_document doc;
    const pugi::xml_parse_result parseResult = doc.load_buffer(xml.data(), xml.size());
    return fromDocument(doc, parseResult, "<string>");
}

//-------------------------------------------------------------------------

spdlog::level::level_enum parseLogLevel(std::string_view name)
{
    const auto level = spdlog::level::from_str(std::string{name});
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && name != "off") {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown log level '{}'", std::source_location::current().function_name(), name)};
    }
    return level;
}

//-------------------------------------------------------------------------

}  // namespace splitledger::config

//-------------------------------------------------------------------------
