/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerException.hpp"
#include "splitledger/config/AppConfig.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <fstream>

//-------------------------------------------------------------------------

using namespace splitledger;
using namespace splitledger::config;

using namespace testing;

//-------------------------------------------------------------------------

TEST(ConfigTest, FullDocument)
{
    const auto config = AppConfig::fromString(R"(
        <SplitLedger>
            <Logging level="debug"/>
            <Settlement eps="0.005" basis="net_after_cashback"/>
            <Defaults applyCashbackAsDiscount="false">
                <Participant name="Ann"/>
                <Participant name=" Ben "/>
                <Instrument name="Visa" cashbackRate="0.015"/>
                <Instrument name="Cash"/>
            </Defaults>
        </SplitLedger>
    )");

    EXPECT_EQ(config.logLevel(), spdlog::level::debug);
    EXPECT_DOUBLE_EQ(config.settlement().eps, 0.005);
    EXPECT_EQ(config.settlement().basis, accounting::SettlementBasis::NetAfterCashback);
    EXPECT_THAT(config.defaults().participants, ElementsAre("Ann", "Ben"));
    EXPECT_THAT(
        config.defaults().instruments,
        ElementsAre(
            ledger::Instrument{.name = "Visa", .cashbackRate = 0.015},
            ledger::Instrument{.name = "Cash", .cashbackRate = 0.0}));
    EXPECT_FALSE(config.defaults().applyCashbackAsDiscount);
}

TEST(ConfigTest, MinimalDocumentTakesDefaults)
{
    const auto config = AppConfig::fromString("<SplitLedger/>");

    EXPECT_EQ(config.logLevel(), spdlog::level::info);
    EXPECT_DOUBLE_EQ(config.settlement().eps, accounting::kDefaultSettlementEps);
    EXPECT_EQ(config.settlement().basis, accounting::SettlementBasis::Net);
    EXPECT_THAT(config.defaults().participants, IsEmpty());
    EXPECT_THAT(config.defaults().instruments, IsEmpty());
    EXPECT_TRUE(config.defaults().applyCashbackAsDiscount);
}

//-------------------------------------------------------------------------

struct InvalidConfigTestParams
{
    std::string_view xml;
};

void PrintTo(const InvalidConfigTestParams& params, std::ostream* os)
{
    *os << params.xml;
}

struct InvalidConfigTest : TestWithParam<InvalidConfigTestParams>
{};

TEST_P(InvalidConfigTest, Throws)
{
    EXPECT_THROW((void)AppConfig::fromString(GetParam().xml), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    ConfigTest,
    InvalidConfigTest,
    Values(
        InvalidConfigTestParams{"<SplitLedger>"},
        InvalidConfigTestParams{"<Config/>"},
        InvalidConfigTestParams{R"(<SplitLedger><Logging level="loud"/></SplitLedger>)"},
        InvalidConfigTestParams{R"(<SplitLedger><Settlement eps="-0.1"/></SplitLedger>)"},
        InvalidConfigTestParams{R"(<SplitLedger><Settlement eps="abc"/></SplitLedger>)"},
        InvalidConfigTestParams{R"(<SplitLedger><Settlement eps=""/></SplitLedger>)"},
        InvalidConfigTestParams{R"(<SplitLedger><Settlement basis="gross"/></SplitLedger>)"},
        InvalidConfigTestParams{R"(<SplitLedger><Defaults><Participant/></Defaults></SplitLedger>)"},
        InvalidConfigTestParams{R"(<SplitLedger><Defaults><Instrument name=""/></Defaults></SplitLedger>)"},
        InvalidConfigTestParams{
            R"(<SplitLedger><Defaults><Instrument name="X" cashbackRate="1.5"/></Defaults></SplitLedger>)"},
        InvalidConfigTestParams{
            R"(<SplitLedger><Defaults><Instrument name="X" cashbackRate="five"/></Defaults></SplitLedger>)"},
        InvalidConfigTestParams{
            R"(<SplitLedger><Defaults><Instrument name="X" cashbackRate="0.1x"/></Defaults></SplitLedger>)"}));

//-------------------------------------------------------------------------

TEST(ConfigTest, FromFile)
{
    const auto path = fs::temp_directory_path() / "splitledger-config-test.xml";
    std::ofstream{path} << R"(<SplitLedger><Logging level="warn"/></SplitLedger>)";

    const auto config = AppConfig::fromFile(path);
    fs::remove(path);

    EXPECT_EQ(config.logLevel(), spdlog::level::warn);
    EXPECT_THROW(
        (void)AppConfig::fromFile(fs::temp_directory_path() / "splitledger-no-such-config.xml"),
        std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(ConfigTest, DefaultLedgerFallbacks)
{
    const auto ledger = AppConfig{}.makeDefaultLedger();

    EXPECT_THAT(ledger.participants(), ElementsAre("Me"));
    ASSERT_EQ(ledger.instruments().size(), 1);
    EXPECT_EQ(ledger.instruments().front().name, "Default 0%");
    EXPECT_DOUBLE_EQ(ledger.instruments().front().cashbackRate, 0.0);
    EXPECT_THAT(ledger.records(), IsEmpty());
    EXPECT_TRUE(ledger.applyCashbackAsDiscount());
}

TEST(ConfigTest, DefaultLedgerFromConfig)
{
    const auto ledger = AppConfig::fromString(R"(
        <SplitLedger>
            <Defaults applyCashbackAsDiscount="false">
                <Participant name="Ann"/>
                <Participant name="Ben"/>
                <Instrument name="Visa" cashbackRate="0.02"/>
            </Defaults>
        </SplitLedger>
    )").makeDefaultLedger();

    EXPECT_THAT(ledger.participants(), ElementsAre("Ann", "Ben"));
    EXPECT_THAT(ledger.instruments(), ElementsAre(ledger::Instrument{.name = "Visa", .cashbackRate = 0.02}));
    EXPECT_FALSE(ledger.applyCashbackAsDiscount());
}

TEST(ConfigTest, DuplicateDefaultParticipantsRejectedByLedger)
{
    const auto config = AppConfig::fromString(R"(
        <SplitLedger><Defaults><Participant name="Ann"/><Participant name="Ann"/></Defaults></SplitLedger>
    )");

    EXPECT_THROW((void)config.makeDefaultLedger(), LedgerException);
}

//-------------------------------------------------------------------------

TEST(ConfigTest, ParseLogLevel)
{
    EXPECT_EQ(parseLogLevel("trace"), spdlog::level::trace);
    EXPECT_EQ(parseLogLevel("info"), spdlog::level::info);
    EXPECT_EQ(parseLogLevel("off"), spdlog::level::off);
    EXPECT_THROW((void)parseLogLevel("verbose"), std::invalid_argument);
}

TEST(ConfigTest, ParseSettlementBasis)
{
    EXPECT_EQ(accounting::parseSettlementBasis("net"), accounting::SettlementBasis::Net);
    EXPECT_EQ(accounting::parseSettlementBasis("Net"), accounting::SettlementBasis::Net);
    EXPECT_EQ(
        accounting::parseSettlementBasis("net_after_cashback"),
        accounting::SettlementBasis::NetAfterCashback);
    EXPECT_EQ(
        accounting::parseSettlementBasis("NetAfterCashback"),
        accounting::SettlementBasis::NetAfterCashback);
    EXPECT_THROW((void)accounting::parseSettlementBasis("gross"), std::invalid_argument);
}

//-------------------------------------------------------------------------
