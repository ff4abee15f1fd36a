/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "splitledger/accounting/Settlement.hpp"
#include "test-common/formatting.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace splitledger;
using namespace splitledger::accounting;

using namespace testing;

//-------------------------------------------------------------------------

TEST(SettlementTest, LargestCreditorServedFirst)
{
    const NetBalances net{{"A", 30.0}, {"B", 10.0}, {"C", -40.0}};

    EXPECT_THAT(
        settle(net),
        ElementsAre(
            Transfer{.debtor = "C", .creditor = "A", .amount = 30.0},
            Transfer{.debtor = "C", .creditor = "B", .amount = 10.0}));
}

//-------------------------------------------------------------------------

TEST(SettlementTest, LargestDebtorPaysFirst)
{
    const NetBalances net{{"A", 50.0}, {"B", -20.0}, {"C", -30.0}};

    EXPECT_THAT(
        settle(net),
        ElementsAre(
            Transfer{.debtor = "C", .creditor = "A", .amount = 30.0},
            Transfer{.debtor = "B", .creditor = "A", .amount = 20.0}));
}

//-------------------------------------------------------------------------

TEST(SettlementTest, TiesKeepInputOrder)
{
    const NetBalances net{{"B", 10.0}, {"A", 10.0}, {"D", -10.0}, {"C", -10.0}};

    EXPECT_THAT(
        settle(net),
        ElementsAre(
            Transfer{.debtor = "D", .creditor = "B", .amount = 10.0},
            Transfer{.debtor = "C", .creditor = "A", .amount = 10.0}));
}

//-------------------------------------------------------------------------

TEST(SettlementTest, BalancesWithinEpsAreSettled)
{
    EXPECT_THAT(settle({{"A", 1e-7}, {"B", -1e-7}}), IsEmpty());
    EXPECT_THAT(settle({}), IsEmpty());
    EXPECT_THAT(settle({{"A", 0.0}, {"B", 0.0}}), IsEmpty());
}

//-------------------------------------------------------------------------

TEST(SettlementTest, EpsIsConfigurable)
{
    const NetBalances net{{"A", 0.5}, {"B", -0.5}};

    EXPECT_THAT(settle(net, 1.0), IsEmpty());
    EXPECT_THAT(
        settle(net, 0.1),
        ElementsAre(Transfer{.debtor = "B", .creditor = "A", .amount = 0.5}));
}

//-------------------------------------------------------------------------

TEST(SettlementTest, NegativeEpsBehavesAsZero)
{
    EXPECT_THAT(
        settle({{"A", 5.0}, {"B", -5.0}}, -1.0),
        ElementsAre(Transfer{.debtor = "B", .creditor = "A", .amount = 5.0}));
}

//-------------------------------------------------------------------------

TEST(SettlementTest, DebtSplitsAcrossCreditors)
{
    const NetBalances net{{"A", 6.0}, {"B", 4.0}, {"C", -5.0}, {"D", -5.0}};

    EXPECT_THAT(
        settle(net),
        ElementsAre(
            Transfer{.debtor = "C", .creditor = "A", .amount = 5.0},
            Transfer{.debtor = "D", .creditor = "A", .amount = 1.0},
            Transfer{.debtor = "D", .creditor = "B", .amount = 4.0}));
}

//-------------------------------------------------------------------------

struct DischargeTestParams
{
    NetBalances net;
};

void PrintTo(const DischargeTestParams& params, std::ostream* os)
{
    *os << fmt::format("{{.net = {}}}", params.net);
}

struct DischargeTest : TestWithParam<DischargeTestParams>
{
    virtual void SetUp() override
    {
        params = GetParam();
    }

    DischargeTestParams params;
};

TEST_P(DischargeTest, WorksCorrectly)
{
    static constexpr double kEps = 1e-6;

    const auto transfers = settle(params.net, kEps);

    std::map<Participant, double> balance(params.net.begin(), params.net.end());
    for (const auto& transfer : transfers) {
        EXPECT_GT(transfer.amount, kEps);
        EXPECT_NE(transfer.debtor, transfer.creditor);
        balance[transfer.debtor] += transfer.amount;
        balance[transfer.creditor] -= transfer.amount;
    }
    for (const auto& [participant, remaining] : balance) {
        EXPECT_NEAR(remaining, 0.0, 1e-5) << participant;
    }

    const auto nonZero = ranges::count_if(
        params.net, [](const auto& entry) { return std::abs(entry.second) > kEps; });
    EXPECT_LE(static_cast<std::ptrdiff_t>(transfers.size()), std::max<std::ptrdiff_t>(nonZero - 1, 0));
}

INSTANTIATE_TEST_SUITE_P(
    SettlementTest,
    DischargeTest,
    Values(
        DischargeTestParams{.net = {{"A", 30.0}, {"B", 10.0}, {"C", -40.0}}},
        DischargeTestParams{.net = {{"A", -12.5}, {"B", 7.25}, {"C", 5.25}}},
        DischargeTestParams{.net = {{"A", 100.0}, {"B", -33.33}, {"C", -33.33}, {"D", -33.34}}},
        DischargeTestParams{
            .net = {{"A", 0.1}, {"B", 0.2}, {"C", -0.3}, {"D", 1.7}, {"E", -1.7}}},
        DischargeTestParams{
            .net = {{"A", 56.78}, {"B", -12.34}, {"C", -44.44}, {"D", 0.0}, {"E", 1e-8}}},
        DischargeTestParams{.net = {{"A", 1.0 / 3.0}, {"B", 1.0 / 3.0}, {"C", -2.0 / 3.0}}}));

//-------------------------------------------------------------------------
