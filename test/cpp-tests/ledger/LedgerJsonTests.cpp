/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerException.hpp"
#include "json_util.hpp"
#include "splitledger/ledger/Ledger.hpp"
#include "util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace splitledger;
using namespace splitledger::ledger;

using namespace testing;

//-------------------------------------------------------------------------

static constexpr std::string_view kSampleDocument = R"({
    "version": 1,
    "people": ["Ann", "Ben"],
    "apply_cashback_as_discount": false,
    "cards": [
        {"name": "Visa", "cashback_rate": 0.02},
        {"name": "Cash"}
    ],
    "expenses": [
        {
            "id": "e1",
            "date": "2024-02-10",
            "payer": "Ann",
            "card": "Visa",
            "merchant": "Grocer",
            "item": "Fruit",
            "amount": 40,
            "allocations": {"Ann": 0.5, "Ben": 0.5},
            "notes": "weekly"
        },
        {
            "id": "e2",
            "date": "2024-02-11",
            "payer": "Ben",
            "amount": 9.5
        }
    ]
})";

[[nodiscard]] static Ledger parseLedger(std::string_view document)
{
    return Ledger::fromJson(json::str2json(std::string{document}));
}

//-------------------------------------------------------------------------

TEST(LedgerJsonTest, ParsesDocument)
{
    const auto ledger = parseLedger(kSampleDocument);

    EXPECT_EQ(ledger.version(), 1);
    EXPECT_THAT(ledger.participants(), ElementsAre("Ann", "Ben"));
    EXPECT_FALSE(ledger.applyCashbackAsDiscount());
    EXPECT_THAT(
        ledger.instruments(),
        ElementsAre(
            Instrument{.name = "Visa", .cashbackRate = 0.02},
            Instrument{.name = "Cash", .cashbackRate = 0.0}));

    ASSERT_EQ(ledger.records().size(), 2);
    const auto& first = ledger.records()[0];
    EXPECT_EQ(first.id, "e1");
    EXPECT_EQ(first.date, util::parseDate("2024-02-10"));
    EXPECT_EQ(first.instrument, "Visa");
    EXPECT_DOUBLE_EQ(first.amount, 40.0);
    EXPECT_THAT(first.allocations, ElementsAre(Pair("Ann", 0.5), Pair("Ben", 0.5)));
    EXPECT_EQ(first.notes, "weekly");

    const auto& second = ledger.records()[1];
    EXPECT_THAT(second.instrument, IsEmpty());
    EXPECT_THAT(second.merchant, IsEmpty());
    EXPECT_THAT(second.allocations, IsEmpty());
}

TEST(LedgerJsonTest, MissingSectionsTakeDefaults)
{
    const auto ledger = parseLedger("{}");

    EXPECT_EQ(ledger.version(), kLedgerVersion);
    EXPECT_THAT(ledger.participants(), IsEmpty());
    EXPECT_THAT(ledger.instruments(), IsEmpty());
    EXPECT_THAT(ledger.records(), IsEmpty());
    EXPECT_TRUE(ledger.applyCashbackAsDiscount());
}

TEST(LedgerJsonTest, NewerVersionStillLoads)
{
    const auto ledger = parseLedger(R"({"version": 7, "people": ["A"]})");

    EXPECT_EQ(ledger.version(), 7);
    EXPECT_THAT(ledger.participants(), ElementsAre("A"));
}

TEST(LedgerJsonTest, SerializesThroughBaseUnderKey)
{
    const auto ledger = parseLedger(kSampleDocument);
    const JsonSerializable& serializable = ledger;

    rapidjson::Document json{rapidjson::kObjectType};
    serializable.jsonSerialize(json, "ledger");

    ASSERT_TRUE(json.HasMember("ledger"));
    const auto reparsed = Ledger::fromJson(json["ledger"]);
    EXPECT_EQ(reparsed.participants(), ledger.participants());
    EXPECT_EQ(reparsed.records(), ledger.records());
}

//-------------------------------------------------------------------------

struct MalformedLedgerTestParams
{
    std::string_view document;
};

void PrintTo(const MalformedLedgerTestParams& params, std::ostream* os)
{
    *os << params.document;
}

struct MalformedLedgerTest : TestWithParam<MalformedLedgerTestParams>
{};

TEST_P(MalformedLedgerTest, Throws)
{
    EXPECT_THROW((void)parseLedger(GetParam().document), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    LedgerJsonTest,
    MalformedLedgerTest,
    Values(
        MalformedLedgerTestParams{R"([])"},
        MalformedLedgerTestParams{R"({"people": "Ann"})"},
        MalformedLedgerTestParams{R"({"people": [1, 2]})"},
        MalformedLedgerTestParams{R"({"apply_cashback_as_discount": "yes"})"},
        MalformedLedgerTestParams{R"({"cards": [{"cashback_rate": 0.1}]})"},
        MalformedLedgerTestParams{R"({"expenses": [{"id": "x", "date": "10/02/2024", "payer": "A", "amount": 1}]})"},
        MalformedLedgerTestParams{R"({"expenses": [{"id": "x", "date": "2024-02-30", "payer": "A", "amount": 1}]})"},
        MalformedLedgerTestParams{R"({"expenses": [{"id": "x", "date": "2024-02-10", "payer": "A", "amount": "1"}]})"},
        MalformedLedgerTestParams{R"({"expenses": [{"date": "2024-02-10", "payer": "A", "amount": 1}]})"},
        MalformedLedgerTestParams{R"({"expenses": [{"id": "x", "date": "2024-02-10", "payer": "A", "amount": 1, "allocations": {"A": "half"}}]})"}));

TEST(LedgerJsonTest, StructuralViolationsThrowLedgerException)
{
    EXPECT_THROW((void)parseLedger(R"({"people": ["A", "A"]})"), LedgerException);
    EXPECT_THROW(
        (void)parseLedger(R"({"cards": [{"name": "Visa", "cashback_rate": 3}]})"), LedgerException);
}

//-------------------------------------------------------------------------

struct LedgerFileTest : Test
{
    virtual void SetUp() override
    {
        dir = fs::temp_directory_path() / fmt::format("splitledger-json-{}", makeRecordId());
        fs::create_directories(dir);
    }

    virtual void TearDown() override
    {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
};

TEST_F(LedgerFileTest, SaveThenLoad)
{
    const auto original = parseLedger(kSampleDocument);
    const auto path = dir / "ledger.json";

    saveLedger(original, path);
    const auto loaded = loadLedger(path);

    EXPECT_EQ(loaded.participants(), original.participants());
    EXPECT_EQ(loaded.instruments(), original.instruments());
    EXPECT_EQ(loaded.records(), original.records());
    EXPECT_EQ(loaded.applyCashbackAsDiscount(), original.applyCashbackAsDiscount());
}

TEST_F(LedgerFileTest, SavedDocumentUsesExchangeKeys)
{
    const auto path = dir / "ledger.json";
    saveLedger(parseLedger(kSampleDocument), path);

    const auto document = json::loadJson(path);

    ASSERT_TRUE(document.IsObject());
    for (const char* key : {"version", "people", "apply_cashback_as_discount", "cards", "expenses"}) {
        EXPECT_TRUE(document.HasMember(key)) << key;
    }
    const auto& expense = document["expenses"][0u];
    EXPECT_STREQ(expense["card"].GetString(), "Visa");
    EXPECT_STREQ(expense["date"].GetString(), "2024-02-10");
    EXPECT_DOUBLE_EQ(document["cards"][0u]["cashback_rate"].GetDouble(), 0.02);
}

TEST_F(LedgerFileTest, LoadFailures)
{
    EXPECT_THROW((void)loadLedger(dir / "missing.json"), std::invalid_argument);

    const auto corrupt = dir / "corrupt.json";
    std::ofstream{corrupt} << "{\"people\": [";
    EXPECT_THROW((void)loadLedger(corrupt), std::invalid_argument);
}

//-------------------------------------------------------------------------
