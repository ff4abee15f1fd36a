/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <iostream>

//-------------------------------------------------------------------------

using namespace splitledger;

using namespace testing;

//-------------------------------------------------------------------------

TEST(UtilTest, Split)
{
    static constexpr std::string_view kTestStr1{"A:1;B:2;C:3"};
    static constexpr char delim = ';';

    EXPECT_THAT(util::split(kTestStr1, delim), ElementsAre("A:1", "B:2", "C:3"));

    static constexpr std::string_view kTestStr2{"A:1,B:2"};

    EXPECT_THAT(util::split(kTestStr2, delim), ElementsAre(kTestStr2));
    EXPECT_THAT(util::split("A;;B", delim), ElementsAre("A", "", "B"));
}

//-------------------------------------------------------------------------

TEST(UtilTest, Trim)
{
    EXPECT_EQ(util::trim("  Ann \t"), "Ann");
    EXPECT_EQ(util::trim("Ann Lee"), "Ann Lee");
    EXPECT_EQ(util::trim("   "), "");
}

//-------------------------------------------------------------------------

TEST(UtilTest, ParseDate)
{
    EXPECT_EQ(util::parseDate("2024-02-29"), (Date{date::year{2024}, date::February, date::day{29}}));
    EXPECT_EQ(util::parseDate(" 1999-12-31 "), (Date{date::year{1999}, date::December, date::day{31}}));
    EXPECT_LT(util::parseDate("2023-12-31"), util::parseDate("2024-01-01"));
}

TEST(UtilTest, ParseDateRejectsMalformedInput)
{
    for (std::string_view str : {
             "", "2024-2-01", "2024/02/01", "02-01-2024", "2024-02-30", "2023-02-29", "2024-13-01",
             "2024-00-10", "2024-01-32", "20240201", "2024-02-01T00:00"}) {
        EXPECT_THROW((void)util::parseDate(str), std::invalid_argument) << str;
    }
}

TEST(UtilTest, ParseNumber)
{
    EXPECT_DOUBLE_EQ(util::parseNumber("12.5", "amount"), 12.5);
    EXPECT_DOUBLE_EQ(util::parseNumber(" 1e-6 ", "eps"), 1e-6);
    EXPECT_DOUBLE_EQ(util::parseNumber("-3", "share"), -3.0);

    for (std::string_view str : {"", "  ", "abc", "five", "0.1x", "1,5", "inf", "nan"}) {
        EXPECT_THROW((void)util::parseNumber(str, "value"), std::invalid_argument) << str;
    }
    EXPECT_THAT(
        [] { (void)util::parseNumber("abc", "cashback rate"); },
        ThrowsMessage<std::invalid_argument>(HasSubstr("Invalid cashback rate 'abc'")));
}

//-------------------------------------------------------------------------

TEST(UtilTest, FormatDate)
{
    const auto date = util::parseDate("2024-03-07");

    EXPECT_EQ(util::formatDate(date), "2024-03-07");
    EXPECT_EQ(util::formatDate(date, "%m.%d"), "03.07");
    EXPECT_TRUE(util::today().ok());
}

//-------------------------------------------------------------------------

TEST(UtilTest, CsvEscape)
{
    EXPECT_EQ(util::csvEscape("plain"), "plain");
    EXPECT_EQ(util::csvEscape(""), "");
    EXPECT_EQ(util::csvEscape("a,b"), "\"a,b\"");
    EXPECT_EQ(util::csvEscape("say \"hi\""), "\"say \"\"hi\"\"\"");
    EXPECT_EQ(util::csvEscape("two\nlines"), "\"two\nlines\"");

    const std::vector<std::string> fields{"x", "y,z", ""};
    EXPECT_EQ(util::csvJoin(fields), "x,\"y,z\",");
}

TEST(UtilTest, ParseCsv)
{
    std::istringstream iss{
        "id,notes\r\n"
        "1,\"multi\nline, with \"\"quotes\"\"\"\r\n"
        "\n"
        "2,\n"
        "3,last"};

    const auto rows = util::parseCsv(iss);

    ASSERT_EQ(rows.size(), 4);
    EXPECT_THAT(rows[0], ElementsAre("id", "notes"));
    EXPECT_THAT(rows[1], ElementsAre("1", "multi\nline, with \"quotes\""));
    EXPECT_THAT(rows[2], ElementsAre("2", ""));
    EXPECT_THAT(rows[3], ElementsAre("3", "last"));
}

TEST(UtilTest, ParseCsvRejectsBadQuoting)
{
    std::istringstream unterminated{"a,\"open\nb,c\n"};
    EXPECT_THROW((void)util::parseCsv(unterminated), std::invalid_argument);

    std::istringstream stray{"a,b\"c\n"};
    EXPECT_THROW((void)util::parseCsv(stray), std::invalid_argument);
}

//-------------------------------------------------------------------------

TEST(UtilTest, CaptureOutput)
{
    auto printer = [](std::string_view str) -> void { std::cout << str; };

    static constexpr std::string_view kTestStr1{"A -> B: 1.00"};
    static constexpr std::string_view kTestStr2{"All settled."};
    const auto defaultBuffer = std::cout.rdbuf();

    EXPECT_THAT(util::captureOutput(printer, kTestStr1), StrEq(kTestStr1));
    EXPECT_THAT(util::captureOutput(printer, kTestStr2), StrEq(kTestStr2));
    EXPECT_THAT(std::cout.rdbuf(), Eq(defaultBuffer));
}

//-------------------------------------------------------------------------
