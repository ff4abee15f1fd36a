/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <iostream>
#include <istream>
#include <sstream>

//-------------------------------------------------------------------------

namespace splitledger::util
{

//-------------------------------------------------------------------------

template<typename... Args>
[[nodiscard]] std::string captureOutput(std::invocable<Args...> auto fn, Args&&... args) noexcept
{
    std::streambuf* coutBuffer = std::cout.rdbuf();
    std::stringstream sstream;
    std::cout.rdbuf(sstream.rdbuf());
    fn(std::forward<Args>(args)...);
    std::cout.rdbuf(coutBuffer);
    return sstream.str();
}

[[nodiscard]] std::vector<std::string> split(std::string_view str, char delim) noexcept;

[[nodiscard]] std::string trim(std::string_view str) noexcept;

/**
 * Parses a strict YYYY-MM-DD calendar date, ignoring surrounding whitespace.
 * Throws std::invalid_argument on anything else, including impossible dates
 * such as 2024-02-30.
 */
[[nodiscard]] Date parseDate(std::string_view str);

/**
 * Parses a whole string (surrounding whitespace aside) as a finite number.
 * Throws std::invalid_argument mentioning @p what on anything else.
 */
[[nodiscard]] double parseNumber(
    std::string_view str,
    std::string_view what,
    std::source_location sl = std::source_location::current());

[[nodiscard]] std::string formatDate(Date date, const char* fmt = "%F");

[[nodiscard]] Date today() noexcept;

// RFC 4180 quoting: fields containing a comma, quote or line break are quoted
// and embedded quotes doubled.
[[nodiscard]] std::string csvEscape(std::string_view field);

[[nodiscard]] std::string csvJoin(std::span<const std::string> fields);

[[nodiscard]] std::vector<std::vector<std::string>> parseCsv(std::istream& is);

//-------------------------------------------------------------------------

}  // namespace splitledger::util

//-------------------------------------------------------------------------
