/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "util.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <cctype>
#include <charconv>
#include <chrono>

//-------------------------------------------------------------------------

namespace splitledger::util
{

//-------------------------------------------------------------------------

std::vector<std::string> split(std::string_view str, char delim) noexcept
{
    std::vector<std::string> res;
    boost::split(res, str, [delim](auto c) { return c == delim; });
    return res;
}

//-------------------------------------------------------------------------

std::string trim(std::string_view str) noexcept
{
    return boost::trim_copy(std::string{str});
}

//-------------------------------------------------------------------------

Date parseDate(std::string_view str)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto trimmed = trim(str);
    const bool wellFormed = trimmed.size() == 10
        && ranges::all_of(
            views::iota(0uz, trimmed.size()),
            [&](size_t i) {
                return i == 4 || i == 7
                    ? trimmed[i] == '-'
                    : std::isdigit(static_cast<unsigned char>(trimmed[i])) != 0;
            });
    if (!wellFormed) {
        throw std::invalid_argument{fmt::format(
            "{}: Date must be YYYY-MM-DD, was '{}'", ctx, str)};
    }

    std::istringstream in{trimmed};
    Date date;
    date::from_stream(in, "%Y-%m-%d", date);
    if (in.fail() || !date.ok()) {
        throw std::invalid_argument{fmt::format("{}: Invalid calendar date '{}'", ctx, str)};
    }
    return date;
}

//-------------------------------------------------------------------------

double parseNumber(std::string_view str, std::string_view what, std::source_location sl)
{
    const auto trimmed = trim(str);
    double value{};
    const auto [ptr, ec] =
        std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (trimmed.empty() || ec != std::errc{} || ptr != trimmed.data() + trimmed.size()
        || !std::isfinite(value)) {
        throw std::invalid_argument{fmt::format(
            "{}: Invalid {} '{}'", sl.function_name(), what, str)};
    }
    return value;
}

//-------------------------------------------------------------------------

std::string formatDate(Date date, const char* fmt)
{
    return date::format(fmt, date::sys_days{date});
}

//-------------------------------------------------------------------------

Date today() noexcept
{
    return Date{date::floor<date::days>(std::chrono::system_clock::now())};
}

//-------------------------------------------------------------------------

std::string csvEscape(std::string_view field)
{
    if (field.find_first_of(",\"\r\n") == std::string_view::npos) {
        return std::string{field};
    }
    return fmt::format("\"{}\"", boost::replace_all_copy(std::string{field}, "\"", "\"\""));
}

//-------------------------------------------------------------------------

std::string csvJoin(std::span<const std::string> fields)
{
    return fmt::format(
        "{}", fmt::join(fields | views::transform([](const auto& f) { return csvEscape(f); }), ","));
}

//-------------------------------------------------------------------------

std::vector<std::vector<std::string>> parseCsv(std::istream& is)
{
    std::vector<std::vector<std::string>> rows;
    std::vector<std::string> row;
    std::string field;
    bool quoted = false;
    bool fieldStarted = false;
    size_t line = 1;
    size_t quoteLine = 0;

    auto endField = [&] {
        row.push_back(std::move(field));
        field.clear();
        fieldStarted = false;
    };
    auto endRow = [&] {
        endField();
        // Blank lines carry no data.
        if (!(row.size() == 1 && row.front().empty())) {
            rows.push_back(std::move(row));
        }
        row.clear();
    };

    char c;
    while (is.get(c)) {
        if (quoted) {
            if (c == '"') {
                if (is.peek() == '"') {
                    is.get(c);
                    field += '"';
                } else {
                    quoted = false;
                }
            } else {
                if (c == '\n') ++line;
                field += c;
            }
            continue;
        }
        switch (c) {
            case '"':
                if (fieldStarted) {
                    throw std::invalid_argument{fmt::format(
                        "{}: Unexpected quote inside unquoted field on line {}",
                        std::source_location::current().function_name(),
                        line)};
                }
                quoted = true;
                fieldStarted = true;
                quoteLine = line;
                break;
            case ',':
                endField();
                break;
            case '\r':
                break;
            case '\n':
                endRow();
                ++line;
                break;
            default:
                field += c;
                fieldStarted = true;
        }
    }

    if (quoted) {
        throw std::invalid_argument{fmt::format(
            "{}: Unterminated quoted field starting on line {}",
            std::source_location::current().function_name(),
            quoteLine)};
    }
    if (fieldStarted || !row.empty()) {
        endRow();
    }

    return rows;
}

//-------------------------------------------------------------------------

}  // namespace splitledger::util

//-------------------------------------------------------------------------
