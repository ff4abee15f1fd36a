/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ExpenseCsv.hpp"

#include "util.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <sstream>

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

namespace
{

// Builds a record from named columns; absent columns read as empty.
template<typename FieldFn>
[[nodiscard]] ExpenseRecord recordFromFields(FieldFn field)
{
    return ExpenseRecord{
        .id = util::trim(field("id")),
        .date = util::parseDate(field("date")),
        .payer = util::trim(field("payer")),
        .instrument = util::trim(field("card")),
        .merchant = field("merchant"),
        .item = field("item"),
        .amount = util::parseNumber(field("amount"), "amount"),
        .allocations = parseShares(field("allocations")),
        .notes = field("notes")
    };
}

}  // namespace

//-------------------------------------------------------------------------

void exportExpenses(std::span<const ExpenseRecord> records, std::ostream& os)
{
    const std::vector<std::string> header{kExpenseCsvColumns.begin(), kExpenseCsvColumns.end()};
    os << util::csvJoin(header) << '\n';
    for (const auto& record : records) {
        const std::vector<std::string> fields{
            record.id,
            util::formatDate(record.date),
            record.payer,
            record.instrument,
            record.merchant,
            record.item,
            fmt::format("{}", record.amount),
            formatShares(record.allocations),
            record.notes
        };
        os << util::csvJoin(fields) << '\n';
    }
}

//-------------------------------------------------------------------------

void exportExpenses(std::span<const ExpenseRecord> records, const fs::path& path)
{
    std::ofstream ofs{path};
    if (!ofs) {
        throw std::runtime_error{fmt::format(
            "{}: Unable to open '{}' for writing",
            std::source_location::current().function_name(),
            path.c_str())};
    }
    exportExpenses(records, ofs);
    spdlog::info("Exported {} expense(s) to '{}'", records.size(), path.c_str());
}

//-------------------------------------------------------------------------

std::vector<ExpenseRecord> importExpenses(std::istream& is)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    const auto rows = util::parseCsv(is);
    if (rows.empty()) {
        throw std::invalid_argument{fmt::format("{}: Missing header row", ctx)};
    }

    const auto& header = rows.front();
    std::map<std::string, size_t, std::less<>> columnIndex;
    for (size_t i{}; i < header.size(); ++i) {
        columnIndex.emplace(util::trim(header[i]), i);
    }
    for (std::string_view column : kExpenseCsvColumns) {
        if (column != "notes" && !columnIndex.contains(column)) {
            throw std::invalid_argument{fmt::format("{}: Missing column '{}'", ctx, column)};
        }
    }

    std::vector<ExpenseRecord> records;
    records.reserve(rows.size() - 1);

    for (size_t rowIdx = 1; rowIdx < rows.size(); ++rowIdx) {
        const auto& row = rows[rowIdx];
        if (row.size() != header.size()) {
            throw std::invalid_argument{fmt::format(
                "{}: Row {} has {} field(s), header has {}",
                ctx,
                rowIdx + 1,
                row.size(),
                header.size())};
        }
        auto field = [&](std::string_view column) -> std::string {
            auto it = columnIndex.find(column);
            return it != columnIndex.end() ? row[it->second] : std::string{};
        };

        try {
            records.push_back(recordFromFields(field));
        }
        catch (const std::invalid_argument& e) {
            throw std::invalid_argument{fmt::format("{}: Row {}: {}", ctx, rowIdx + 1, e.what())};
        }
    }

    return records;
}

//-------------------------------------------------------------------------

std::vector<ExpenseRecord> importExpenses(const fs::path& path)
{
    std::ifstream ifs{path};
    if (!ifs) {
        throw std::invalid_argument{fmt::format(
            "{}: No such file '{}'", std::source_location::current().function_name(), path.c_str())};
    }
    auto records = importExpenses(ifs);
    spdlog::info("Read {} expense(s) from '{}'", records.size(), path.c_str());
    return records;
}

//-------------------------------------------------------------------------

accounting::Shares parseShares(std::string_view encoded)
{
    accounting::Shares shares;
    if (util::trim(encoded).empty()) return shares;

    for (const auto& pair : util::split(encoded, ';')) {
        const auto sep = pair.find(':');
        if (sep == std::string::npos) continue;
        shares[util::trim(std::string_view{pair}.substr(0, sep))] =
            util::parseNumber(std::string_view{pair}.substr(sep + 1), "allocation share");
    }
    return shares;
}

//-------------------------------------------------------------------------

ExpenseRecord parseExpenseLine(std::string_view line)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::istringstream iss{std::string{line}};
    const auto rows = util::parseCsv(iss);
    if (rows.size() != 1) {
        throw std::invalid_argument{fmt::format(
            "{}: Expected a single expense line, got {} line(s)", ctx, rows.size())};
    }
    const auto& row = rows.front();
    // The id column is left out; notes are optional.
    const auto columns = std::span{kExpenseCsvColumns}.subspan(1);
    if (row.size() != columns.size() && row.size() != columns.size() - 1) {
        throw std::invalid_argument{fmt::format(
            "{}: Expected fields {}, got {} field(s) in '{}'",
            ctx,
            fmt::join(columns, ","),
            row.size(),
            line)};
    }

    return recordFromFields([&](std::string_view column) -> std::string {
        auto it = ranges::find(columns, column);
        const auto idx = static_cast<size_t>(it - columns.begin());
        return idx < row.size() ? row[idx] : std::string{};
    });
}

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
