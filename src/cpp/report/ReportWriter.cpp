/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ReportWriter.hpp"

#include "splitledger/accounting/Allocation.hpp"
#include "util.hpp"

#include <boost/algorithm/string.hpp>
#include <spdlog/sinks/basic_file_sink.h>

#include <algorithm>
#include <iostream>
#include <set>
#include <tuple>

//-------------------------------------------------------------------------

namespace splitledger::report
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::string money(double value)
{
    return fmt::format("{:.2f}", value);
}

[[nodiscard]] std::string share(double value)
{
    return fmt::format("{:.4f}", value);
}

[[nodiscard]] std::string fileSafe(std::string_view name)
{
    auto res = std::string{name};
    boost::replace_all(res, "/", "_");
    boost::replace_all(res, "\\", "_");
    return res;
}

}  // namespace

//-------------------------------------------------------------------------

ReportWriter::ReportWriter(const fs::path& directory, ReportOptions options)
    : m_directory{directory}, m_options{options}
{
    fs::create_directories(m_directory);
}

//-------------------------------------------------------------------------

fs::path ReportWriter::writeSummary(const accounting::Summary& summary) const
{
    const auto filepath = m_directory / "summary.csv";
    auto logger = makeLogger("SummaryReport", filepath);

    logger->trace("Person,Paid,Consumed,Net (Paid-Consumed),Cashback Earned,Net+Cashback");
    for (const auto& [participant, entry] : summary) {
        logger->trace(fmt::format(
            "{},{},{},{},{},{}",
            util::csvEscape(participant),
            money(entry.paid),
            money(entry.consumed),
            money(entry.net),
            money(entry.cashback),
            money(entry.netAfterCashback)));
    }
    logger->flush();

    return filepath;
}

//-------------------------------------------------------------------------

fs::path ReportWriter::writeTransfers(std::span<const accounting::Transfer> transfers) const
{
    const auto filepath = m_directory / "transfers.csv";
    auto logger = makeLogger("TransfersReport", filepath);

    logger->trace("From (Debtor),To (Creditor),Amount");
    for (const auto& transfer : transfers) {
        logger->trace(fmt::format(
            "{},{},{}",
            util::csvEscape(transfer.debtor),
            util::csvEscape(transfer.creditor),
            money(transfer.amount)));
    }
    logger->flush();

    return filepath;
}

//-------------------------------------------------------------------------

std::vector<fs::path> ReportWriter::writePayerDetails(
    const ledger::Ledger& ledger, const accounting::DateWindow& window) const
{
    const auto& people = ledger.participants();
    const accounting::InstrumentRates rates{ledger.instruments()};
    const auto records = accounting::filterByDate(ledger.records(), window);

    std::set<Participant> payerSet;
    for (const ledger::ExpenseRecord& record : records) {
        if (ledger.hasParticipant(record.payer)) {
            payerSet.insert(record.payer);
        }
    }
    if (payerSet.empty()) {
        payerSet.insert(people.begin(), people.end());
    }

    std::vector<std::string> header{"item", "price"};
    header.insert(header.end(), people.begin(), people.end());
    for (const auto& p : people) {
        header.push_back(fmt::format("{} price", p));
    }
    const std::vector<std::string> blankRow(header.size());

    // Distinct payers may sanitize to the same stem; later ones get a suffix.
    std::set<std::string> usedStems;
    auto uniqueStem = [&](const Participant& payer) {
        const auto base = fileSafe(payer);
        auto stem = base;
        for (int n = 2; !usedStems.insert(stem).second; ++n) {
            stem = fmt::format("{}_{}", base, n);
        }
        return stem;
    };

    std::vector<fs::path> written;
    for (const auto& payer : payerSet) {
        const auto filepath = m_directory / fmt::format("{}_paid.csv", uniqueStem(payer));
        auto logger = makeLogger(fmt::format("PayerReport.{}", payer), filepath);
        logger->trace(util::csvJoin(header));

        auto payerRecords = records
            | views::filter([&](const ledger::ExpenseRecord& r) { return r.payer == payer; })
            | ranges::to<std::vector>();
        auto groupKey = [](const ledger::ExpenseRecord& r) {
            return std::tie(r.date, r.merchant, r.instrument);
        };
        std::ranges::stable_sort(
            payerRecords,
            [&](const ledger::ExpenseRecord& lhs, const ledger::ExpenseRecord& rhs) {
                return std::tie(lhs.date, lhs.merchant, lhs.instrument, lhs.item)
                    < std::tie(rhs.date, rhs.merchant, rhs.instrument, rhs.item);
            });

        double priceTotal{};
        std::vector<double> personTotals(people.size());

        for (auto groupBegin = payerRecords.begin(); groupBegin != payerRecords.end();) {
            const ledger::ExpenseRecord& first = *groupBegin;
            auto groupEnd = std::find_if(groupBegin, payerRecords.end(), [&](const auto& r) {
                return groupKey(r) != groupKey(first);
            });

            const double rate = rates.rateOf(first.instrument);
            const double multiplier = ledger.applyCashbackAsDiscount() ? 1.0 - rate : 1.0;
            const auto day = util::formatDate(first.date, "%m.%d");
            std::vector<std::string> titleRow(header.size());
            titleRow.front() = rate > 0.0
                ? fmt::format("{} {}*{:.2f}", day, first.merchant, multiplier)
                : fmt::format("{} {}", day, first.merchant);
            logger->trace(util::csvJoin(titleRow));

            for (const ledger::ExpenseRecord& record : ranges::subrange(groupBegin, groupEnd)) {
                const double base = accounting::splitBase(
                    record, rates.rateOf(record.instrument), ledger.applyCashbackAsDiscount());
                const auto alloc = accounting::normalize(record.allocations, people);

                std::vector<std::string> row{record.item, money(base)};
                for (const auto& [p, weight] : alloc) {
                    row.push_back(share(weight));
                }
                for (size_t i{}; i < alloc.size(); ++i) {
                    const double price = base * alloc[i].second;
                    row.push_back(money(price));
                    personTotals[i] += price;
                }
                priceTotal += base;
                logger->trace(util::csvJoin(row));
            }

            logger->trace(util::csvJoin(blankRow));
            groupBegin = groupEnd;
        }

        if (!payerRecords.empty()) {
            std::vector<std::string> totalsRow(header.size());
            totalsRow[0] = "TOTALS";
            totalsRow[1] = money(priceTotal);
            for (size_t i{}; i < people.size(); ++i) {
                totalsRow[2 + people.size() + i] = money(personTotals[i]);
            }
            logger->trace(util::csvJoin(totalsRow));
        }
        logger->flush();

        written.push_back(filepath);
    }

    return written;
}

//-------------------------------------------------------------------------

std::vector<fs::path> ReportWriter::writeAll(
    const ledger::Ledger& ledger, const accounting::DateWindow& window) const
{
    const auto summary = accounting::summarize(ledger, window);
    const auto transfers =
        accounting::settle(summary.netBalances(m_options.basis), m_options.eps);

    std::vector<fs::path> written{writeSummary(summary), writeTransfers(transfers)};
    const auto details = writePayerDetails(ledger, window);
    written.insert(written.end(), details.begin(), details.end());

    spdlog::info(
        "Wrote {} report file(s) to '{}' ({} basis)",
        written.size(),
        m_directory.c_str(),
        m_options.basis);

    return written;
}

//-------------------------------------------------------------------------

std::unique_ptr<spdlog::logger> ReportWriter::makeLogger(
    const std::string& name, const fs::path& filepath) const
{
    auto logger = std::make_unique<spdlog::logger>(
        name, std::make_shared<spdlog::sinks::basic_file_sink_st>(filepath.string(), true));
    logger->set_level(spdlog::level::trace);
    logger->set_pattern("%v");
    return logger;
}

//-------------------------------------------------------------------------

void printSummary(const accounting::Summary& summary)
{
    std::cout << fmt::format(
        "{:<16} {:>12} {:>12} {:>12} {:>12} {:>14}\n",
        "Person", "Paid", "Consumed", "Net", "Cashback", "Net+Cashback");
    for (const auto& [participant, entry] : summary) {
        std::cout << fmt::format(
            "{:<16} {:>12.2f} {:>12.2f} {:>12.2f} {:>12.2f} {:>14.2f}\n",
            participant,
            entry.paid,
            entry.consumed,
            entry.net,
            entry.cashback,
            entry.netAfterCashback);
    }
}

//-------------------------------------------------------------------------

void printTransfers(std::span<const accounting::Transfer> transfers)
{
    if (transfers.empty()) {
        std::cout << "All settled.\n";
        return;
    }
    for (const auto& transfer : transfers) {
        std::cout << fmt::format("{}\n", transfer);
    }
}

//-------------------------------------------------------------------------

}  // namespace splitledger::report

//-------------------------------------------------------------------------
