/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Summary.hpp"

#include "splitledger/accounting/Allocation.hpp"

//-------------------------------------------------------------------------

namespace splitledger::accounting
{

//-------------------------------------------------------------------------

bool DateWindow::contains(Date date) const noexcept
{
    if (start.has_value() && date < start.value()) return false;
    if (end.has_value() && date > end.value()) return false;
    return true;
}

//-------------------------------------------------------------------------

InstrumentRates::InstrumentRates(std::span<const ledger::Instrument> instruments)
{
    for (const auto& instrument : instruments) {
        m_rates.insert_or_assign(instrument.name, instrument.cashbackRate);
    }
}

//-------------------------------------------------------------------------

double InstrumentRates::rateOf(std::string_view name) const noexcept
{
    auto it = m_rates.find(name);
    return it != m_rates.end() ? it->second : 0.0;
}

//-------------------------------------------------------------------------

double splitBase(const ledger::ExpenseRecord& record, double rate, bool applyDiscount) noexcept
{
    return applyDiscount ? record.amount * (1.0 - rate) : record.amount;
}

//-------------------------------------------------------------------------

double cashbackOf(const ledger::ExpenseRecord& record, double rate) noexcept
{
    return record.amount * rate;
}

//-------------------------------------------------------------------------

std::vector<std::reference_wrapper<const ledger::ExpenseRecord>> filterByDate(
    std::span<const ledger::ExpenseRecord> records, const DateWindow& window)
{
    return records
        | views::filter([&](const auto& record) { return window.contains(record.date); })
        | views::transform([](const auto& record) { return std::cref(record); })
        | ranges::to<std::vector>();
}

//-------------------------------------------------------------------------

Summary::Summary(ContainerType entries) noexcept
    : m_entries{std::move(entries)}
{}

//-------------------------------------------------------------------------

std::optional<std::reference_wrapper<const SummaryEntry>> Summary::find(
    std::string_view participant) const noexcept
{
    auto it = ranges::find(m_entries, participant, [](const auto& entry) -> std::string_view {
        return entry.first;
    });
    if (it == m_entries.end()) return std::nullopt;
    return std::cref(it->second);
}

//-------------------------------------------------------------------------

const SummaryEntry& Summary::at(std::string_view participant) const
{
    if (auto entry = find(participant)) {
        return entry->get();
    }
    throw std::out_of_range{fmt::format(
        "{}: No summary entry for '{}'",
        std::source_location::current().function_name(),
        participant)};
}

//-------------------------------------------------------------------------

NetBalances Summary::netBalances(SettlementBasis basis) const
{
    return m_entries
        | views::transform([basis](const auto& entry) {
            const auto& [participant, summary] = entry;
            return std::make_pair(
                participant,
                basis == SettlementBasis::Net ? summary.net : summary.netAfterCashback);
        })
        | ranges::to<NetBalances>();
}

//-------------------------------------------------------------------------

double Summary::totalPaid() const noexcept
{
    return ranges::accumulate(m_entries | views::values, 0.0, std::plus{}, &SummaryEntry::paid);
}

//-------------------------------------------------------------------------

double Summary::totalConsumed() const noexcept
{
    return ranges::accumulate(m_entries | views::values, 0.0, std::plus{}, &SummaryEntry::consumed);
}

//-------------------------------------------------------------------------

double Summary::totalCashback() const noexcept
{
    return ranges::accumulate(m_entries | views::values, 0.0, std::plus{}, &SummaryEntry::cashback);
}

//-------------------------------------------------------------------------

Summary summarize(const ledger::Ledger& ledger, const DateWindow& window)
{
    const auto& participants = ledger.participants();
    const InstrumentRates rates{ledger.instruments()};

    Summary::ContainerType entries = participants
        | views::transform([](const auto& p) { return std::make_pair(p, SummaryEntry{}); })
        | ranges::to<Summary::ContainerType>();

    auto entryOf = [&](std::string_view participant) -> SummaryEntry* {
        auto it = ranges::find(entries, participant, [](const auto& entry) -> std::string_view {
            return entry.first;
        });
        return it != entries.end() ? &it->second : nullptr;
    };

    for (const ledger::ExpenseRecord& record : filterByDate(ledger.records(), window)) {
        const double rate = rates.rateOf(record.instrument);
        const double base = splitBase(record, rate, ledger.applyCashbackAsDiscount());
        const Distribution alloc = normalize(record.allocations, participants);

        for (size_t i{}; i < entries.size(); ++i) {
            entries[i].second.consumed += base * alloc[i].second;
        }

        if (SummaryEntry* payer = entryOf(record.payer)) {
            payer->paid += record.amount;
            payer->cashback += cashbackOf(record, rate);
        }
    }

    for (auto& [participant, entry] : entries) {
        entry.net = entry.paid - entry.consumed;
        entry.netAfterCashback = entry.net + entry.cashback;
    }

    return Summary{std::move(entries)};
}

//-------------------------------------------------------------------------

Summary summarize(
    const ledger::Ledger& ledger, std::optional<Date> start, std::optional<Date> end)
{
    return summarize(ledger, DateWindow{.start = start, .end = end});
}

//-------------------------------------------------------------------------

}  // namespace splitledger::accounting

//-------------------------------------------------------------------------
