/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "splitledger/accounting/types.hpp"
#include "splitledger/ledger/Ledger.hpp"

//-------------------------------------------------------------------------

namespace splitledger::accounting
{

//-------------------------------------------------------------------------

struct SummaryEntry
{
    double paid{};
    double consumed{};
    double net{};
    double cashback{};
    double netAfterCashback{};

    bool operator==(const SummaryEntry&) const noexcept = default;
};

//-------------------------------------------------------------------------

// Inclusive calendar window; an absent bound is open.
struct DateWindow
{
    std::optional<Date> start;
    std::optional<Date> end;

    [[nodiscard]] bool contains(Date date) const noexcept;
};

//-------------------------------------------------------------------------

class InstrumentRates
{
public:
    InstrumentRates() noexcept = default;
    explicit InstrumentRates(std::span<const ledger::Instrument> instruments);

    // Zero for instruments that do not (or no longer) exist.
    [[nodiscard]] double rateOf(std::string_view name) const noexcept;

private:
    std::map<std::string, double, std::less<>> m_rates;
};

//-------------------------------------------------------------------------

[[nodiscard]] double splitBase(
    const ledger::ExpenseRecord& record, double rate, bool applyDiscount) noexcept;

[[nodiscard]] double cashbackOf(const ledger::ExpenseRecord& record, double rate) noexcept;

[[nodiscard]] std::vector<std::reference_wrapper<const ledger::ExpenseRecord>> filterByDate(
    std::span<const ledger::ExpenseRecord> records, const DateWindow& window);

//-------------------------------------------------------------------------

class Summary
{
public:
    using ContainerType = std::vector<std::pair<Participant, SummaryEntry>>;

    Summary() noexcept = default;
    explicit Summary(ContainerType entries) noexcept;

    [[nodiscard]] decltype(auto) begin(this auto&& self) { return self.m_entries.begin(); }
    [[nodiscard]] decltype(auto) end(this auto&& self) { return self.m_entries.end(); }

    [[nodiscard]] const ContainerType& entries() const noexcept { return m_entries; }
    [[nodiscard]] size_t size() const noexcept { return m_entries.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_entries.empty(); }

    [[nodiscard]] std::optional<std::reference_wrapper<const SummaryEntry>> find(
        std::string_view participant) const noexcept;
    [[nodiscard]] const SummaryEntry& at(std::string_view participant) const;

    [[nodiscard]] NetBalances netBalances(SettlementBasis basis = SettlementBasis::Net) const;

    [[nodiscard]] double totalPaid() const noexcept;
    [[nodiscard]] double totalConsumed() const noexcept;
    [[nodiscard]] double totalCashback() const noexcept;

private:
    ContainerType m_entries;
};

//-------------------------------------------------------------------------

/**
 * Paid, consumed and cashback totals per current participant over the
 * records inside @p window.
 *
 * Each record's split base (the amount, less cashback when the ledger
 * discounts it) is consumed according to its allocations normalized against
 * the current participants. Paid and cashback go to the payer, and are
 * dropped when the payer is no longer a participant.
 */
[[nodiscard]] Summary summarize(const ledger::Ledger& ledger, const DateWindow& window = {});

[[nodiscard]] Summary summarize(
    const ledger::Ledger& ledger, std::optional<Date> start, std::optional<Date> end);

//-------------------------------------------------------------------------

}  // namespace splitledger::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<splitledger::accounting::SummaryEntry>
{
    constexpr auto parse(fmt::format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const splitledger::accounting::SummaryEntry& entry, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "{{.paid = {}, .consumed = {}, .net = {}, .cashback = {}, .netAfterCashback = {}}}",
            entry.paid,
            entry.consumed,
            entry.net,
            entry.cashback,
            entry.netAfterCashback);
    }
};

//-------------------------------------------------------------------------
