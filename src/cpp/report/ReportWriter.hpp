/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Summary.hpp"
#include "common.hpp"
#include "splitledger/accounting/Settlement.hpp"
#include "splitledger/ledger/Ledger.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace splitledger::report
{

//-------------------------------------------------------------------------

struct ReportOptions
{
    double eps{accounting::kDefaultSettlementEps};
    accounting::SettlementBasis basis{accounting::SettlementBasis::Net};
};

//-------------------------------------------------------------------------

/**
 * Writes the CSV reports of a ledger into one directory:
 *
 *  - summary.csv with paid, consumed, net and cashback per participant,
 *  - transfers.csv with the settlement on the configured basis,
 *  - <payer>_paid.csv per payer, records grouped by date, merchant and card
 *    with the split base and each participant's share and price.
 *
 * Payer names are made file safe; payers whose safe names collide get a
 * numeric suffix (A_B_paid.csv, A_B_2_paid.csv). Existing files are
 * overwritten.
 */
class ReportWriter
{
public:
    explicit ReportWriter(const fs::path& directory, ReportOptions options = {});

    [[nodiscard]] const fs::path& directory() const noexcept { return m_directory; }
    [[nodiscard]] const ReportOptions& options() const noexcept { return m_options; }

    fs::path writeSummary(const accounting::Summary& summary) const;
    fs::path writeTransfers(std::span<const accounting::Transfer> transfers) const;
    std::vector<fs::path> writePayerDetails(
        const ledger::Ledger& ledger, const accounting::DateWindow& window = {}) const;

    std::vector<fs::path> writeAll(
        const ledger::Ledger& ledger, const accounting::DateWindow& window = {}) const;

private:
    [[nodiscard]] std::unique_ptr<spdlog::logger> makeLogger(
        const std::string& name, const fs::path& filepath) const;

    fs::path m_directory;
    ReportOptions m_options;
};

//-------------------------------------------------------------------------

void printSummary(const accounting::Summary& summary);

void printTransfers(std::span<const accounting::Transfer> transfers);

//-------------------------------------------------------------------------

}  // namespace splitledger::report

//-------------------------------------------------------------------------
