/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ExpenseCsv.hpp"
#include "LedgerEdits.hpp"
#include "ReportWriter.hpp"
#include "Summary.hpp"
#include "common.hpp"
#include "splitledger/accounting/Settlement.hpp"
#include "splitledger/config/AppConfig.hpp"
#include "splitledger/ledger/Ledger.hpp"
#include "util.hpp"

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>

#include <iostream>
#include <tuple>

//-------------------------------------------------------------------------

using namespace splitledger;

//-------------------------------------------------------------------------

namespace
{

const CLI::Validator IsoDate{
    [](const std::string& str) -> std::string {
        try {
            [[maybe_unused]] const auto date = util::parseDate(str);
        }
        catch (const std::invalid_argument&) {
            return fmt::format("'{}' is not a YYYY-MM-DD date", str);
        }
        return {};
    },
    "DATE"};

int run(int argc, char* argv[])
{
    CLI::App app{"SplitLedger v1.0 - shared expense settlement"};

    fs::path configFile;
    app.add_option("-c,--config", configFile, "Application config file (XML)")
        ->check(CLI::ExistingFile);

    fs::path ledgerFile;
    app.add_option("-l,--ledger", ledgerFile, "Ledger file (JSON)")
        ->check(CLI::ExistingFile);

    std::string start, end;
    app.add_option("--start", start, "First day of the report window")->check(IsoDate);
    app.add_option("--end", end, "Last day of the report window")->check(IsoDate);

    fs::path importCsv;
    auto optImport = app.add_option("--import-csv", importCsv, "Expense CSV to import")
        ->check(CLI::ExistingFile);

    ledger::ImportMode importMode{ledger::ImportMode::Append};
    const std::map<std::string, ledger::ImportMode> importModes{
        {"append", ledger::ImportMode::Append}, {"replace", ledger::ImportMode::Replace}};
    app.add_option("--import-mode", importMode, "How imported expenses join the ledger")
        ->transform(CLI::CheckedTransformer(importModes, CLI::ignore_case))
        ->needs(optImport);

    CLI::Option_group* editGroup =
        app.add_option_group("Edit", "Ledger maintenance, applied after any import");

    std::vector<std::string> addParticipants, removeParticipants;
    editGroup->add_option("--add-participant", addParticipants, "Add participants");
    editGroup->add_option(
        "--remove-participant", removeParticipants, "Remove participants, re-splitting their shares");

    std::vector<std::pair<std::string, double>> addInstruments;
    editGroup->add_option("--add-instrument", addInstruments, "Add a card: NAME RATE");
    std::vector<std::tuple<std::string, std::string, double>> updateInstruments;
    editGroup->add_option(
        "--update-instrument", updateInstruments, "Rename or re-rate a card: OLD NEW RATE");
    std::vector<std::string> removeInstruments;
    editGroup->add_option("--remove-instrument", removeInstruments, "Remove cards");

    std::vector<std::string> addExpenses;
    editGroup->add_option(
        "--add-expense",
        addExpenses,
        "Add an expense: 'date,payer,card,merchant,item,amount,allocations[,notes]'");
    std::vector<std::pair<std::string, std::string>> replaceExpenses;
    editGroup->add_option(
        "--replace-expense", replaceExpenses, "Replace an expense: ID LINE, LINE as for --add-expense");
    std::vector<std::string> removeExpenses;
    editGroup->add_option("--remove-expense", removeExpenses, "Remove expenses by id");

    int discountFlag{};
    editGroup->add_flag(
        "--discount,!--no-discount", discountFlag, "Whether cashback reduces the split base");

    fs::path exportCsv;
    app.add_option("--export-csv", exportCsv, "Write the ledger's expenses to a CSV file");

    fs::path reportDir;
    app.add_option("--report-dir", reportDir, "Directory for summary, transfer and payer reports");

    fs::path saveFile;
    app.add_option("--save", saveFile, "Write the (possibly updated) ledger to a JSON file");

    std::optional<double> eps;
    app.add_option("--eps", eps, "Settlement tolerance")->check(CLI::NonNegativeNumber);

    std::optional<accounting::SettlementBasis> basis;
    const std::map<std::string, accounting::SettlementBasis> bases{
        {"net", accounting::SettlementBasis::Net},
        {"net_after_cashback", accounting::SettlementBasis::NetAfterCashback}};
    app.add_option("--basis", basis, "Balance the transfers settle")
        ->transform(CLI::CheckedTransformer(bases, CLI::ignore_case));

    CLI11_PARSE(app, argc, argv);

    auto config = configFile.empty() ? config::AppConfig{} : config::AppConfig::fromFile(configFile);
    spdlog::set_level(config.logLevel());
    if (eps) config.settlement().eps = *eps;
    if (basis) config.settlement().basis = *basis;

    auto ledger = ledgerFile.empty() ? config.makeDefaultLedger() : ledger::loadLedger(ledgerFile);

    if (!importCsv.empty()) {
        ledger.importRecords(ledger::importExpenses(importCsv), importMode);
    }

    ledger::LedgerEdits edits{
        .addParticipants = std::move(addParticipants),
        .updateInstruments = updateInstruments
            | views::transform([](const auto& update) {
                const auto& [oldName, newName, rate] = update;
                return ledger::InstrumentUpdate{
                    .oldName = oldName, .instrument = {.name = newName, .cashbackRate = rate}};
            })
            | ranges::to<std::vector>(),
        .removeRecords = std::move(removeExpenses),
        .removeInstruments = std::move(removeInstruments),
        .removeParticipants = std::move(removeParticipants)
    };
    for (const auto& [name, rate] : addInstruments) {
        edits.addInstruments.push_back({.name = name, .cashbackRate = rate});
    }
    for (const auto& line : addExpenses) {
        edits.addRecords.push_back(ledger::parseExpenseLine(line));
    }
    for (const auto& [id, line] : replaceExpenses) {
        auto record = ledger::parseExpenseLine(line);
        record.id = id;
        edits.replaceRecords.push_back(std::move(record));
    }
    if (discountFlag != 0) {
        edits.applyCashbackAsDiscount = discountFlag > 0;
    }
    if (!edits.empty()) {
        for (const auto& id : ledger::applyEdits(ledger, edits)) {
            spdlog::info("Added expense {}", id);
        }
    }

    const accounting::DateWindow window{
        .start = start.empty() ? std::nullopt : std::make_optional(util::parseDate(start)),
        .end = end.empty() ? std::nullopt : std::make_optional(util::parseDate(end))
    };

    const auto summary = accounting::summarize(ledger, window);
    const auto transfers = accounting::settle(
        summary.netBalances(config.settlement().basis), config.settlement().eps);

    std::cout << fmt::format(
        "{}\n - {}\n\n",
        app.get_description(),
        ledger.applyCashbackAsDiscount()
            ? "Split base = amount*(1-cashback)"
            : "Split base = amount (cashback tracked separately)");
    report::printSummary(summary);
    std::cout << fmt::format("\nTransfers ({}):\n", config.settlement().basis);
    report::printTransfers(transfers);
    std::cout << std::flush;

    if (!exportCsv.empty()) {
        ledger::exportExpenses(ledger.records(), exportCsv);
    }
    if (!reportDir.empty()) {
        report::ReportWriter writer{
            reportDir,
            {.eps = config.settlement().eps, .basis = config.settlement().basis}};
        [[maybe_unused]] const auto files = writer.writeAll(ledger, window);
    }
    if (!saveFile.empty()) {
        ledger::saveLedger(ledger, saveFile);
    }

    return 0;
}

}  // namespace

//-------------------------------------------------------------------------

int main(int argc, char* argv[])
{
    try {
        return run(argc, argv);
    }
    catch (const std::exception& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
}

//-------------------------------------------------------------------------
