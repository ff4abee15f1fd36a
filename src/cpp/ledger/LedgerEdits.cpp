/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerEdits.hpp"

#include <spdlog/spdlog.h>

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

bool LedgerEdits::empty() const noexcept
{
    return addParticipants.empty()
        && addInstruments.empty()
        && updateInstruments.empty()
        && addRecords.empty()
        && replaceRecords.empty()
        && removeRecords.empty()
        && removeInstruments.empty()
        && removeParticipants.empty()
        && !applyCashbackAsDiscount.has_value();
}

//-------------------------------------------------------------------------

std::vector<RecordId> applyEdits(Ledger& ledger, const LedgerEdits& edits)
{
    for (const auto& name : edits.addParticipants) {
        ledger.addParticipant(name);
    }
    for (const auto& instrument : edits.addInstruments) {
        ledger.addInstrument(instrument);
    }
    for (const auto& [oldName, instrument] : edits.updateInstruments) {
        ledger.updateInstrument(oldName, instrument);
    }

    std::vector<RecordId> added;
    added.reserve(edits.addRecords.size());
    for (const auto& record : edits.addRecords) {
        added.push_back(ledger.addRecord(record));
    }
    for (const auto& record : edits.replaceRecords) {
        ledger.replaceRecord(record);
    }
    for (const auto& id : edits.removeRecords) {
        ledger.removeRecord(id);
    }

    for (const auto& name : edits.removeInstruments) {
        ledger.removeInstrument(name);
    }
    for (const auto& name : edits.removeParticipants) {
        ledger.removeParticipant(name);
    }

    if (edits.applyCashbackAsDiscount.has_value()) {
        ledger.setApplyCashbackAsDiscount(*edits.applyCashbackAsDiscount);
        spdlog::info(
            "Cashback is {}",
            ledger.applyCashbackAsDiscount() ? "applied as a discount" : "tracked separately");
    }

    return added;
}

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
