/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"
#include "splitledger/ledger/Ledger.hpp"

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

struct InstrumentUpdate
{
    std::string oldName;
    Instrument instrument;
};

/**
 * A batch of ledger maintenance steps, as requested on the command line.
 *
 * Steps run in a fixed order: participants and instruments are added, then
 * instruments updated, then expenses added, replaced and removed, then
 * instruments and participants removed, and finally the cashback flag set.
 * Removing a participant therefore re-normalizes expenses added in the same
 * batch. The first failing step throws and leaves the earlier steps applied.
 */
struct LedgerEdits
{
    std::vector<Participant> addParticipants;
    std::vector<Instrument> addInstruments;
    std::vector<InstrumentUpdate> updateInstruments;
    std::vector<ExpenseRecord> addRecords;
    std::vector<ExpenseRecord> replaceRecords;
    std::vector<RecordId> removeRecords;
    std::vector<std::string> removeInstruments;
    std::vector<Participant> removeParticipants;
    std::optional<bool> applyCashbackAsDiscount;

    [[nodiscard]] bool empty() const noexcept;
};

// Returns the ids of the added expenses, in order.
std::vector<RecordId> applyEdits(Ledger& ledger, const LedgerEdits& edits);

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
