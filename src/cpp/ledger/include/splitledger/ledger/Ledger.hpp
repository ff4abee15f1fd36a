/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "common.hpp"
#include "splitledger/ledger/ExpenseRecord.hpp"
#include "splitledger/ledger/Instrument.hpp"

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kLedgerVersion = 1;

enum class ImportMode
{
    Append,
    Replace
};

//-------------------------------------------------------------------------

/**
 * Participants, instruments and expense records of one shared budget.
 *
 * Mutations keep the participant and instrument names unique and keep every
 * record's allocations normalized against the current participant set. The
 * accounting functions only ever read a Ledger.
 */
class Ledger : public JsonSerializable
{
public:
    Ledger() noexcept = default;
    Ledger(
        std::vector<Participant> participants,
        std::vector<Instrument> instruments,
        std::vector<ExpenseRecord> records = {},
        bool applyCashbackAsDiscount = true,
        uint32_t version = kLedgerVersion);

    [[nodiscard]] const std::vector<Participant>& participants() const noexcept { return m_participants; }
    [[nodiscard]] const std::vector<Instrument>& instruments() const noexcept { return m_instruments; }
    [[nodiscard]] const std::vector<ExpenseRecord>& records() const noexcept { return m_records; }
    [[nodiscard]] bool applyCashbackAsDiscount() const noexcept { return m_applyCashbackAsDiscount; }
    [[nodiscard]] uint32_t version() const noexcept { return m_version; }

    void setApplyCashbackAsDiscount(bool flag) noexcept;

    [[nodiscard]] bool hasParticipant(std::string_view name) const noexcept;
    [[nodiscard]] std::optional<std::reference_wrapper<const Instrument>> instrument(
        std::string_view name) const noexcept;
    [[nodiscard]] std::optional<std::reference_wrapper<const ExpenseRecord>> findRecord(
        std::string_view id) const noexcept;

    void addParticipant(std::string_view name);
    void removeParticipant(std::string_view name);

    void addInstrument(Instrument instrument);
    void updateInstrument(std::string_view oldName, Instrument instrument);
    void removeInstrument(std::string_view name);

    RecordId addRecord(ExpenseRecord record);
    void replaceRecord(ExpenseRecord record);
    void removeRecord(std::string_view id);
    void importRecords(std::vector<ExpenseRecord> records, ImportMode mode);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static Ledger fromJson(const rapidjson::Value& json);

private:
    void renormalizeRecords();

    std::vector<Participant> m_participants;
    std::vector<Instrument> m_instruments;
    std::vector<ExpenseRecord> m_records;
    bool m_applyCashbackAsDiscount{true};
    uint32_t m_version{kLedgerVersion};
};

//-------------------------------------------------------------------------

[[nodiscard]] RecordId makeRecordId();

[[nodiscard]] Ledger loadLedger(const fs::path& path);

void saveLedger(const Ledger& ledger, const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
