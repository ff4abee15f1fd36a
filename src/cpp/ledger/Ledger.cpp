/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "splitledger/ledger/Ledger.hpp"

#include "LedgerException.hpp"
#include "splitledger/accounting/Allocation.hpp"
#include "util.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <spdlog/spdlog.h>

#include <set>

//-------------------------------------------------------------------------

namespace splitledger::ledger
{

//-------------------------------------------------------------------------

Ledger::Ledger(
    std::vector<Participant> participants,
    std::vector<Instrument> instruments,
    std::vector<ExpenseRecord> records,
    bool applyCashbackAsDiscount,
    uint32_t version)
    : m_participants{std::move(participants)},
      m_instruments{std::move(instruments)},
      m_records{std::move(records)},
      m_applyCashbackAsDiscount{applyCashbackAsDiscount},
      m_version{version}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::set<std::string_view> seen;
    for (const auto& participant : m_participants) {
        if (participant.empty()) {
            throw LedgerException{fmt::format("{}: Empty participant name", ctx)};
        }
        if (!seen.insert(participant).second) {
            throw LedgerException{fmt::format("{}: Duplicate participant '{}'", ctx, participant)};
        }
    }

    seen.clear();
    for (const auto& instrument : m_instruments) {
        instrument.validate();
        if (!seen.insert(instrument.name).second) {
            throw LedgerException{fmt::format("{}: Duplicate instrument '{}'", ctx, instrument.name)};
        }
    }

    seen.clear();
    for (const auto& record : m_records) {
        if (!seen.insert(record.id).second) {
            throw LedgerException{fmt::format("{}: Duplicate expense id '{}'", ctx, record.id)};
        }
    }
}

//-------------------------------------------------------------------------

void Ledger::setApplyCashbackAsDiscount(bool flag) noexcept
{
    m_applyCashbackAsDiscount = flag;
}

//-------------------------------------------------------------------------

bool Ledger::hasParticipant(std::string_view name) const noexcept
{
    return ranges::find(m_participants, name) != m_participants.end();
}

//-------------------------------------------------------------------------

std::optional<std::reference_wrapper<const Instrument>> Ledger::instrument(
    std::string_view name) const noexcept
{
    auto it = ranges::find(m_instruments, name, &Instrument::name);
    if (it == m_instruments.end()) return std::nullopt;
    return std::cref(*it);
}

//-------------------------------------------------------------------------

std::optional<std::reference_wrapper<const ExpenseRecord>> Ledger::findRecord(
    std::string_view id) const noexcept
{
    auto it = ranges::find(m_records, id, &ExpenseRecord::id);
    if (it == m_records.end()) return std::nullopt;
    return std::cref(*it);
}

//-------------------------------------------------------------------------

void Ledger::addParticipant(std::string_view name)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto trimmed = util::trim(name);
    if (trimmed.empty()) {
        throw LedgerException{fmt::format("{}: Participant name required", ctx)};
    }
    if (hasParticipant(trimmed)) {
        throw LedgerException{fmt::format("{}: Participant '{}' already exists", ctx, trimmed)};
    }

    m_participants.push_back(std::move(trimmed));
    renormalizeRecords();

    spdlog::info("Added participant '{}' ({} total)", m_participants.back(), m_participants.size());
}

//-------------------------------------------------------------------------

void Ledger::removeParticipant(std::string_view name)
{
    auto it = ranges::find(m_participants, name);
    if (it == m_participants.end()) {
        throw LedgerException{fmt::format(
            "{}: No participant '{}'", std::source_location::current().function_name(), name)};
    }

    const Participant removed = std::move(*it);
    m_participants.erase(it);
    for (auto& record : m_records) {
        record.allocations.erase(removed);
    }
    renormalizeRecords();

    spdlog::info(
        "Removed participant '{}', re-normalized {} expense(s)", removed, m_records.size());
}

//-------------------------------------------------------------------------

void Ledger::addInstrument(Instrument instrument)
{
    instrument.validate();
    if (this->instrument(instrument.name).has_value()) {
        throw LedgerException{fmt::format(
            "{}: Instrument '{}' already exists",
            std::source_location::current().function_name(),
            instrument.name)};
    }
    spdlog::info("Added instrument {}", instrument);
    m_instruments.push_back(std::move(instrument));
}

//-------------------------------------------------------------------------

void Ledger::updateInstrument(std::string_view oldName, Instrument instrument)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto it = ranges::find(m_instruments, oldName, &Instrument::name);
    if (it == m_instruments.end()) {
        throw LedgerException{fmt::format("{}: No instrument '{}'", ctx, oldName)};
    }
    instrument.validate();

    const bool renamed = instrument.name != oldName;
    if (renamed && this->instrument(instrument.name).has_value()) {
        throw LedgerException{fmt::format(
            "{}: Instrument '{}' already exists", ctx, instrument.name)};
    }

    const std::string previousName = it->name;
    *it = std::move(instrument);

    if (!renamed) {
        spdlog::info("Updated instrument {}", *it);
        return;
    }

    size_t relinked{};
    for (auto& record : m_records) {
        if (record.instrument == previousName) {
            record.instrument = it->name;
            ++relinked;
        }
    }
    spdlog::info(
        "Renamed instrument '{}' to {}, relinked {} expense(s)", previousName, *it, relinked);
}

//-------------------------------------------------------------------------

void Ledger::removeInstrument(std::string_view name)
{
    auto it = ranges::find(m_instruments, name, &Instrument::name);
    if (it == m_instruments.end()) {
        throw LedgerException{fmt::format(
            "{}: No instrument '{}'", std::source_location::current().function_name(), name)};
    }
    // Records keep referring to the name; the rate lookup falls back to zero.
    spdlog::info("Removed instrument {}", *it);
    m_instruments.erase(it);
}

//-------------------------------------------------------------------------

RecordId Ledger::addRecord(ExpenseRecord record)
{
    if (record.id.empty()) {
        record.id = makeRecordId();
    } else if (findRecord(record.id).has_value()) {
        throw LedgerException{fmt::format(
            "{}: Expense id '{}' already exists",
            std::source_location::current().function_name(),
            record.id)};
    }
    record.validate();
    record.allocations =
        accounting::toShares(accounting::normalize(record.allocations, m_participants));

    spdlog::debug(
        "Added expense {} ({} paid {} at '{}')",
        record.id,
        record.payer,
        record.amount,
        record.merchant);
    m_records.push_back(std::move(record));
    return m_records.back().id;
}

//-------------------------------------------------------------------------

void Ledger::replaceRecord(ExpenseRecord record)
{
    auto it = ranges::find(m_records, record.id, &ExpenseRecord::id);
    if (it == m_records.end()) {
        throw LedgerException{fmt::format(
            "{}: No expense with id '{}'",
            std::source_location::current().function_name(),
            record.id)};
    }
    record.validate();
    record.allocations =
        accounting::toShares(accounting::normalize(record.allocations, m_participants));

    spdlog::debug("Replaced expense {}", record.id);
    *it = std::move(record);
}

//-------------------------------------------------------------------------

void Ledger::removeRecord(std::string_view id)
{
    auto it = ranges::find(m_records, id, &ExpenseRecord::id);
    if (it == m_records.end()) {
        throw LedgerException{fmt::format(
            "{}: No expense with id '{}'", std::source_location::current().function_name(), id)};
    }
    spdlog::debug("Removed expense {}", it->id);
    m_records.erase(it);
}

//-------------------------------------------------------------------------

void Ledger::importRecords(std::vector<ExpenseRecord> records, ImportMode mode)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    std::set<RecordId> ids;
    if (mode == ImportMode::Append) {
        for (const auto& record : m_records) {
            ids.insert(record.id);
        }
    }
    for (auto& record : records) {
        if (record.id.empty()) {
            record.id = makeRecordId();
        }
        if (!ids.insert(record.id).second) {
            throw LedgerException{fmt::format("{}: Duplicate expense id '{}'", ctx, record.id)};
        }
    }

    const size_t imported = records.size();
    if (mode == ImportMode::Replace) {
        m_records = std::move(records);
    } else {
        m_records.insert(
            m_records.end(),
            std::make_move_iterator(records.begin()),
            std::make_move_iterator(records.end()));
    }
    renormalizeRecords();

    spdlog::info(
        "Imported {} expense(s) in {} mode, ledger now holds {}",
        imported,
        magic_enum::enum_name(mode),
        m_records.size());
}

//-------------------------------------------------------------------------

void Ledger::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("version", rapidjson::Value{m_version}, allocator);
        rapidjson::Value peopleJson{rapidjson::kArrayType};
        for (const auto& participant : m_participants) {
            peopleJson.PushBack(rapidjson::Value{participant.c_str(), allocator}, allocator);
        }
        json.AddMember("people", peopleJson, allocator);
        json.AddMember(
            "apply_cashback_as_discount", rapidjson::Value{m_applyCashbackAsDiscount}, allocator);
        rapidjson::Value cardsJson{rapidjson::kArrayType};
        for (const auto& instrument : m_instruments) {
            rapidjson::Document instrumentJson{&allocator};
            instrument.jsonSerialize(instrumentJson);
            cardsJson.PushBack(instrumentJson, allocator);
        }
        json.AddMember("cards", cardsJson, allocator);
        rapidjson::Value expensesJson{rapidjson::kArrayType};
        for (const auto& record : m_records) {
            rapidjson::Document recordJson{&allocator};
            record.jsonSerialize(recordJson);
            expensesJson.PushBack(recordJson, allocator);
        }
        json.AddMember("expenses", expensesJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Ledger Ledger::fromJson(const rapidjson::Value& json)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!json.IsObject()) {
        throw std::invalid_argument{fmt::format("{}: Ledger document must be a Json object", ctx)};
    }

    const uint32_t version = json::getUint(json, "version", kLedgerVersion);
    if (version > kLedgerVersion) {
        spdlog::warn(
            "Ledger document version {} is newer than supported version {}",
            version,
            kLedgerVersion);
    }

    std::vector<Participant> participants;
    if (const rapidjson::Value* peopleJson = json::getArray(json, "people")) {
        for (const rapidjson::Value& personJson : peopleJson->GetArray()) {
            if (!personJson.IsString()) {
                throw std::invalid_argument{fmt::format(
                    "{}: Participant names must be strings, got {}", ctx, json::json2str(personJson))};
            }
            participants.emplace_back(personJson.GetString(), personJson.GetStringLength());
        }
    }

    std::vector<Instrument> instruments;
    if (const rapidjson::Value* cardsJson = json::getArray(json, "cards")) {
        for (const rapidjson::Value& cardJson : cardsJson->GetArray()) {
            instruments.push_back(Instrument::fromJson(cardJson));
        }
    }

    std::vector<ExpenseRecord> records;
    if (const rapidjson::Value* expensesJson = json::getArray(json, "expenses")) {
        records.reserve(expensesJson->Size());
        for (const rapidjson::Value& expenseJson : expensesJson->GetArray()) {
            records.push_back(ExpenseRecord::fromJson(expenseJson));
        }
    }

    return Ledger{
        std::move(participants),
        std::move(instruments),
        std::move(records),
        json::getBool(json, "apply_cashback_as_discount", true),
        version};
}

//-------------------------------------------------------------------------

void Ledger::renormalizeRecords()
{
    for (auto& record : m_records) {
        record.allocations =
            accounting::toShares(accounting::normalize(record.allocations, m_participants));
    }
}

//-------------------------------------------------------------------------

RecordId makeRecordId()
{
    return boost::uuids::to_string(boost::uuids::random_generator{}());
}

//-------------------------------------------------------------------------

Ledger loadLedger(const fs::path& path)
{
    auto ledger = Ledger::fromJson(json::loadJson(path));
    spdlog::info(
        "Loaded ledger '{}': {} participant(s), {} instrument(s), {} expense(s)",
        path.c_str(),
        ledger.participants().size(),
        ledger.instruments().size(),
        ledger.records().size());
    return ledger;
}

//-------------------------------------------------------------------------

void saveLedger(const Ledger& ledger, const fs::path& path)
{
    std::ofstream ofs{path};
    if (!ofs) {
        throw std::runtime_error{fmt::format(
            "{}: Unable to open '{}' for writing",
            std::source_location::current().function_name(),
            path.c_str())};
    }
    rapidjson::Document json;
    ledger.jsonSerialize(json);
    json::dumpJson(json, ofs, {.indent = json::IndentOptions{.indentCharCount = 2}});
    spdlog::info("Saved ledger to '{}'", path.c_str());
}

//-------------------------------------------------------------------------

}  // namespace splitledger::ledger

//-------------------------------------------------------------------------
