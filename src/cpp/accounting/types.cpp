/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "splitledger/accounting/types.hpp"

//-------------------------------------------------------------------------

namespace splitledger::accounting
{

SettlementBasis parseSettlementBasis(std::string_view name)
{
    std::string key{name};
    std::erase_if(key, [](char c) { return c == '_' || c == '-'; });
    auto basis = magic_enum::enum_cast<SettlementBasis>(key, magic_enum::case_insensitive);
    if (!basis.has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unknown settlement basis '{}', expected one of {}",
            std::source_location::current().function_name(),
            name,
            fmt::join(magic_enum::enum_names<SettlementBasis>(), ", "))};
    }
    return basis.value();
}

}  // namespace splitledger::accounting

//-------------------------------------------------------------------------
