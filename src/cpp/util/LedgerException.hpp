/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

namespace splitledger
{

class LedgerException : public std::runtime_error
{
public:
    explicit LedgerException(const std::string& message) : std::runtime_error(message) {}
    LedgerException(const LedgerException& exception) = default;
    LedgerException(LedgerException&& exception) = default;
};

}  // namespace splitledger

//-------------------------------------------------------------------------
