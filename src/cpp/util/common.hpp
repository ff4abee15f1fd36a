/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <date/date.h>
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <magic_enum.hpp>
#include <range/v3/all.hpp>

#include <cmath>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <source_location>
#include <span>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

//-------------------------------------------------------------------------

namespace fs = std::filesystem;

namespace views = ranges::views;

//-------------------------------------------------------------------------

namespace splitledger
{

using Participant = std::string;
using RecordId = std::string;
using Date = date::year_month_day;

}  // namespace splitledger

//-------------------------------------------------------------------------
