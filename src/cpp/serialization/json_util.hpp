/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <rapidjson/document.h>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

namespace splitledger::json
{

//-------------------------------------------------------------------------

inline constexpr uint32_t kMaxDecimalPlaces = 8;

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
    uint32_t decimals = kMaxDecimalPlaces;
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document str2json(const std::string& str);

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document loadJson(const std::filesystem::path& path);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

// Typed member accessors. A missing member yields the fallback when one is
// given; a missing member without fallback or a member of the wrong type
// throws std::invalid_argument naming the key.
[[nodiscard]] std::string getString(
    const rapidjson::Value& json,
    const char* key,
    std::optional<std::string_view> fallback = {});

[[nodiscard]] double getDouble(
    const rapidjson::Value& json, const char* key, std::optional<double> fallback = {});

[[nodiscard]] bool getBool(
    const rapidjson::Value& json, const char* key, std::optional<bool> fallback = {});

[[nodiscard]] uint32_t getUint(
    const rapidjson::Value& json, const char* key, std::optional<uint32_t> fallback = {});

[[nodiscard]] const rapidjson::Value* getArray(const rapidjson::Value& json, const char* key);

[[nodiscard]] const rapidjson::Value* getObject(const rapidjson::Value& json, const char* key);

//-------------------------------------------------------------------------

}  // namespace splitledger::json

//-------------------------------------------------------------------------
