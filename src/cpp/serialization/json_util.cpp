/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <fmt/format.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <algorithm>
#include <concepts>
#include <source_location>
#include <stdexcept>

//-------------------------------------------------------------------------

namespace splitledger::json
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] const rapidjson::Value* findMember(const rapidjson::Value& json, const char* key)
{
    if (!json.IsObject()) {
        throw std::invalid_argument{fmt::format(
            "{}: Expected a Json object when looking up '{}'",
            std::source_location::current().function_name(),
            key)};
    }
    auto it = json.FindMember(key);
    return it != json.MemberEnd() ? &it->value : nullptr;
}

template<typename T>
[[nodiscard]] T getTyped(
    const rapidjson::Value& json,
    const char* key,
    std::optional<T> fallback,
    std::string_view typeName,
    std::source_location sl = std::source_location::current())
{
    const rapidjson::Value* member = findMember(json, key);
    if (member == nullptr || member->IsNull()) {
        if (fallback.has_value()) {
            return fallback.value();
        }
        throw std::invalid_argument{fmt::format(
            "{}: Missing required member '{}'", sl.function_name(), key)};
    }
    const bool matches = [&] {
        if constexpr (std::same_as<T, double>) {
            return member->IsNumber();
        } else {
            return member->template Is<T>();
        }
    }();
    if (!matches) {
        throw std::invalid_argument{fmt::format(
            "{}: Member '{}' should be {}, was {}",
            sl.function_name(),
            key,
            typeName,
            json2str(*member))};
    }
    return member->template Get<T>();
}

}  // namespace

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    const auto& [indent, decimals] = formatOptions;
    rapidjson::StringBuffer buffer;
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    if (json.Parse(str.c_str()).HasParseError()) {
        static constexpr size_t maxCharsShown = 200uz;
        std::string_view facade{str.data(), std::min(maxCharsShown, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing Json string: {}{}",
            std::source_location::current().function_name(),
            facade,
            facade.size() < str.size() ? "..." : "")};
    }
    return json;
}

//-------------------------------------------------------------------------

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions)
{
    const auto& [indent, decimals] = formatOptions;
    rapidjson::OStreamWrapper osw{ofs};
    if (indent.has_value()) {
        const auto& opts = indent.value();
        rapidjson::PrettyWriter writer{osw};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        writer.SetMaxDecimalPlaces(decimals);
        json.Accept(writer);
        return;
    }
    rapidjson::Writer writer{osw};
    writer.SetMaxDecimalPlaces(decimals);
    json.Accept(writer);
}

//-------------------------------------------------------------------------

rapidjson::Document loadJson(const std::filesystem::path& path)
{
    static constexpr auto ctx = std::source_location::current().function_name();
    if (!std::filesystem::exists(path)) {
        throw std::invalid_argument{fmt::format("{}: No such file '{}'", ctx, path.c_str())};
    }
    std::ifstream ifs{path};
    rapidjson::IStreamWrapper isw{ifs};
    rapidjson::Document json;
    if (json.ParseStream(isw).HasParseError()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to parse Json data from '{}' at offset {}",
            ctx,
            path.c_str(),
            json.GetErrorOffset())};
    }
    return json;
}

//-------------------------------------------------------------------------

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer)
{
    if (key.empty()) return serializer(json);
    auto& allocator = json.GetAllocator();
    rapidjson::Document subJson{&allocator};
    serializer(subJson);
    json.AddMember(rapidjson::Value{key.c_str(), allocator}, subJson, allocator);
}

//-------------------------------------------------------------------------

std::string getString(
    const rapidjson::Value& json, const char* key, std::optional<std::string_view> fallback)
{
    const rapidjson::Value* member = findMember(json, key);
    if (member == nullptr || member->IsNull()) {
        if (fallback.has_value()) {
            return std::string{fallback.value()};
        }
        throw std::invalid_argument{fmt::format(
            "{}: Missing required member '{}'",
            std::source_location::current().function_name(),
            key)};
    }
    if (!member->IsString()) {
        throw std::invalid_argument{fmt::format(
            "{}: Member '{}' should be a string, was {}",
            std::source_location::current().function_name(),
            key,
            json2str(*member))};
    }
    return {member->GetString(), member->GetStringLength()};
}

//-------------------------------------------------------------------------

double getDouble(const rapidjson::Value& json, const char* key, std::optional<double> fallback)
{
    // Integral Json numbers are accepted as doubles too.
    return getTyped<double>(json, key, fallback, "a number");
}

//-------------------------------------------------------------------------

bool getBool(const rapidjson::Value& json, const char* key, std::optional<bool> fallback)
{
    return getTyped<bool>(json, key, fallback, "a boolean");
}

//-------------------------------------------------------------------------

uint32_t getUint(const rapidjson::Value& json, const char* key, std::optional<uint32_t> fallback)
{
    return getTyped<uint32_t>(json, key, fallback, "an unsigned integer");
}

//-------------------------------------------------------------------------

const rapidjson::Value* getArray(const rapidjson::Value& json, const char* key)
{
    const rapidjson::Value* member = findMember(json, key);
    if (member == nullptr || member->IsNull()) return nullptr;
    if (!member->IsArray()) {
        throw std::invalid_argument{fmt::format(
            "{}: Member '{}' should be an array",
            std::source_location::current().function_name(),
            key)};
    }
    return member;
}

//-------------------------------------------------------------------------

const rapidjson::Value* getObject(const rapidjson::Value& json, const char* key)
{
    const rapidjson::Value* member = findMember(json, key);
    if (member == nullptr || member->IsNull()) return nullptr;
    if (!member->IsObject()) {
        throw std::invalid_argument{fmt::format(
            "{}: Member '{}' should be an object",
            std::source_location::current().function_name(),
            key)};
    }
    return member;
}

//-------------------------------------------------------------------------

}  // namespace splitledger::json

//-------------------------------------------------------------------------
