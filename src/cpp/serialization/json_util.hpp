/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "Timestamp.hpp"
#include "uniledger/decimal/decimal.hpp"

#include <rapidjson/document.h>

#include <concepts>
#include <filesystem>
#include <fstream>
#include <functional>
#include <optional>
#include <string>

//-------------------------------------------------------------------------

namespace uniledger::json
{

//-------------------------------------------------------------------------

struct IndentOptions
{
    char indentChar = ' ';
    uint8_t indentCharCount = 4;
};

struct FormatOptions
{
    std::optional<IndentOptions> indent = {};
};

[[nodiscard]] std::string json2str(
    const rapidjson::Value& json, const FormatOptions& formatOptions = {});

// Numbers are kept as their source text so decimals never pass through a double.
[[nodiscard]] rapidjson::Document str2json(const std::string& str);

void dumpJson(
    const rapidjson::Value& json,
    std::ofstream& ofs,
    const FormatOptions& formatOptions = {});

[[nodiscard]] rapidjson::Document loadJson(const std::filesystem::path& path);

// Accepts a decimal string ("80000.50") or a number parsed as raw text.
[[nodiscard]] std::optional<decimal_t> tryGetDecimal(const rapidjson::Value& json);
[[nodiscard]] decimal_t getDecimal(const rapidjson::Value& json);

// Unsigned integer given as a number or as numeric text.
[[nodiscard]] std::optional<uint64_t> tryGetUint(const rapidjson::Value& json);
[[nodiscard]] uint64_t getUint(const rapidjson::Value& json);

[[nodiscard]] std::optional<std::string> getOptionalString(const rapidjson::Value& json);

void setDecimalMember(rapidjson::Document& json, const std::string& key, decimal_t value);
void setStringMember(rapidjson::Document& json, const std::string& key, std::string_view value);
void setDateMember(rapidjson::Document& json, const std::string& key, std::optional<Date> value);
void setTimestampMember(
    rapidjson::Document& json, const std::string& key, std::optional<Timestamp> value);

void serializeHelper(
    rapidjson::Document& json,
    const std::string& key,
    std::function<void(rapidjson::Document&)> serializer);

template<typename T>
void setOptionalMember(rapidjson::Document& json, const std::string& key, std::optional<T> opt)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key.c_str(), allocator},
        [&] {
            if (!opt.has_value()) {
                return std::move(rapidjson::Value{}.SetNull());
            }
            if constexpr (std::same_as<T, decimal_t>) {
                const auto str = util::formatDecimal(opt.value());
                return std::move(rapidjson::Value{str.c_str(), allocator});
            } else if constexpr (std::constructible_from<rapidjson::Value, T>) {
                return std::move(rapidjson::Value{opt.value()});
            } else if constexpr (
                std::constructible_from<rapidjson::Value, const char*, decltype(allocator)>
                && requires (T t) {{ t.c_str() } -> std::convertible_to<const char*>; }) {
                return std::move(rapidjson::Value{opt.value().c_str(), allocator});
            } else {
                static_assert(false, "No conversion from T to rapidjson::Value exists");
            }
        }(),
        allocator);
}

//-------------------------------------------------------------------------

}  // namespace uniledger::json

//-------------------------------------------------------------------------
