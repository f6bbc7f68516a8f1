/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "json_util.hpp"

#include <rapidjson/error/en.h>
#include <rapidjson/istreamwrapper.h>
#include <rapidjson/ostreamwrapper.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

#include <charconv>
#include <source_location>

//-------------------------------------------------------------------------

namespace uniledger::json
{

//-------------------------------------------------------------------------

std::string json2str(const rapidjson::Value& json, const FormatOptions& formatOptions)
{
    rapidjson::StringBuffer buffer;
    if (formatOptions.indent.has_value()) {
        const auto& opts = formatOptions.indent.value();
        rapidjson::PrettyWriter writer{buffer};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
    } else {
        rapidjson::Writer writer{buffer};
        json.Accept(writer);
    }
    return buffer.GetString();
}

//-------------------------------------------------------------------------

rapidjson::Document str2json(const std::string& str)
{
    rapidjson::Document json;
    json.Parse<rapidjson::kParseNumbersAsStringsFlag>(str.c_str());
    if (json.HasParseError()) {
        static constexpr size_t maxCharsShown = 200uz;
        std::string_view facade{str.data(), std::min(maxCharsShown, str.size())};
        throw std::invalid_argument{fmt::format(
            "{}: Error parsing Json string at offset {} ({}): {}{}",
            std::source_location::current().function_name(),
            json.GetErrorOffset(),
            rapidjson::GetParseError_En(json.GetParseError()),
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
    rapidjson::OStreamWrapper osw{ofs};
    if (formatOptions.indent.has_value()) {
        const auto& opts = formatOptions.indent.value();
        rapidjson::PrettyWriter writer{osw};
        writer.SetIndent(opts.indentChar, opts.indentCharCount);
        json.Accept(writer);
        return;
    }
    rapidjson::Writer writer{osw};
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
    if (json.ParseStream<rapidjson::kParseNumbersAsStringsFlag>(isw).HasParseError()) {
        throw std::invalid_argument{fmt::format(
            "{}: Unable to parse Json data from '{}'", ctx, path.c_str())};
    }
    return json;
}

//-------------------------------------------------------------------------

std::optional<decimal_t> tryGetDecimal(const rapidjson::Value& json)
{
    if (json.IsString()) [[likely]] {
        return util::parseDecimal({json.GetString(), json.GetStringLength()});
    } else if (json.IsInt64()) {
        return decimal_t{static_cast<long long>(json.GetInt64())};
    } else if (json.IsUint64()) {
        return decimal_t{static_cast<unsigned long long>(json.GetUint64())};
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

decimal_t getDecimal(const rapidjson::Value& json)
{
    if (auto val = tryGetDecimal(json)) {
        return val.value();
    }
    throw std::invalid_argument{fmt::format(
        "{}: Ill-formed Json value to form a decimal with: {}",
        std::source_location::current().function_name(),
        json2str(json))};
}

//-------------------------------------------------------------------------

std::optional<uint64_t> tryGetUint(const rapidjson::Value& json)
{
    if (json.IsUint64()) {
        return json.GetUint64();
    }
    if (!json.IsString() || json.GetStringLength() == 0) {
        return std::nullopt;
    }
    const std::string_view str{json.GetString(), json.GetStringLength()};
    uint64_t value{};
    const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
    if (ec != std::errc{} || ptr != str.data() + str.size()) {
        return std::nullopt;
    }
    return value;
}

//-------------------------------------------------------------------------

uint64_t getUint(const rapidjson::Value& json)
{
    if (auto val = tryGetUint(json)) {
        return val.value();
    }
    throw std::invalid_argument{fmt::format(
        "{}: Ill-formed Json value to form an unsigned integer with: {}",
        std::source_location::current().function_name(),
        json2str(json))};
}

//-------------------------------------------------------------------------

std::optional<std::string> getOptionalString(const rapidjson::Value& json)
{
    if (json.IsString()) {
        return std::string{json.GetString(), json.GetStringLength()};
    }
    return std::nullopt;
}

//-------------------------------------------------------------------------

void setDecimalMember(rapidjson::Document& json, const std::string& key, decimal_t value)
{
    setOptionalMember(json, key, std::make_optional(value));
}

//-------------------------------------------------------------------------

void setStringMember(rapidjson::Document& json, const std::string& key, std::string_view value)
{
    auto& allocator = json.GetAllocator();
    json.AddMember(
        rapidjson::Value{key.c_str(), allocator},
        rapidjson::Value{value.data(), static_cast<rapidjson::SizeType>(value.size()), allocator},
        allocator);
}

//-------------------------------------------------------------------------

void setDateMember(rapidjson::Document& json, const std::string& key, std::optional<Date> value)
{
    setOptionalMember(json, key, value.transform(util::formatDate));
}

//-------------------------------------------------------------------------

void setTimestampMember(
    rapidjson::Document& json, const std::string& key, std::optional<Timestamp> value)
{
    setOptionalMember(json, key, value.transform(util::formatTimestamp));
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

}  // namespace uniledger::json

//-------------------------------------------------------------------------
