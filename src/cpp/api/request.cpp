/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "request.hpp"

#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/split.hpp>

#include <charconv>
#include <limits>

//-------------------------------------------------------------------------

namespace uniledger::api
{

//-------------------------------------------------------------------------

RequestBody::RequestBody(const rapidjson::Value& json)
    : m_json{json}
{
    if (!m_json.IsObject()) {
        throw RequestError{"Request body must be a Json object"};
    }
}

//-------------------------------------------------------------------------

bool RequestBody::has(const char* key) const
{
    auto it = m_json.FindMember(key);
    return it != m_json.MemberEnd() && !it->value.IsNull();
}

//-------------------------------------------------------------------------

bool RequestBody::isNull(const char* key) const
{
    auto it = m_json.FindMember(key);
    return it != m_json.MemberEnd() && it->value.IsNull();
}

//-------------------------------------------------------------------------

decimal_t RequestBody::decimal(const char* key) const
{
    auto value = optionalDecimal(key);
    if (!value.has_value()) {
        throw RequestError{fmt::format("'{}' is required", key)};
    }
    return value.value();
}

//-------------------------------------------------------------------------

std::optional<decimal_t> RequestBody::optionalDecimal(const char* key) const
{
    if (!has(key)) return std::nullopt;
    auto value = json::tryGetDecimal(m_json[key]);
    if (!value.has_value()) {
        throw RequestError{fmt::format("'{}' must be an exact decimal amount", key)};
    }
    return value;
}

//-------------------------------------------------------------------------

uint32_t RequestBody::id(const char* key) const
{
    auto value = optionalId(key);
    if (!value.has_value()) {
        throw RequestError{fmt::format("'{}' is required", key)};
    }
    return value.value();
}

//-------------------------------------------------------------------------

std::optional<uint32_t> RequestBody::optionalId(const char* key) const
{
    if (!has(key)) return std::nullopt;
    auto value = json::tryGetUint(m_json[key]);
    if (!value.has_value() || value.value() > std::numeric_limits<uint32_t>::max()) {
        throw RequestError{fmt::format("'{}' must be a non-negative integer id", key)};
    }
    return static_cast<uint32_t>(value.value());
}

//-------------------------------------------------------------------------

std::string RequestBody::string(const char* key) const
{
    auto value = optionalString(key);
    if (!value.has_value()) {
        throw RequestError{fmt::format("'{}' is required", key)};
    }
    return std::move(value).value();
}

//-------------------------------------------------------------------------

std::optional<std::string> RequestBody::optionalString(const char* key) const
{
    if (!has(key)) return std::nullopt;
    const auto& value = m_json[key];
    if (!value.IsString()) {
        throw RequestError{fmt::format("'{}' must be a string", key)};
    }
    return std::string{value.GetString(), value.GetStringLength()};
}

//-------------------------------------------------------------------------

bool RequestBody::flag(const char* key, bool fallback) const
{
    if (!has(key)) return fallback;
    const auto& value = m_json[key];
    if (!value.IsBool()) {
        throw RequestError{fmt::format("'{}' must be a boolean", key)};
    }
    return value.GetBool();
}

//-------------------------------------------------------------------------

std::optional<Date> RequestBody::optionalDate(const char* key) const
{
    return optionalString(key).transform([key](const std::string& str) {
        auto date = util::parseDate(str);
        if (!date.has_value()) {
            throw RequestError{fmt::format("'{}' must be a YYYY-MM-DD date, got '{}'", key, str)};
        }
        return date.value();
    });
}

//-------------------------------------------------------------------------

RequestTarget::RequestTarget(std::string_view target)
{
    const auto pos = target.find('?');
    m_path = std::string{target.substr(0, pos)};
    if (m_path.size() > 1 && m_path.ends_with('/')) {
        m_path.pop_back();
    }
    if (pos == std::string_view::npos) return;

    std::vector<std::string> pairs;
    const std::string query{target.substr(pos + 1)};
    boost::algorithm::split(pairs, query, boost::algorithm::is_any_of("&"));
    for (const auto& pair : pairs) {
        if (pair.empty()) continue;
        const auto eq = pair.find('=');
        auto key = urlDecode(std::string_view{pair}.substr(0, eq));
        auto value = eq == std::string::npos
            ? std::string{}
            : urlDecode(std::string_view{pair}.substr(eq + 1));
        m_params.insert_or_assign(std::move(key), std::move(value));
    }
}

//-------------------------------------------------------------------------

std::optional<std::string> RequestTarget::param(const std::string& key) const
{
    auto it = m_params.find(key);
    if (it == m_params.end() || it->second.empty()) return std::nullopt;
    return it->second;
}

//-------------------------------------------------------------------------

std::optional<uint64_t> RequestTarget::uintParam(const std::string& key) const
{
    return param(key).transform([&key](const std::string& str) {
        uint64_t value{};
        const auto [ptr, ec] = std::from_chars(str.data(), str.data() + str.size(), value);
        if (ec != std::errc{} || ptr != str.data() + str.size()) {
            throw RequestError{fmt::format("'{}' must be a non-negative integer", key)};
        }
        return value;
    });
}

//-------------------------------------------------------------------------

std::optional<bool> RequestTarget::boolParam(const std::string& key) const
{
    return param(key).transform([&key](const std::string& str) {
        if (str == "true" || str == "1") return true;
        if (str == "false" || str == "0") return false;
        throw RequestError{fmt::format("'{}' must be true or false", key)};
    });
}

//-------------------------------------------------------------------------

std::optional<Date> RequestTarget::dateParam(const std::string& key) const
{
    return param(key).transform([&key](const std::string& str) {
        auto date = util::parseDate(str);
        if (!date.has_value()) {
            throw RequestError{fmt::format("'{}' must be a YYYY-MM-DD date", key)};
        }
        return date.value();
    });
}

//-------------------------------------------------------------------------

std::string urlDecode(std::string_view str)
{
    std::string decoded;
    decoded.reserve(str.size());
    for (size_t i = 0; i < str.size(); ++i) {
        if (str[i] == '+') {
            decoded.push_back(' ');
        } else if (str[i] == '%' && i + 2 < str.size()) {
            uint8_t byte{};
            const auto [ptr, ec] = std::from_chars(str.data() + i + 1, str.data() + i + 3, byte, 16);
            if (ec == std::errc{} && ptr == str.data() + i + 3) {
                decoded.push_back(static_cast<char>(byte));
                i += 2;
            } else {
                decoded.push_back(str[i]);
            }
        } else {
            decoded.push_back(str[i]);
        }
    }
    return decoded;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::api

//-------------------------------------------------------------------------
