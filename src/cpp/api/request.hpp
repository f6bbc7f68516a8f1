/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "LedgerError.hpp"
#include "json_util.hpp"

//-------------------------------------------------------------------------

namespace uniledger::api
{

//-------------------------------------------------------------------------

// Malformed or missing request field; reported as a validation error.
class RequestError : public std::invalid_argument
{
public:
    using std::invalid_argument::invalid_argument;
};

//-------------------------------------------------------------------------

// Typed access to the members of a Json request body.
class RequestBody
{
public:
    explicit RequestBody(const rapidjson::Value& json);

    [[nodiscard]] bool has(const char* key) const;
    [[nodiscard]] bool isNull(const char* key) const;

    [[nodiscard]] decimal_t decimal(const char* key) const;
    [[nodiscard]] std::optional<decimal_t> optionalDecimal(const char* key) const;
    [[nodiscard]] uint32_t id(const char* key) const;
    [[nodiscard]] std::optional<uint32_t> optionalId(const char* key) const;
    [[nodiscard]] std::string string(const char* key) const;
    [[nodiscard]] std::optional<std::string> optionalString(const char* key) const;
    [[nodiscard]] bool flag(const char* key, bool fallback = false) const;
    [[nodiscard]] std::optional<Date> optionalDate(const char* key) const;

    template<typename E>
    requires std::is_enum_v<E>
    [[nodiscard]] E enumeration(const char* key) const
    {
        auto value = optionalEnumeration<E>(key);
        if (!value.has_value()) {
            throw RequestError{fmt::format("'{}' is required", key)};
        }
        return value.value();
    }

    template<typename E>
    requires std::is_enum_v<E>
    [[nodiscard]] std::optional<E> optionalEnumeration(const char* key) const
    {
        return optionalString(key).transform([key](const std::string& str) {
            auto value = enumFromString<E>(str);
            if (!value.has_value()) {
                throw RequestError{fmt::format("'{}' is not a valid {}", str, key)};
            }
            return value.value();
        });
    }

private:
    const rapidjson::Value& m_json;
};

//-------------------------------------------------------------------------

// Path and decoded query parameters of a request target such as "/expenses?limit=10".
class RequestTarget
{
public:
    explicit RequestTarget(std::string_view target);

    [[nodiscard]] const std::string& path() const noexcept { return m_path; }

    [[nodiscard]] std::optional<std::string> param(const std::string& key) const;
    [[nodiscard]] std::optional<uint64_t> uintParam(const std::string& key) const;
    [[nodiscard]] std::optional<bool> boolParam(const std::string& key) const;
    [[nodiscard]] std::optional<Date> dateParam(const std::string& key) const;

    template<typename E>
    requires std::is_enum_v<E>
    [[nodiscard]] std::optional<E> enumParam(const std::string& key) const
    {
        return param(key).transform([&key](const std::string& str) {
            auto value = enumFromString<E>(str);
            if (!value.has_value()) {
                throw RequestError{fmt::format("'{}' is not a valid {}", str, key)};
            }
            return value.value();
        });
    }

private:
    std::string m_path;
    std::map<std::string, std::string> m_params;
};

//-------------------------------------------------------------------------

[[nodiscard]] std::string urlDecode(std::string_view str);

//-------------------------------------------------------------------------

}  // namespace uniledger::api

//-------------------------------------------------------------------------
