/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include <bdldfp_decimal.h>
#include <bdldfp_decimalutil.h>
#include <fmt/format.h>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

//-------------------------------------------------------------------------

#define DEC(lit) BDLDFP_DECIMAL_DD(lit)

//-------------------------------------------------------------------------

namespace uniledger
{

using decimal_t = BloombergLP::bdldfp::Decimal64;

}  // namespace uniledger

//-------------------------------------------------------------------------

namespace uniledger::util
{

// Monetary amounts carry two fractional digits.
inline constexpr uint32_t kMoneyDecimals = 2;

[[nodiscard]] inline decimal_t round(decimal_t val, uint32_t decimalPlaces = kMoneyDecimals)
{
    return BloombergLP::bdldfp::DecimalUtil::trunc(val, decimalPlaces);
}

[[nodiscard]] inline bool hasAtMostDecimals(
    decimal_t val, uint32_t decimalPlaces = kMoneyDecimals)
{
    return round(val, decimalPlaces) == val;
}

[[nodiscard]] inline bool isFinite(decimal_t val) noexcept
{
    return BloombergLP::bdldfp::DecimalUtil::isFinite(val);
}

[[nodiscard]] inline decimal_t abs(decimal_t val) noexcept
{
    return val < decimal_t{} ? -val : val;
}

// Exact parse of a decimal literal such as "80000", "-12.5" or "1e3".
// Returns nullopt for malformed text and for non-finite values.
[[nodiscard]] std::optional<decimal_t> parseDecimal(std::string_view str);

// Fixed-point rendering, e.g. 120000 -> "120000.00".
[[nodiscard]] std::string formatDecimal(
    decimal_t val, uint32_t decimalPlaces = kMoneyDecimals);

}  // namespace uniledger::util

//-------------------------------------------------------------------------

namespace uniledger::literals
{

[[nodiscard]] constexpr decimal_t operator"" _dec(unsigned long long int val)
{
    return decimal_t{val};
}

}  // namespace uniledger::literals

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<uniledger::decimal_t>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(uniledger::decimal_t val, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", uniledger::util::formatDecimal(val));
    }
};

//-------------------------------------------------------------------------
