/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "uniledger/decimal/decimal.hpp"

#include <bdldfp_decimalformatconfig.h>

#include <array>

//-------------------------------------------------------------------------

namespace uniledger::util
{

//-------------------------------------------------------------------------

std::optional<decimal_t> parseDecimal(std::string_view str)
{
    if (str.empty()) {
        return std::nullopt;
    }
    const std::string owned{str};
    decimal_t parsed;
    if (BloombergLP::bdldfp::DecimalUtil::parseDecimal64(&parsed, owned.c_str()) != 0) {
        return std::nullopt;
    }
    if (!isFinite(parsed)) {
        return std::nullopt;
    }
    return parsed;
}

//-------------------------------------------------------------------------

std::string formatDecimal(decimal_t val, uint32_t decimalPlaces)
{
    using BloombergLP::bdldfp::DecimalFormatConfig;
    using BloombergLP::bdldfp::DecimalUtil;

    const DecimalFormatConfig config{
        static_cast<int>(decimalPlaces), DecimalFormatConfig::e_FIXED};

    std::array<char, 64> buf{};
    const int len = DecimalUtil::format(buf.data(), static_cast<int>(buf.size()), val, config);
    if (len <= static_cast<int>(buf.size())) {
        return std::string(buf.data(), len);
    }
    std::string large(len, '\0');
    DecimalUtil::format(large.data(), len, val, config);
    return large;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::util

//-------------------------------------------------------------------------
