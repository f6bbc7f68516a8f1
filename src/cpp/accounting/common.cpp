/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "uniledger/accounting/common.hpp"

#include <boost/algorithm/string/trim.hpp>

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

//-------------------------------------------------------------------------

Expected<decimal_t> validateMoney(decimal_t value, std::string_view what)
{
    if (!util::isFinite(value)) {
        return std::unexpected{LedgerError::validation(
            fmt::format("{} must be a finite decimal", what))};
    }
    if (!util::hasAtMostDecimals(value)) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "{} {} has more than {} decimal places", what, value, util::kMoneyDecimals))};
    }
    return value;
}

//-------------------------------------------------------------------------

Expected<decimal_t> validateAmount(decimal_t amount, std::string_view what, bool allowZero)
{
    return validateMoney(amount, what).and_then([&](decimal_t amount) -> Expected<decimal_t> {
        if (amount < 0_dec || (!allowZero && amount == 0_dec)) {
            return std::unexpected{LedgerError::validation(fmt::format(
                "{} must be {}, was {}",
                what, allowZero ? "non-negative" : "positive", amount))};
        }
        return amount;
    });
}

//-------------------------------------------------------------------------

Expected<std::string> validateDescription(
    std::string_view description, size_t minLength, std::string_view what)
{
    auto trimmed = boost::algorithm::trim_copy(std::string{description});
    // Count UTF-8 code points, not bytes.
    const auto length = ranges::count_if(
        trimmed, [](char c) { return (static_cast<unsigned char>(c) & 0xC0) != 0x80; });
    if (static_cast<size_t>(length) < minLength) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "{} must be at least {} characters long, was {}", what, minLength, length))};
    }
    return trimmed;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
