/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "common.hpp"

#include <boost/algorithm/string/case_conv.hpp>

//-------------------------------------------------------------------------

namespace uniledger
{

//-------------------------------------------------------------------------

enum class LedgerErrorCode : uint32_t
{
    VALIDATION_ERROR,
    NOT_FOUND,
    INSUFFICIENT_FUNDS,
    NEEDS_FALLBACK_CONFIRMATION,
    NO_CHANGE_REQUESTED,
    CONCURRENCY_CONFLICT
};

//-------------------------------------------------------------------------

// Balances behind an insufficient-funds or fallback-confirmation outcome.
struct FundsInfo
{
    AccountId accountId;
    decimal_t balance;
    decimal_t requested;
    std::optional<AccountId> fallbackAccountId;
    std::optional<decimal_t> fallbackBalance;
};

//-------------------------------------------------------------------------

struct LedgerError
{
    LedgerErrorCode code;
    std::string message;
    std::optional<FundsInfo> funds;

    // Caller can recover by its own action (confirm fallback, reduce amount, retry).
    [[nodiscard]] bool isRecoverable() const noexcept;
    [[nodiscard]] bool isRetryable() const noexcept;
    [[nodiscard]] std::string toString() const;

    [[nodiscard]] static LedgerError validation(std::string message);
    [[nodiscard]] static LedgerError notFound(std::string message);
    [[nodiscard]] static LedgerError noChange(std::string message);
    [[nodiscard]] static LedgerError conflict(std::string message);
    [[nodiscard]] static LedgerError insufficientFunds(std::string message, FundsInfo funds);
    [[nodiscard]] static LedgerError needsFallback(std::string message, FundsInfo funds);
};

//-------------------------------------------------------------------------

template<typename T>
using Expected = std::expected<T, LedgerError>;

//-------------------------------------------------------------------------

// Lower-case wire name of an enumerator, e.g. CASH_PRIMARY -> "cash_primary".
template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] std::string enumToString(E value)
{
    return boost::algorithm::to_lower_copy(std::string{magic_enum::enum_name(value)});
}

template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] std::optional<E> enumFromString(std::string_view str)
{
    return magic_enum::enum_cast<E>(str, magic_enum::case_insensitive);
}

template<typename E>
requires std::is_enum_v<E>
[[nodiscard]] E requireEnum(
    std::string_view str, std::source_location sl = std::source_location::current())
{
    if (auto value = enumFromString<E>(str)) {
        return value.value();
    }
    throw std::invalid_argument{fmt::format(
        "{}: '{}' is not a valid {}", sl.function_name(), str, magic_enum::enum_type_name<E>())};
}

//-------------------------------------------------------------------------

}  // namespace uniledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<uniledger::LedgerError>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const uniledger::LedgerError& err, FormatContext& ctx) const
    {
        return fmt::format_to(ctx.out(), "{}", err.toString());
    }
};

//-------------------------------------------------------------------------
