/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerError.hpp"

//-------------------------------------------------------------------------

namespace uniledger
{

//-------------------------------------------------------------------------

bool LedgerError::isRecoverable() const noexcept
{
    switch (code) {
        case LedgerErrorCode::INSUFFICIENT_FUNDS:
        case LedgerErrorCode::NEEDS_FALLBACK_CONFIRMATION:
        case LedgerErrorCode::CONCURRENCY_CONFLICT:
            return true;
        default:
            return false;
    }
}

//-------------------------------------------------------------------------

bool LedgerError::isRetryable() const noexcept
{
    return code == LedgerErrorCode::CONCURRENCY_CONFLICT;
}

//-------------------------------------------------------------------------

std::string LedgerError::toString() const
{
    if (!funds.has_value()) {
        return fmt::format("{}: {}", magic_enum::enum_name(code), message);
    }
    const auto& f = funds.value();
    if (f.fallbackAccountId.has_value()) {
        return fmt::format(
            "{}: {} (account #{} balance {}, requested {}, fallback #{} balance {})",
            magic_enum::enum_name(code),
            message,
            f.accountId,
            f.balance,
            f.requested,
            f.fallbackAccountId.value(),
            f.fallbackBalance.value_or(0_dec));
    }
    return fmt::format(
        "{}: {} (account #{} balance {}, requested {})",
        magic_enum::enum_name(code), message, f.accountId, f.balance, f.requested);
}

//-------------------------------------------------------------------------

LedgerError LedgerError::validation(std::string message)
{
    return {.code = LedgerErrorCode::VALIDATION_ERROR, .message = std::move(message)};
}

//-------------------------------------------------------------------------

LedgerError LedgerError::notFound(std::string message)
{
    return {.code = LedgerErrorCode::NOT_FOUND, .message = std::move(message)};
}

//-------------------------------------------------------------------------

LedgerError LedgerError::noChange(std::string message)
{
    return {.code = LedgerErrorCode::NO_CHANGE_REQUESTED, .message = std::move(message)};
}

//-------------------------------------------------------------------------

LedgerError LedgerError::conflict(std::string message)
{
    return {.code = LedgerErrorCode::CONCURRENCY_CONFLICT, .message = std::move(message)};
}

//-------------------------------------------------------------------------

LedgerError LedgerError::insufficientFunds(std::string message, FundsInfo funds)
{
    return {
        .code = LedgerErrorCode::INSUFFICIENT_FUNDS,
        .message = std::move(message),
        .funds = std::move(funds)
    };
}

//-------------------------------------------------------------------------

LedgerError LedgerError::needsFallback(std::string message, FundsInfo funds)
{
    return {
        .code = LedgerErrorCode::NEEDS_FALLBACK_CONFIRMATION,
        .message = std::move(message),
        .funds = std::move(funds)
    };
}

//-------------------------------------------------------------------------

}  // namespace uniledger

//-------------------------------------------------------------------------
