/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CashFallbackResolver.hpp"

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

FundsInfo BalanceCheck::fundsInfo() const noexcept
{
    return {
        .accountId = sourceAccountId,
        .balance = sourceBalance,
        .requested = amount,
        .fallbackAccountId = fallbackAccountId,
        .fallbackBalance = fallbackBalance
    };
}

//-------------------------------------------------------------------------

void BalanceCheck::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::setDecimalMember(json, "amount", amount);
        json.AddMember("can_pay", rapidjson::Value{canPay}, allocator);
        json.AddMember("source_account_id", rapidjson::Value{sourceAccountId}, allocator);
        json::setDecimalMember(json, "source_balance", sourceBalance);
        json.AddMember("fallback_available", rapidjson::Value{fallbackAvailable}, allocator);
        json::setOptionalMember(json, "fallback_account_id", fallbackAccountId);
        json::setOptionalMember(json, "fallback_balance", fallbackBalance);
        json::setDecimalMember(
            json,
            "shortfall",
            canPay ? decimal_t{} : amount - sourceBalance);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

CashFallbackResolver::CashFallbackResolver(
    const accounting::BalanceAccountStore* accounts, Parameters params)
    : m_accounts{accounts}, m_params{std::move(params)}
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto requireAccount = [this](AccountId accountId) {
        auto account = m_accounts->getAccount(accountId);
        if (!account) {
            throw std::invalid_argument{fmt::format(
                "{}: Unknown account #{} in payment configuration", ctx, accountId)};
        }
        return std::move(account).value();
    };

    for (const auto& [primaryId, fallbackId] : m_params.fallbacks) {
        if (primaryId == fallbackId) {
            throw std::invalid_argument{fmt::format(
                "{}: Account #{} cannot be its own fallback", ctx, primaryId)};
        }
        const auto primary = requireAccount(primaryId);
        const auto fallback = requireAccount(fallbackId);
        if (!primary.isCash() || !fallback.isCash()) {
            throw std::invalid_argument{fmt::format(
                "{}: Fallback pair {} -> {} must join two cash accounts",
                ctx, primary, fallback)};
        }
    }
    for (const auto& [method, accountId] : m_params.methodAccounts) {
        if (!requireAccount(accountId).isLiquid()) {
            throw std::invalid_argument{fmt::format(
                "{}: Account #{} for method '{}' cannot fund payments",
                ctx, accountId, enumToString(method))};
        }
    }
}

//-------------------------------------------------------------------------

std::optional<AccountId> CashFallbackResolver::fallbackFor(AccountId accountId) const
{
    auto it = m_params.fallbacks.find(accountId);
    return it != m_params.fallbacks.end() ? std::make_optional(it->second) : std::nullopt;
}

//-------------------------------------------------------------------------

std::optional<AccountId> CashFallbackResolver::accountFor(PaymentMethod method) const
{
    auto it = m_params.methodAccounts.find(method);
    return it != m_params.methodAccounts.end() ? std::make_optional(it->second) : std::nullopt;
}

//-------------------------------------------------------------------------

Expected<BalanceCheck> CashFallbackResolver::check(decimal_t amount, AccountId accountId) const
{
    if (auto valid = accounting::validateAmount(amount, "Amount"); !valid) {
        return std::unexpected{std::move(valid).error()};
    }
    auto sourceBalance = m_accounts->getBalance(accountId);
    if (!sourceBalance) {
        return std::unexpected{std::move(sourceBalance).error()};
    }

    BalanceCheck result;
    result.amount = amount;
    result.sourceAccountId = accountId;
    result.sourceBalance = sourceBalance.value();
    result.canPay = result.sourceBalance >= amount;

    if (auto fallbackId = fallbackFor(accountId)) {
        auto fallbackBalance = m_accounts->getBalance(fallbackId.value());
        if (!fallbackBalance) {
            return std::unexpected{std::move(fallbackBalance).error()};
        }
        result.fallbackAccountId = fallbackId;
        result.fallbackBalance = fallbackBalance.value();
        result.fallbackAvailable = fallbackBalance.value() >= amount;
    }
    return result;
}

//-------------------------------------------------------------------------

Expected<BalanceCheck> CashFallbackResolver::checkForMethod(
    decimal_t amount, PaymentMethod method) const
{
    auto accountId = accountFor(method);
    if (!accountId.has_value()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "No account is configured for payment method '{}'", enumToString(method)))};
    }
    return check(amount, accountId.value());
}

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
