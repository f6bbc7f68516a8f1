/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BalanceAccountStore.hpp"
#include "uniledger/ledger/Expense.hpp"

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

struct BalanceCheck : public JsonSerializable
{
    decimal_t amount{};
    AccountId sourceAccountId{};
    decimal_t sourceBalance{};
    bool canPay{};
    bool fallbackAvailable{};
    std::optional<AccountId> fallbackAccountId;
    std::optional<decimal_t> fallbackBalance;

    [[nodiscard]] FundsInfo fundsInfo() const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

// Decides whether a cash payment is covered by its account or by the configured
// fallback of that account. Only reads balances; the caller picks the account to debit.
class CashFallbackResolver
{
public:
    struct Parameters
    {
        // primary -> fallback, both of a cash kind
        std::map<AccountId, AccountId> fallbacks;
        // default account of a payment method
        std::map<PaymentMethod, AccountId> methodAccounts;
    };

    CashFallbackResolver(const accounting::BalanceAccountStore* accounts, Parameters params);

    [[nodiscard]] const Parameters& parameters() const noexcept { return m_params; }

    [[nodiscard]] std::optional<AccountId> fallbackFor(AccountId accountId) const;
    [[nodiscard]] std::optional<AccountId> accountFor(PaymentMethod method) const;

    [[nodiscard]] Expected<BalanceCheck> check(decimal_t amount, AccountId accountId) const;
    [[nodiscard]] Expected<BalanceCheck> checkForMethod(
        decimal_t amount, PaymentMethod method) const;

private:
    const accounting::BalanceAccountStore* m_accounts;
    Parameters m_params;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
