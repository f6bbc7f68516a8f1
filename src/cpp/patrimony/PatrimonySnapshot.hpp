/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BalanceAccountStore.hpp"
#include "InventoryValuation.hpp"
#include "uniledger/debt/Debt.hpp"

//-------------------------------------------------------------------------

namespace uniledger::patrimony
{

//-------------------------------------------------------------------------

struct PatrimonySnapshot : public JsonSerializable
{
    struct Assets
    {
        accounting::CashBalances liquid;
        InventoryValue inventory;
        debt::DebtTotals receivables;
        decimal_t fixed{};
        decimal_t other{};
        std::vector<accounting::BalanceAccount> fixedAccounts;
        std::vector<accounting::BalanceAccount> otherAccounts;
        decimal_t current{};
        decimal_t total{};
    };

    struct Liabilities
    {
        debt::DebtTotals payables;
        decimal_t pendingExpenses{};
        uint32_t pendingExpenseCount{};
        decimal_t currentAccounts{};
        decimal_t longTerm{};
        std::vector<accounting::BalanceAccount> accounts;
        decimal_t current{};
        decimal_t total{};
    };

    Assets assets;
    Liabilities liabilities;
    decimal_t netPatrimony{};
    // Informational only, never part of a total.
    std::vector<accounting::BalanceAccount> equityAccounts;
    Date generatedAt{};

    [[nodiscard]] bool isPositive() const noexcept { return netPatrimony >= 0_dec; }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::patrimony

//-------------------------------------------------------------------------
