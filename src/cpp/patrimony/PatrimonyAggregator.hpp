/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "DebtLedger.hpp"
#include "ExpenseLedger.hpp"
#include "PatrimonySnapshot.hpp"

//-------------------------------------------------------------------------

namespace uniledger::patrimony
{

//-------------------------------------------------------------------------

// Net worth over every store, recomputed on each call:
// assets (liquid + inventory + receivables + fixed + other)
// - liabilities (current accounts + payables + pending expenses + long term).
class PatrimonyAggregator
{
public:
    PatrimonyAggregator(
        const accounting::BalanceAccountStore* accounts,
        const ledger::ExpenseLedger* expenses,
        const debt::DebtLedger* debts,
        const InventoryValuation* inventory,
        Clock clock = util::systemNow) noexcept;

    [[nodiscard]] Expected<PatrimonySnapshot> snapshot() const;

private:
    const accounting::BalanceAccountStore* m_accounts;
    const ledger::ExpenseLedger* m_expenses;
    const debt::DebtLedger* m_debts;
    const InventoryValuation* m_inventory;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::patrimony

//-------------------------------------------------------------------------
