/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "BalanceAccountStore.hpp"
#include "ThreadSafeRegistry.hpp"
#include "uniledger/debt/Debt.hpp"

#include <atomic>

//-------------------------------------------------------------------------

namespace uniledger::debt
{

//-------------------------------------------------------------------------

// Receivables and payables. Overdue status is derived from the clock on every read.
class DebtLedger
{
public:
    DebtLedger(
        accounting::BalanceAccountStore* accounts,
        std::chrono::milliseconds lockTimeout,
        Clock clock = util::systemNow) noexcept;

    Expected<DebtStatement> create(DebtKind kind, DebtRequest request);
    [[nodiscard]] Expected<DebtStatement> get(DebtKind kind, DebtId debtId) const;
    // Earliest due date first, undated last.
    [[nodiscard]] Expected<std::vector<DebtStatement>> list(
        DebtKind kind, bool pendingOnly = false) const;
    [[nodiscard]] Expected<DebtTotals> totals(DebtKind kind) const;

    // With an account, a receivable payment credits it and a payable payment debits it.
    Expected<DebtStatement> recordPayment(DebtKind kind, DebtId debtId, DebtPayment payment);

    [[nodiscard]] Date today() const { return util::toDate(m_clock()); }

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void restore(const rapidjson::Value& json);

private:
    [[nodiscard]] Expected<std::vector<Debt>> debtsOfKind(DebtKind kind) const;

    ThreadSafeRegistry<DebtId, Debt> m_debts;
    std::atomic<DebtId> m_idCounter{1};
    accounting::BalanceAccountStore* m_accounts;
    Clock m_clock;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::debt

//-------------------------------------------------------------------------
