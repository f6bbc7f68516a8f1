/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "CashFallbackResolver.hpp"
#include "ThreadSafeRegistry.hpp"

#include <atomic>

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

struct ExpensePage
{
    std::vector<Expense> items;
    size_t total{};
};

//-------------------------------------------------------------------------

class ExpenseLedger
{
public:
    ExpenseLedger(
        accounting::BalanceAccountStore* accounts,
        const CashFallbackResolver* resolver,
        std::chrono::milliseconds lockTimeout,
        Clock clock = util::systemNow) noexcept;

    Expected<Expense> createExpense(ExpenseRequest request);
    Expected<Expense> updateExpense(ExpenseId expenseId, ExpensePatch patch);

    // pending -> partially_paid -> paid. The expense lock is held across the
    // balance check and the debit; a failed debit leaves the expense untouched.
    Expected<Expense> payExpense(ExpenseId expenseId, const PaymentRequest& payment);

    [[nodiscard]] Expected<Expense> getExpense(ExpenseId expenseId) const;
    [[nodiscard]] Expected<ExpensePage> listExpenses(const ExpenseFilter& filter = {}) const;
    // Unpaid expenses, earliest due date first, undated last.
    [[nodiscard]] Expected<std::vector<Expense>> pendingExpenses() const;
    [[nodiscard]] Expected<decimal_t> pendingTotal() const;
    [[nodiscard]] Expected<std::vector<CategorySummary>> summaryByCategory(
        std::optional<Date> from = {}, std::optional<Date> to = {}) const;

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void restore(const rapidjson::Value& json);

private:
    using Registry = ThreadSafeRegistry<ExpenseId, Expense>;

    [[nodiscard]] Expected<AccountId> resolvePaymentAccount(
        const Expense& expense, const PaymentRequest& payment) const;

    Registry m_expenses;
    std::atomic<ExpenseId> m_idCounter{1};
    accounting::BalanceAccountStore* m_accounts;
    const CashFallbackResolver* m_resolver;
    Clock m_clock;

    friend class AdjustmentEngine;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
