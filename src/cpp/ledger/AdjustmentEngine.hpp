/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ExpenseLedger.hpp"
#include "uniledger/ledger/AdjustmentRecord.hpp"

#include <shared_mutex>

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

struct AdjustmentRequest
{
    std::optional<decimal_t> newAmount;
    std::optional<AccountId> newAccountId;
    std::optional<PaymentMethod> newMethod;
    std::optional<AdjustmentReason> reason;
    std::string description;
    UserId adjustedBy;
};

struct AdjustmentQuery
{
    std::optional<Date> from;
    std::optional<Date> to;
    std::optional<AdjustmentReason> reason;
    size_t offset{};
    size_t limit{50};
};

struct AdjustmentPage
{
    std::vector<AdjustmentRecord> items;
    size_t total{};
};

struct AdjustmentSignals
{
    bs2::signal<void(const AdjustmentRecord&)> recorded;
};

//-------------------------------------------------------------------------

class AdjustmentEngine
{
public:
    AdjustmentEngine(
        ExpenseLedger* expenses,
        accounting::BalanceAccountStore* accounts,
        size_t minDescriptionLength,
        Clock clock = util::systemNow);

    // Corrects the amount and/or funding account of an expense with recorded payments.
    // Balance movements and the expense update happen together or not at all.
    Expected<AdjustmentRecord> adjust(ExpenseId expenseId, AdjustmentRequest request);
    // Returns the whole amount paid to its account and reopens the expense.
    Expected<AdjustmentRecord> revert(
        ExpenseId expenseId, std::string description, UserId adjustedBy);
    Expected<AdjustmentRecord> partialRefund(
        ExpenseId expenseId, decimal_t amount, std::string description, UserId adjustedBy);

    // Oldest first.
    [[nodiscard]] Expected<std::vector<AdjustmentRecord>> history(ExpenseId expenseId) const;
    // Newest first.
    [[nodiscard]] Expected<AdjustmentPage> historyBetween(const AdjustmentQuery& query) const;

    [[nodiscard]] AdjustmentSignals& signals() noexcept { return m_signals; }

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void restore(const rapidjson::Value& json);

private:
    [[nodiscard]] Expected<std::string> validateDescription(std::string_view description) const;

    AdjustmentRecord append(AdjustmentRecord record);

    ExpenseLedger* m_expenses;
    accounting::BalanceAccountStore* m_accounts;
    size_t m_minDescriptionLength;
    Clock m_clock;
    std::vector<AdjustmentRecord> m_records;
    AdjustmentId m_idCounter{1};
    std::unique_ptr<std::shared_mutex> m_mtx;
    AdjustmentSignals m_signals;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
