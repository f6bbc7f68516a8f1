/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "uniledger/ledger/Expense.hpp"

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

enum class AdjustmentReason : uint32_t
{
    AMOUNT_CORRECTION,
    ACCOUNT_CORRECTION,
    BOTH_CORRECTION,
    ERROR_REVERSAL,
    PARTIAL_REFUND
};

//-------------------------------------------------------------------------

// Before/after state of one correction of a paid expense. Never mutated once written.
struct AdjustmentRecord : public JsonSerializable
{
    AdjustmentId id{};
    ExpenseId expenseId{};
    AdjustmentReason reason{AdjustmentReason::AMOUNT_CORRECTION};
    decimal_t previousAmount{};
    decimal_t newAmount{};
    decimal_t adjustmentDelta{};
    decimal_t previousAmountPaid{};
    decimal_t newAmountPaid{};
    std::optional<AccountId> previousAccountId;
    std::optional<AccountId> newAccountId;
    std::optional<PaymentMethod> previousPaymentMethod;
    std::optional<PaymentMethod> newPaymentMethod;
    std::string description;
    UserId adjustedBy;
    Timestamp adjustedAt{};

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static AdjustmentRecord fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
