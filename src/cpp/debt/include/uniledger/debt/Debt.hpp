/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "uniledger/ledger/Expense.hpp"

//-------------------------------------------------------------------------

namespace uniledger::debt
{

//-------------------------------------------------------------------------

enum class DebtKind : uint32_t
{
    RECEIVABLE,
    PAYABLE
};

//-------------------------------------------------------------------------

// Money owed to the business (receivable) or by it (payable).
struct Debt : public JsonSerializable
{
    DebtId id{};
    DebtKind kind{DebtKind::RECEIVABLE};
    std::string description;
    decimal_t amount{};
    decimal_t amountPaid{};
    Date invoiceDate{};
    std::optional<Date> dueDate;
    std::string counterparty;
    std::string invoiceNumber;
    std::string notes;
    std::optional<ledger::PaymentMethod> paymentMethod;
    std::optional<Timestamp> paidAt;
    Timestamp createdAt{};

    [[nodiscard]] decimal_t balance() const noexcept { return amount - amountPaid; }
    [[nodiscard]] bool isPaid() const noexcept { return amountPaid >= amount; }
    [[nodiscard]] bool isOverdue(Date today) const noexcept
    {
        return dueDate.has_value() && dueDate.value() < today && balance() > 0_dec;
    }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static Debt fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

// A debt as seen on a given day.
struct DebtStatement : public JsonSerializable
{
    DebtStatement() noexcept = default;
    DebtStatement(Debt debt, Date asOf) : debt{std::move(debt)}, asOf{asOf} {}

    Debt debt;
    Date asOf{};

    [[nodiscard]] bool isOverdue() const noexcept { return debt.isOverdue(asOf); }
    [[nodiscard]] int64_t daysOverdue() const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

struct DebtTotals : public JsonSerializable
{
    DebtKind kind{DebtKind::RECEIVABLE};
    decimal_t pendingTotal{};
    decimal_t overdueTotal{};
    uint32_t pendingCount{};
    uint32_t overdueCount{};
    uint32_t paidCount{};

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

struct DebtRequest
{
    std::string description;
    decimal_t amount{};
    std::optional<Date> invoiceDate;
    std::optional<Date> dueDate;
    std::string counterparty;
    std::string invoiceNumber;
    std::string notes;
};

struct DebtPayment
{
    decimal_t amount{};
    ledger::PaymentMethod method{ledger::PaymentMethod::CASH};
    std::optional<AccountId> accountId;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::debt

//-------------------------------------------------------------------------
