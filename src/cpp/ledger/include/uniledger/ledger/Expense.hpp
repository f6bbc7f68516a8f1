/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "uniledger/accounting/BalanceAccount.hpp"

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

enum class PaymentMethod : uint32_t
{
    CASH,
    TRANSFER,
    CARD,
    CREDIT,
    OTHER
};

enum class ExpenseCategory : uint32_t
{
    RENT,
    UTILITIES,
    PAYROLL,
    SUPPLIES,
    INVENTORY,
    TRANSPORT,
    MAINTENANCE,
    MARKETING,
    TAXES,
    BANK_FEES,
    OTHER
};

enum class ExpenseStatus : uint32_t
{
    PENDING,
    PARTIALLY_PAID,
    PAID
};

//-------------------------------------------------------------------------

struct Expense : public JsonSerializable
{
    ExpenseId id{};
    ExpenseCategory category{ExpenseCategory::OTHER};
    std::string description;
    decimal_t amount{};
    decimal_t amountPaid{};
    std::optional<Date> dueDate;
    Date expenseDate{};
    std::string vendor;
    std::string receiptNumber;
    std::string notes;
    std::optional<AccountId> paymentAccountId;
    std::optional<PaymentMethod> paymentMethod;
    std::optional<Timestamp> paidAt;
    Timestamp createdAt{};

    [[nodiscard]] decimal_t balance() const noexcept { return amount - amountPaid; }
    [[nodiscard]] bool isPaid() const noexcept { return amountPaid >= amount; }
    [[nodiscard]] ExpenseStatus status() const noexcept;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static Expense fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

struct ExpenseRequest
{
    ExpenseCategory category{ExpenseCategory::OTHER};
    std::string description;
    decimal_t amount{};
    std::optional<Date> dueDate;
    std::optional<Date> expenseDate;
    std::string vendor;
    std::string receiptNumber;
    std::string notes;
};

struct ExpensePatch
{
    std::optional<ExpenseCategory> category;
    std::optional<std::string> description;
    std::optional<decimal_t> amount;
    std::optional<std::optional<Date>> dueDate;
    std::optional<Date> expenseDate;
    std::optional<std::string> vendor;
    std::optional<std::string> receiptNumber;
    std::optional<std::string> notes;

    [[nodiscard]] bool empty() const noexcept;
};

struct PaymentRequest
{
    decimal_t amount{};
    AccountId accountId{};
    std::optional<PaymentMethod> method;
    bool useFallback{};
};

struct ExpenseFilter
{
    std::optional<ExpenseCategory> category;
    std::optional<bool> isPaid;
    size_t offset{};
    size_t limit{100};
};

//-------------------------------------------------------------------------

struct CategorySummary : public JsonSerializable
{
    ExpenseCategory category{ExpenseCategory::OTHER};
    decimal_t total{};
    decimal_t paid{};
    decimal_t pending{};
    uint32_t count{};
    decimal_t percentage{};

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

// Payment method implied by the kind of the paying account.
[[nodiscard]] PaymentMethod defaultMethodFor(accounting::AccountKind kind) noexcept;

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<uniledger::ledger::Expense>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const uniledger::ledger::Expense& expense, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "EXP-{} '{}' {}/{} ({})",
            expense.id,
            expense.description,
            expense.amountPaid,
            expense.amount,
            magic_enum::enum_name(expense.status()));
    }
};

//-------------------------------------------------------------------------
