/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "uniledger/ledger/Expense.hpp"

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

ExpenseStatus Expense::status() const noexcept
{
    if (amountPaid == 0_dec) {
        return ExpenseStatus::PENDING;
    }
    return isPaid() ? ExpenseStatus::PAID : ExpenseStatus::PARTIALLY_PAID;
}

//-------------------------------------------------------------------------

void Expense::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json::setStringMember(json, "category", enumToString(category));
        json::setStringMember(json, "description", description);
        json::setDecimalMember(json, "amount", amount);
        json::setDecimalMember(json, "amount_paid", amountPaid);
        json::setDecimalMember(json, "balance", balance());
        json.AddMember("is_paid", rapidjson::Value{isPaid()}, allocator);
        json::setStringMember(json, "status", enumToString(status()));
        json::setDateMember(json, "due_date", dueDate);
        json::setDateMember(json, "expense_date", expenseDate);
        json::setStringMember(json, "vendor", vendor);
        json::setStringMember(json, "receipt_number", receiptNumber);
        json::setStringMember(json, "notes", notes);
        json::setOptionalMember(json, "payment_account_id", paymentAccountId);
        json::setOptionalMember(
            json,
            "payment_method",
            paymentMethod.transform([](PaymentMethod m) { return enumToString(m); }));
        json::setTimestampMember(json, "paid_at", paidAt);
        json::setTimestampMember(json, "created_at", createdAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Expense Expense::fromJson(const rapidjson::Value& json)
{
    Expense expense;
    expense.id = static_cast<ExpenseId>(json::getUint(json["id"]));
    expense.category = requireEnum<ExpenseCategory>(json["category"].GetString());
    expense.description = json["description"].GetString();
    expense.amount = json::getDecimal(json["amount"]);
    expense.amountPaid = json::getDecimal(json["amount_paid"]);
    expense.dueDate = json::getOptionalString(json["due_date"]).and_then(
        [](const std::string& str) { return util::parseDate(str); });
    expense.expenseDate = util::parseDate(json["expense_date"].GetString()).value_or(Date{});
    expense.vendor = json["vendor"].GetString();
    expense.receiptNumber = json["receipt_number"].GetString();
    expense.notes = json["notes"].GetString();
    if (auto accountId = json::tryGetUint(json["payment_account_id"])) {
        expense.paymentAccountId = static_cast<AccountId>(accountId.value());
    }
    expense.paymentMethod = json::getOptionalString(json["payment_method"]).transform(
        [](const std::string& str) { return requireEnum<PaymentMethod>(str); });
    expense.paidAt = json::getOptionalString(json["paid_at"]).and_then(
        [](const std::string& str) { return util::parseTimestamp(str); });
    expense.createdAt =
        util::parseTimestamp(json["created_at"].GetString()).value_or(Timestamp{});
    return expense;
}

//-------------------------------------------------------------------------

bool ExpensePatch::empty() const noexcept
{
    return !category && !description && !amount && !dueDate && !expenseDate
        && !vendor && !receiptNumber && !notes;
}

//-------------------------------------------------------------------------

void CategorySummary::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::setStringMember(json, "category", enumToString(category));
        json::setDecimalMember(json, "total_amount", total);
        json::setDecimalMember(json, "paid_amount", paid);
        json::setDecimalMember(json, "pending_amount", pending);
        json.AddMember("count", rapidjson::Value{count}, allocator);
        json::setDecimalMember(json, "percentage", percentage);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

PaymentMethod defaultMethodFor(accounting::AccountKind kind) noexcept
{
    switch (kind) {
        case accounting::AccountKind::CASH_PRIMARY:
        case accounting::AccountKind::CASH_SECONDARY:
            return PaymentMethod::CASH;
        case accounting::AccountKind::DIGITAL_WALLET:
        case accounting::AccountKind::BANK:
            return PaymentMethod::TRANSFER;
        default:
            return PaymentMethod::OTHER;
    }
}

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
