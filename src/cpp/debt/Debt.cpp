/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "uniledger/debt/Debt.hpp"

//-------------------------------------------------------------------------

namespace uniledger::debt
{

//-------------------------------------------------------------------------

void Debt::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json::setStringMember(json, "kind", enumToString(kind));
        json::setStringMember(json, "description", description);
        json::setDecimalMember(json, "amount", amount);
        json::setDecimalMember(json, "amount_paid", amountPaid);
        json::setDecimalMember(json, "balance", balance());
        json.AddMember("is_paid", rapidjson::Value{isPaid()}, allocator);
        json::setDateMember(json, "invoice_date", invoiceDate);
        json::setDateMember(json, "due_date", dueDate);
        json::setStringMember(json, "counterparty", counterparty);
        json::setStringMember(json, "invoice_number", invoiceNumber);
        json::setStringMember(json, "notes", notes);
        json::setOptionalMember(
            json,
            "payment_method",
            paymentMethod.transform([](ledger::PaymentMethod m) { return enumToString(m); }));
        json::setTimestampMember(json, "paid_at", paidAt);
        json::setTimestampMember(json, "created_at", createdAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

Debt Debt::fromJson(const rapidjson::Value& json)
{
    Debt debt;
    debt.id = static_cast<DebtId>(json::getUint(json["id"]));
    debt.kind = requireEnum<DebtKind>(json["kind"].GetString());
    debt.description = json["description"].GetString();
    debt.amount = json::getDecimal(json["amount"]);
    debt.amountPaid = json::getDecimal(json["amount_paid"]);
    debt.invoiceDate = util::parseDate(json["invoice_date"].GetString()).value_or(Date{});
    debt.dueDate = json::getOptionalString(json["due_date"]).and_then(
        [](const std::string& str) { return util::parseDate(str); });
    debt.counterparty = json["counterparty"].GetString();
    debt.invoiceNumber = json["invoice_number"].GetString();
    debt.notes = json["notes"].GetString();
    debt.paymentMethod = json::getOptionalString(json["payment_method"]).transform(
        [](const std::string& str) { return requireEnum<ledger::PaymentMethod>(str); });
    debt.paidAt = json::getOptionalString(json["paid_at"]).and_then(
        [](const std::string& str) { return util::parseTimestamp(str); });
    debt.createdAt = util::parseTimestamp(json["created_at"].GetString()).value_or(Timestamp{});
    return debt;
}

//-------------------------------------------------------------------------

int64_t DebtStatement::daysOverdue() const noexcept
{
    return isOverdue() ? (asOf - debt.dueDate.value()).count() : 0;
}

//-------------------------------------------------------------------------

void DebtStatement::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        debt.jsonSerialize(json);
        auto& allocator = json.GetAllocator();
        json.AddMember("is_overdue", rapidjson::Value{isOverdue()}, allocator);
        json.AddMember("days_overdue", rapidjson::Value{daysOverdue()}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void DebtTotals::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json::setStringMember(json, "kind", enumToString(kind));
        json::setDecimalMember(json, "pending_total", pendingTotal);
        json::setDecimalMember(json, "overdue_total", overdueTotal);
        json.AddMember("pending_count", rapidjson::Value{pendingCount}, allocator);
        json.AddMember("overdue_count", rapidjson::Value{overdueCount}, allocator);
        json.AddMember("paid_count", rapidjson::Value{paidCount}, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace uniledger::debt

//-------------------------------------------------------------------------
