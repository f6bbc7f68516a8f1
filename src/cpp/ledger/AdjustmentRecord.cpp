/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "uniledger/ledger/AdjustmentRecord.hpp"

//-------------------------------------------------------------------------

namespace uniledger::ledger
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] std::optional<std::string> methodName(std::optional<PaymentMethod> method)
{
    return method.transform([](PaymentMethod m) { return enumToString(m); });
}

[[nodiscard]] std::optional<PaymentMethod> methodFromJson(const rapidjson::Value& json)
{
    return json::getOptionalString(json).transform(
        [](const std::string& str) { return requireEnum<PaymentMethod>(str); });
}

[[nodiscard]] std::optional<AccountId> accountIdFromJson(const rapidjson::Value& json)
{
    return json::tryGetUint(json).transform(
        [](uint64_t id) { return static_cast<AccountId>(id); });
}

}  // namespace

//-------------------------------------------------------------------------

void AdjustmentRecord::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember("expense_id", rapidjson::Value{expenseId}, allocator);
        json::setStringMember(json, "reason", enumToString(reason));
        json::setDecimalMember(json, "previous_amount", previousAmount);
        json::setDecimalMember(json, "new_amount", newAmount);
        json::setDecimalMember(json, "adjustment_delta", adjustmentDelta);
        json::setDecimalMember(json, "previous_amount_paid", previousAmountPaid);
        json::setDecimalMember(json, "new_amount_paid", newAmountPaid);
        json::setOptionalMember(json, "previous_account_id", previousAccountId);
        json::setOptionalMember(json, "new_account_id", newAccountId);
        json::setOptionalMember(
            json, "previous_payment_method", methodName(previousPaymentMethod));
        json::setOptionalMember(json, "new_payment_method", methodName(newPaymentMethod));
        json::setStringMember(json, "description", description);
        json::setStringMember(json, "adjusted_by", adjustedBy);
        json::setTimestampMember(json, "adjusted_at", adjustedAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

AdjustmentRecord AdjustmentRecord::fromJson(const rapidjson::Value& json)
{
    AdjustmentRecord record;
    record.id = static_cast<AdjustmentId>(json::getUint(json["id"]));
    record.expenseId = static_cast<ExpenseId>(json::getUint(json["expense_id"]));
    record.reason = requireEnum<AdjustmentReason>(json["reason"].GetString());
    record.previousAmount = json::getDecimal(json["previous_amount"]);
    record.newAmount = json::getDecimal(json["new_amount"]);
    record.adjustmentDelta = json::getDecimal(json["adjustment_delta"]);
    record.previousAmountPaid = json::getDecimal(json["previous_amount_paid"]);
    record.newAmountPaid = json::getDecimal(json["new_amount_paid"]);
    record.previousAccountId = accountIdFromJson(json["previous_account_id"]);
    record.newAccountId = accountIdFromJson(json["new_account_id"]);
    record.previousPaymentMethod = methodFromJson(json["previous_payment_method"]);
    record.newPaymentMethod = methodFromJson(json["new_payment_method"]);
    record.description = json["description"].GetString();
    record.adjustedBy = json["adjusted_by"].GetString();
    record.adjustedAt =
        util::parseTimestamp(json["adjusted_at"].GetString()).value_or(Timestamp{});
    return record;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::ledger

//-------------------------------------------------------------------------
