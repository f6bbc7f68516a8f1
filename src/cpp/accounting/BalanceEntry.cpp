/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "uniledger/accounting/BalanceEntry.hpp"

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

//-------------------------------------------------------------------------

void BalanceEntry::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{id}, allocator);
        json.AddMember("account_id", rapidjson::Value{accountId}, allocator);
        json::setStringMember(json, "kind", enumToString(kind));
        json::setDecimalMember(json, "amount", amount);
        json::setDecimalMember(json, "balance_after", balanceAfter);
        json::setStringMember(json, "description", description);
        json::setStringMember(json, "reference", reference);
        json::setTimestampMember(json, "created_at", createdAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

BalanceEntry BalanceEntry::fromJson(const rapidjson::Value& json)
{
    BalanceEntry entry;
    entry.id = json::getUint(json["id"]);
    entry.accountId = static_cast<AccountId>(json::getUint(json["account_id"]));
    entry.kind = requireEnum<EntryKind>(json["kind"].GetString());
    entry.amount = json::getDecimal(json["amount"]);
    entry.balanceAfter = json::getDecimal(json["balance_after"]);
    entry.description = json["description"].GetString();
    entry.reference = json["reference"].GetString();
    entry.createdAt = util::parseTimestamp(json["created_at"].GetString()).value_or(Timestamp{});
    return entry;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
