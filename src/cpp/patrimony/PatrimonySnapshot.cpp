/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "PatrimonySnapshot.hpp"

//-------------------------------------------------------------------------

namespace uniledger::patrimony
{

//-------------------------------------------------------------------------

void PatrimonySnapshot::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();

        rapidjson::Document assetsJson{&allocator};
        assetsJson.SetObject();
        assets.liquid.jsonSerialize(assetsJson, "cash_and_bank");
        assets.inventory.jsonSerialize(assetsJson, "inventory");
        assets.receivables.jsonSerialize(assetsJson, "accounts_receivable");
        json::setDecimalMember(assetsJson, "fixed_assets", assets.fixed);
        json::serializeArray(assetsJson, "fixed_asset_accounts", assets.fixedAccounts);
        json::setDecimalMember(assetsJson, "other_assets", assets.other);
        json::serializeArray(assetsJson, "other_asset_accounts", assets.otherAccounts);
        json::setDecimalMember(assetsJson, "current", assets.current);
        json::setDecimalMember(assetsJson, "total", assets.total);
        json.AddMember("assets", assetsJson, allocator);

        rapidjson::Document liabilitiesJson{&allocator};
        liabilitiesJson.SetObject();
        liabilities.payables.jsonSerialize(liabilitiesJson, "accounts_payable");
        json::setDecimalMember(liabilitiesJson, "pending_expenses", liabilities.pendingExpenses);
        liabilitiesJson.AddMember(
            "pending_expense_count", rapidjson::Value{liabilities.pendingExpenseCount}, allocator);
        json::setDecimalMember(liabilitiesJson, "current_accounts", liabilities.currentAccounts);
        json::setDecimalMember(liabilitiesJson, "long_term", liabilities.longTerm);
        json::serializeArray(liabilitiesJson, "debts", liabilities.accounts);
        json::setDecimalMember(liabilitiesJson, "current", liabilities.current);
        json::setDecimalMember(liabilitiesJson, "total", liabilities.total);
        json.AddMember("liabilities", liabilitiesJson, allocator);

        json::serializeArray(json, "equity_accounts", equityAccounts);

        rapidjson::Document summaryJson{&allocator};
        summaryJson.SetObject();
        json::setDecimalMember(summaryJson, "total_assets", assets.total);
        json::setDecimalMember(summaryJson, "total_liabilities", liabilities.total);
        json::setDecimalMember(summaryJson, "net_patrimony", netPatrimony);
        summaryJson.AddMember("is_positive", rapidjson::Value{isPositive()}, allocator);
        json.AddMember("summary", summaryJson, allocator);

        json::setDateMember(json, "generated_at", generatedAt);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

}  // namespace uniledger::patrimony

//-------------------------------------------------------------------------
