/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "uniledger/accounting/BalanceAccount.hpp"

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] decimal_t requireMoney(
    const char* text, std::string_view what, std::source_location sl)
{
    const auto value = util::parseDecimal(text);
    if (!value.has_value() || !util::hasAtMostDecimals(value.value())) {
        throw std::invalid_argument{fmt::format(
            "{}: '{}' is not a valid monetary value for {}", sl.function_name(), text, what)};
    }
    return value.value();
}

}  // namespace

//-------------------------------------------------------------------------

BalanceAccount::BalanceAccount(
    AccountId id,
    std::string code,
    std::string name,
    AccountKind kind,
    decimal_t balance)
    : m_id{id},
      m_code{std::move(code)},
      m_name{std::move(name)},
      m_kind{kind},
      m_balance{balance}
{
    if (!util::hasAtMostDecimals(m_balance)) {
        throw std::invalid_argument{fmt::format(
            "{}: Initial balance {} of account '{}' exceeds money precision",
            std::source_location::current().function_name(), m_balance, m_name)};
    }
}

//-------------------------------------------------------------------------

decimal_t BalanceAccount::netValue() const noexcept
{
    if (m_kind == AccountKind::ASSET_FIXED && m_originalValue.has_value()) {
        return m_originalValue.value() - m_accumulatedDepreciation.value_or(0_dec);
    }
    return m_balance;
}

//-------------------------------------------------------------------------

bool BalanceAccount::canDebit(decimal_t amount) const noexcept
{
    return !isLiquid() || amount <= m_balance;
}

//-------------------------------------------------------------------------

Expected<decimal_t> BalanceAccount::debit(decimal_t amount)
{
    if (!canDebit(amount)) {
        return std::unexpected{LedgerError::insufficientFunds(
            fmt::format("Insufficient funds in '{}'", m_name),
            FundsInfo{.accountId = m_id, .balance = m_balance, .requested = amount})};
    }
    m_balance -= amount;
    return m_balance;
}

//-------------------------------------------------------------------------

Expected<decimal_t> BalanceAccount::credit(decimal_t amount)
{
    m_balance += amount;
    return m_balance;
}

//-------------------------------------------------------------------------

decimal_t BalanceAccount::setBalance(decimal_t newBalance)
{
    const decimal_t difference = newBalance - m_balance;
    m_balance = newBalance;
    return difference;
}

//-------------------------------------------------------------------------

void BalanceAccount::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("id", rapidjson::Value{m_id}, allocator);
        json::setStringMember(json, "code", m_code);
        json::setStringMember(json, "name", m_name);
        json::setStringMember(json, "kind", enumToString(m_kind));
        json::setDecimalMember(json, "balance", m_balance);
        json::setStringMember(json, "description", m_description);
        json::setOptionalMember(json, "creditor", m_creditor);
        json::setOptionalMember(json, "original_value", m_originalValue);
        json::setOptionalMember(json, "accumulated_depreciation", m_accumulatedDepreciation);
        json::setDecimalMember(json, "net_value", netValue());
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

BalanceAccount BalanceAccount::fromXML(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    if (node.attribute("id").empty() || node.attribute("name").empty()) {
        throw std::invalid_argument{fmt::format(
            "{}: Account requires 'id' and 'name' attributes", sl.function_name())};
    }

    BalanceAccount account{
        node.attribute("id").as_uint(),
        node.attribute("code").as_string(),
        node.attribute("name").as_string(),
        requireEnum<AccountKind>(node.attribute("kind").as_string(), sl),
        requireMoney(node.attribute("balance").as_string("0"), "balance", sl)};
    account.m_description = node.attribute("description").as_string();
    if (auto attr = node.attribute("creditor")) {
        account.m_creditor = attr.as_string();
    }
    if (auto attr = node.attribute("originalValue")) {
        account.m_originalValue = requireMoney(attr.as_string(), "originalValue", sl);
    }
    if (auto attr = node.attribute("accumulatedDepreciation")) {
        account.m_accumulatedDepreciation =
            requireMoney(attr.as_string(), "accumulatedDepreciation", sl);
    }
    return account;
}

//-------------------------------------------------------------------------

BalanceAccount BalanceAccount::fromJson(const rapidjson::Value& json)
{
    BalanceAccount account{
        static_cast<AccountId>(json::getUint(json["id"])),
        json["code"].GetString(),
        json["name"].GetString(),
        requireEnum<AccountKind>(json["kind"].GetString()),
        json::getDecimal(json["balance"])};
    account.m_description = json["description"].GetString();
    account.m_creditor = json::getOptionalString(json["creditor"]);
    if (!json["original_value"].IsNull()) {
        account.m_originalValue = json::getDecimal(json["original_value"]);
    }
    if (!json["accumulated_depreciation"].IsNull()) {
        account.m_accumulatedDepreciation = json::getDecimal(json["accumulated_depreciation"]);
    }
    return account;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
