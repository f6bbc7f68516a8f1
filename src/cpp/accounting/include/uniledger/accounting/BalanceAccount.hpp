/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "uniledger/accounting/common.hpp"

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

//-------------------------------------------------------------------------

enum class AccountKind : uint32_t
{
    CASH_PRIMARY,
    CASH_SECONDARY,
    DIGITAL_WALLET,
    BANK,
    ASSET_FIXED,
    ASSET_OTHER,
    LIABILITY_CURRENT,
    LIABILITY_LONG,
    EQUITY
};

// Cash drawers, digital wallets and bank accounts: money that can be spent.
[[nodiscard]] constexpr bool isLiquid(AccountKind kind) noexcept
{
    return kind == AccountKind::CASH_PRIMARY
        || kind == AccountKind::CASH_SECONDARY
        || kind == AccountKind::DIGITAL_WALLET
        || kind == AccountKind::BANK;
}

[[nodiscard]] constexpr bool isCash(AccountKind kind) noexcept
{
    return kind == AccountKind::CASH_PRIMARY || kind == AccountKind::CASH_SECONDARY;
}

//-------------------------------------------------------------------------

class BalanceAccount : public JsonSerializable
{
public:
    BalanceAccount() noexcept = default;
    BalanceAccount(
        AccountId id,
        std::string code,
        std::string name,
        AccountKind kind,
        decimal_t balance = {});

    [[nodiscard]] AccountId id() const noexcept { return m_id; }
    [[nodiscard]] const std::string& code() const noexcept { return m_code; }
    [[nodiscard]] const std::string& name() const noexcept { return m_name; }
    [[nodiscard]] AccountKind kind() const noexcept { return m_kind; }
    [[nodiscard]] decimal_t balance() const noexcept { return m_balance; }
    [[nodiscard]] bool isLiquid() const noexcept { return accounting::isLiquid(m_kind); }
    [[nodiscard]] bool isCash() const noexcept { return accounting::isCash(m_kind); }

    [[nodiscard]] auto&& description(this auto&& self) noexcept { return self.m_description; }
    [[nodiscard]] auto&& creditor(this auto&& self) noexcept { return self.m_creditor; }
    [[nodiscard]] auto&& originalValue(this auto&& self) noexcept { return self.m_originalValue; }
    [[nodiscard]] auto&& accumulatedDepreciation(this auto&& self) noexcept
    {
        return self.m_accumulatedDepreciation;
    }

    // Book value of a fixed asset; the plain balance for every other kind.
    [[nodiscard]] decimal_t netValue() const noexcept;

    [[nodiscard]] bool canDebit(decimal_t amount) const noexcept;

    // Returns the balance after the movement.
    Expected<decimal_t> debit(decimal_t amount);
    Expected<decimal_t> credit(decimal_t amount);
    // Administrative override, negative values allowed. Returns the signed difference.
    decimal_t setBalance(decimal_t newBalance);

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static BalanceAccount fromXML(pugi::xml_node node);
    [[nodiscard]] static BalanceAccount fromJson(const rapidjson::Value& json);

private:
    AccountId m_id{};
    std::string m_code;
    std::string m_name;
    AccountKind m_kind{AccountKind::CASH_PRIMARY};
    decimal_t m_balance{};
    std::string m_description;
    std::optional<std::string> m_creditor;
    std::optional<decimal_t> m_originalValue;
    std::optional<decimal_t> m_accumulatedDepreciation;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------

template<>
struct fmt::formatter<uniledger::accounting::BalanceAccount>
{
    constexpr auto parse(format_parse_context& ctx) { return ctx.begin(); }

    template<typename FormatContext>
    auto format(const uniledger::accounting::BalanceAccount& account, FormatContext& ctx) const
    {
        return fmt::format_to(
            ctx.out(),
            "#{} {} '{}' ({}) = {}",
            account.id(),
            account.code(),
            account.name(),
            magic_enum::enum_name(account.kind()),
            account.balance());
    }
};

//-------------------------------------------------------------------------
