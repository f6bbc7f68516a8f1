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

enum class EntryKind : uint32_t
{
    DEBIT,
    CREDIT,
    MANUAL_SET
};

//-------------------------------------------------------------------------

// One movement of one account. Entries are append-only.
struct BalanceEntry : public JsonSerializable
{
    EntryId id{};
    AccountId accountId{};
    EntryKind kind{EntryKind::DEBIT};
    decimal_t amount{};
    decimal_t balanceAfter{};
    std::string description;
    std::string reference;
    Timestamp createdAt{};

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;

    [[nodiscard]] static BalanceEntry fromJson(const rapidjson::Value& json);
};

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
