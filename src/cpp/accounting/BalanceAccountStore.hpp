/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "ThreadSafeRegistry.hpp"
#include "uniledger/accounting/BalanceAccount.hpp"
#include "uniledger/accounting/BalanceEntry.hpp"

#include <atomic>
#include <mutex>

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

//-------------------------------------------------------------------------

struct Movement
{
    AccountId accountId;
    EntryKind kind;
    decimal_t amount;
    std::string description;
    std::string reference;
};

//-------------------------------------------------------------------------

struct CashBalances : public JsonSerializable
{
    decimal_t cashPrimary{};
    decimal_t cashSecondary{};
    decimal_t digitalWallet{};
    decimal_t bank{};
    std::vector<BalanceAccount> accounts;

    [[nodiscard]] decimal_t cashTotal() const noexcept { return cashPrimary + cashSecondary; }
    [[nodiscard]] decimal_t digitalTotal() const noexcept { return digitalWallet + bank; }
    [[nodiscard]] decimal_t liquidTotal() const noexcept { return cashTotal() + digitalTotal(); }

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

struct FixedAssetRequest
{
    std::string name;
    std::string code;
    decimal_t value;
    decimal_t accumulatedDepreciation{};
    std::string description;
};

struct DebtAccountRequest
{
    std::string name;
    std::string code;
    decimal_t amount;
    std::string creditor;
    bool longTerm{};
    std::string description;
};

//-------------------------------------------------------------------------

struct AccountSignals
{
    bs2::signal<void(const BalanceEntry&)> entry;
};

//-------------------------------------------------------------------------

class BalanceAccountStore
{
public:
    explicit BalanceAccountStore(
        std::chrono::milliseconds lockTimeout, Clock clock = util::systemNow) noexcept;

    void add(BalanceAccount account);
    Expected<BalanceAccount> createFixedAsset(const FixedAssetRequest& request);
    Expected<BalanceAccount> createDebt(const DebtAccountRequest& request);

    [[nodiscard]] bool contains(AccountId accountId) const;
    [[nodiscard]] Expected<BalanceAccount> getAccount(AccountId accountId) const;
    [[nodiscard]] Expected<BalanceAccount> findByCode(std::string_view code) const;
    [[nodiscard]] Expected<decimal_t> getBalance(AccountId accountId) const;
    [[nodiscard]] Expected<std::vector<BalanceAccount>> listAccounts(
        std::optional<AccountKind> kind = {}) const;
    [[nodiscard]] Expected<std::vector<BalanceEntry>> entries(AccountId accountId) const;
    [[nodiscard]] Expected<CashBalances> cashBalances() const;

    Expected<BalanceEntry> debit(
        AccountId accountId, decimal_t amount, std::string description, std::string reference);
    Expected<BalanceEntry> credit(
        AccountId accountId, decimal_t amount, std::string description, std::string reference);

    // Administrative override; always succeeds for a known account, negatives allowed.
    // An unchanged balance yields no entry.
    Expected<std::optional<BalanceEntry>> setBalance(
        AccountId accountId, decimal_t newBalance, std::string reason);

    // Applies all movements or none. Accounts are locked in ascending id order.
    Expected<std::vector<BalanceEntry>> apply(std::vector<Movement> movements);

    [[nodiscard]] AccountSignals& signals() noexcept { return m_signals; }

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void restore(const rapidjson::Value& json);

private:
    struct Slot
    {
        BalanceAccount account;
        std::vector<BalanceEntry> entries;
    };

    [[nodiscard]] BalanceEntry makeEntry(
        const BalanceAccount& account,
        EntryKind kind,
        decimal_t signedAmount,
        std::string description,
        std::string reference) const;

    // Numbers and appends an entry; the slot must be locked. Publishing the
    // returned copy is left to the caller once the lock is released.
    BalanceEntry record(Slot& slot, BalanceEntry entry);

    [[nodiscard]] AccountId nextAccountId() const;
    void ensureUniqueCode(std::string_view code) const;

    ThreadSafeRegistry<AccountId, Slot> m_accounts;
    std::atomic<EntryId> m_entryIdCounter{1};
    std::mutex m_createMtx;
    Clock m_clock;
    AccountSignals m_signals;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
