/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "BalanceAccountStore.hpp"

#include <boost/algorithm/string/trim.hpp>

//-------------------------------------------------------------------------

namespace uniledger::accounting
{

//-------------------------------------------------------------------------

void CashBalances::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        json::setDecimalMember(json, "cash_primary", cashPrimary);
        json::setDecimalMember(json, "cash_secondary", cashSecondary);
        json::setDecimalMember(json, "digital_wallet", digitalWallet);
        json::setDecimalMember(json, "bank", bank);
        json::setDecimalMember(json, "total_cash", cashTotal());
        json::setDecimalMember(json, "total_digital", digitalTotal());
        json::setDecimalMember(json, "total_liquid", liquidTotal());
        json::serializeArray(json, "accounts", accounts);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

BalanceAccountStore::BalanceAccountStore(
    std::chrono::milliseconds lockTimeout, Clock clock) noexcept
    : m_accounts{"Account", lockTimeout}, m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

void BalanceAccountStore::add(BalanceAccount account)
{
    std::lock_guard lock{m_createMtx};
    ensureUniqueCode(account.code());
    const AccountId id = account.id();
    m_accounts.insert(id, Slot{.account = std::move(account), .entries = {}});
}

//-------------------------------------------------------------------------

Expected<BalanceAccount> BalanceAccountStore::createFixedAsset(const FixedAssetRequest& request)
{
    auto name = boost::algorithm::trim_copy(request.name);
    if (name.empty()) {
        return std::unexpected{LedgerError::validation("Fixed asset name must not be empty")};
    }
    auto value = validateAmount(request.value, "Fixed asset value");
    if (!value) {
        return std::unexpected{std::move(value).error()};
    }
    auto depreciation =
        validateAmount(request.accumulatedDepreciation, "Accumulated depreciation", true);
    if (!depreciation) {
        return std::unexpected{std::move(depreciation).error()};
    }
    if (depreciation.value() > value.value()) {
        return std::unexpected{LedgerError::validation(fmt::format(
            "Accumulated depreciation {} exceeds the original value {}",
            depreciation.value(), value.value()))};
    }

    std::lock_guard lock{m_createMtx};
    if (!request.code.empty() && findByCode(request.code).has_value()) {
        return std::unexpected{LedgerError::validation(
            fmt::format("Account code '{}' is already in use", request.code))};
    }
    BalanceAccount account{
        nextAccountId(),
        request.code,
        std::move(name),
        AccountKind::ASSET_FIXED,
        value.value() - depreciation.value()};
    account.description() = request.description;
    account.originalValue() = value.value();
    account.accumulatedDepreciation() = depreciation.value();
    m_accounts.insert(account.id(), Slot{.account = account, .entries = {}});
    return account;
}

//-------------------------------------------------------------------------

Expected<BalanceAccount> BalanceAccountStore::createDebt(const DebtAccountRequest& request)
{
    auto name = boost::algorithm::trim_copy(request.name);
    auto creditor = boost::algorithm::trim_copy(request.creditor);
    if (name.empty() || creditor.empty()) {
        return std::unexpected{
            LedgerError::validation("Debt requires a name and a creditor")};
    }
    auto amount = validateAmount(request.amount, "Debt amount");
    if (!amount) {
        return std::unexpected{std::move(amount).error()};
    }

    std::lock_guard lock{m_createMtx};
    if (!request.code.empty() && findByCode(request.code).has_value()) {
        return std::unexpected{LedgerError::validation(
            fmt::format("Account code '{}' is already in use", request.code))};
    }
    BalanceAccount account{
        nextAccountId(),
        request.code,
        std::move(name),
        request.longTerm ? AccountKind::LIABILITY_LONG : AccountKind::LIABILITY_CURRENT,
        amount.value()};
    account.description() = request.description;
    account.creditor() = std::move(creditor);
    m_accounts.insert(account.id(), Slot{.account = account, .entries = {}});
    return account;
}

//-------------------------------------------------------------------------

bool BalanceAccountStore::contains(AccountId accountId) const
{
    return m_accounts.contains(accountId);
}

//-------------------------------------------------------------------------

Expected<BalanceAccount> BalanceAccountStore::getAccount(AccountId accountId) const
{
    return m_accounts.acquire(accountId).transform([](const auto& handle) {
        return handle->account;
    });
}

//-------------------------------------------------------------------------

Expected<BalanceAccount> BalanceAccountStore::findByCode(std::string_view code) const
{
    for (AccountId id : m_accounts.ids()) {
        auto account = getAccount(id);
        if (!account) {
            return std::unexpected{std::move(account).error()};
        }
        if (account->code() == code) {
            return account;
        }
    }
    return std::unexpected{
        LedgerError::notFound(fmt::format("Account with code '{}' does not exist", code))};
}

//-------------------------------------------------------------------------

Expected<decimal_t> BalanceAccountStore::getBalance(AccountId accountId) const
{
    return m_accounts.acquire(accountId).transform([](const auto& handle) {
        return handle->account.balance();
    });
}

//-------------------------------------------------------------------------

Expected<std::vector<BalanceAccount>> BalanceAccountStore::listAccounts(
    std::optional<AccountKind> kind) const
{
    std::vector<BalanceAccount> accounts;
    for (AccountId id : m_accounts.ids()) {
        auto account = getAccount(id);
        if (!account) {
            return std::unexpected{std::move(account).error()};
        }
        if (!kind.has_value() || account->kind() == kind.value()) {
            accounts.push_back(std::move(account).value());
        }
    }
    return accounts;
}

//-------------------------------------------------------------------------

Expected<std::vector<BalanceEntry>> BalanceAccountStore::entries(AccountId accountId) const
{
    return m_accounts.acquire(accountId).transform([](const auto& handle) {
        return handle->entries;
    });
}

//-------------------------------------------------------------------------

Expected<CashBalances> BalanceAccountStore::cashBalances() const
{
    return listAccounts().transform([](std::vector<BalanceAccount> accounts) {
        CashBalances balances;
        for (auto& account : accounts) {
            switch (account.kind()) {
                case AccountKind::CASH_PRIMARY:
                    balances.cashPrimary += account.balance();
                    break;
                case AccountKind::CASH_SECONDARY:
                    balances.cashSecondary += account.balance();
                    break;
                case AccountKind::DIGITAL_WALLET:
                    balances.digitalWallet += account.balance();
                    break;
                case AccountKind::BANK:
                    balances.bank += account.balance();
                    break;
                default:
                    continue;
            }
            balances.accounts.push_back(std::move(account));
        }
        return balances;
    });
}

//-------------------------------------------------------------------------

Expected<BalanceEntry> BalanceAccountStore::debit(
    AccountId accountId, decimal_t amount, std::string description, std::string reference)
{
    return apply({Movement{
        .accountId = accountId,
        .kind = EntryKind::DEBIT,
        .amount = amount,
        .description = std::move(description),
        .reference = std::move(reference)
    }}).transform([](std::vector<BalanceEntry> entries) { return std::move(entries.front()); });
}

//-------------------------------------------------------------------------

Expected<BalanceEntry> BalanceAccountStore::credit(
    AccountId accountId, decimal_t amount, std::string description, std::string reference)
{
    return apply({Movement{
        .accountId = accountId,
        .kind = EntryKind::CREDIT,
        .amount = amount,
        .description = std::move(description),
        .reference = std::move(reference)
    }}).transform([](std::vector<BalanceEntry> entries) { return std::move(entries.front()); });
}

//-------------------------------------------------------------------------

Expected<std::optional<BalanceEntry>> BalanceAccountStore::setBalance(
    AccountId accountId, decimal_t newBalance, std::string reason)
{
    if (auto valid = validateMoney(newBalance, "New balance"); !valid) {
        return std::unexpected{std::move(valid).error()};
    }
    BalanceEntry entry;
    {
        auto handle = m_accounts.acquire(accountId);
        if (!handle) {
            return std::unexpected{std::move(handle).error()};
        }
        Slot& slot = **handle;
        if (slot.account.balance() == newBalance) {
            return std::nullopt;
        }
        const decimal_t difference = slot.account.setBalance(newBalance);
        boost::algorithm::trim(reason);
        entry = record(
            slot,
            makeEntry(
                slot.account,
                EntryKind::MANUAL_SET,
                difference,
                reason.empty() ? "Manual balance adjustment" : std::move(reason),
                "MANUAL"));
    }
    m_signals.entry(entry);
    return entry;
}

//-------------------------------------------------------------------------

Expected<std::vector<BalanceEntry>> BalanceAccountStore::apply(std::vector<Movement> movements)
{
    if (movements.empty()) {
        return std::unexpected{LedgerError::validation("No movements to apply")};
    }
    for (const auto& movement : movements) {
        if (movement.kind == EntryKind::MANUAL_SET) {
            return std::unexpected{LedgerError::validation(
                "Manual balance overrides go through setBalance")};
        }
        if (auto valid = validateAmount(movement.amount, "Amount"); !valid) {
            return std::unexpected{std::move(valid).error()};
        }
    }

    auto handles = m_accounts.acquireAll(
        movements
        | views::transform(&Movement::accountId)
        | ranges::to<std::vector>);
    if (!handles) {
        return std::unexpected{std::move(handles).error()};
    }

    // Stage on copies so a failing movement leaves every account untouched.
    std::map<AccountId, BalanceAccount> staged;
    for (const auto& handle : handles.value()) {
        staged.emplace(handle.id(), handle->account);
    }
    std::vector<BalanceEntry> entries;
    entries.reserve(movements.size());
    for (auto& movement : movements) {
        auto& account = staged.at(movement.accountId);
        if (movement.kind == EntryKind::DEBIT) {
            if (auto res = account.debit(movement.amount); !res) {
                return std::unexpected{std::move(res).error()};
            }
        } else {
            if (auto res = account.credit(movement.amount); !res) {
                return std::unexpected{std::move(res).error()};
            }
        }
        entries.push_back(makeEntry(
            account,
            movement.kind,
            movement.kind == EntryKind::DEBIT ? -movement.amount : movement.amount,
            std::move(movement.description),
            std::move(movement.reference)));
    }

    for (const auto& handle : handles.value()) {
        handle->account = staged.at(handle.id());
    }
    for (auto& entry : entries) {
        auto it = ranges::find_if(
            handles.value(), [&](const auto& handle) { return handle.id() == entry.accountId; });
        entry = record(**it, std::move(entry));
    }
    // Subscribers run without any account lock held.
    handles->clear();
    for (const auto& entry : entries) {
        m_signals.entry(entry);
    }
    return entries;
}

//-------------------------------------------------------------------------

void BalanceAccountStore::checkpointSerialize(
    rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember(
            "next_entry_id", rapidjson::Value{m_entryIdCounter.load()}, allocator);
        rapidjson::Value accountsJson{rapidjson::kArrayType};
        for (AccountId id : m_accounts.ids()) {
            auto handle = m_accounts.acquire(id);
            if (!handle) {
                throw std::runtime_error{fmt::format(
                    "{}: Unable to checkpoint account #{}: {}",
                    std::source_location::current().function_name(), id, handle.error())};
            }
            rapidjson::Document slotJson{&allocator};
            slotJson.SetObject();
            (*handle)->account.jsonSerialize(slotJson, "account");
            json::serializeArray(slotJson, "entries", (*handle)->entries);
            accountsJson.PushBack(slotJson, allocator);
        }
        json.AddMember("accounts", accountsJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void BalanceAccountStore::restore(const rapidjson::Value& json)
{
    EntryId maxEntryId{};
    for (const auto& slotJson : json["accounts"].GetArray()) {
        auto account = BalanceAccount::fromJson(slotJson["account"]);
        std::vector<BalanceEntry> entries;
        for (const auto& entryJson : slotJson["entries"].GetArray()) {
            entries.push_back(BalanceEntry::fromJson(entryJson));
            maxEntryId = std::max(maxEntryId, entries.back().id);
        }
        const AccountId id = account.id();
        if (m_accounts.contains(id)) {
            auto handle = m_accounts.acquire(id);
            if (!handle) {
                throw std::runtime_error{fmt::format(
                    "{}: Unable to restore account #{}: {}",
                    std::source_location::current().function_name(), id, handle.error())};
            }
            **handle = Slot{.account = std::move(account), .entries = std::move(entries)};
        } else {
            m_accounts.insert(
                id, Slot{.account = std::move(account), .entries = std::move(entries)});
        }
    }
    m_entryIdCounter = std::max(maxEntryId + 1, json::getUint(json["next_entry_id"]));
}

//-------------------------------------------------------------------------

BalanceEntry BalanceAccountStore::makeEntry(
    const BalanceAccount& account,
    EntryKind kind,
    decimal_t signedAmount,
    std::string description,
    std::string reference) const
{
    BalanceEntry entry;
    entry.accountId = account.id();
    entry.kind = kind;
    entry.amount = signedAmount;
    entry.balanceAfter = account.balance();
    entry.description = std::move(description);
    entry.reference = std::move(reference);
    entry.createdAt = m_clock();
    return entry;
}

//-------------------------------------------------------------------------

BalanceEntry BalanceAccountStore::record(Slot& slot, BalanceEntry entry)
{
    entry.id = m_entryIdCounter++;
    slot.entries.push_back(std::move(entry));
    return slot.entries.back();
}

//-------------------------------------------------------------------------

AccountId BalanceAccountStore::nextAccountId() const
{
    const auto ids = m_accounts.ids();
    return ids.empty() ? AccountId{1} : ids.back() + 1;
}

//-------------------------------------------------------------------------

void BalanceAccountStore::ensureUniqueCode(std::string_view code) const
{
    if (!code.empty() && findByCode(code).has_value()) {
        throw std::invalid_argument{fmt::format(
            "{}: Account code '{}' is already in use",
            std::source_location::current().function_name(), code)};
    }
}

//-------------------------------------------------------------------------

}  // namespace uniledger::accounting

//-------------------------------------------------------------------------
