/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "BalanceAccountStore.hpp"
#include "test-common/fixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace uniledger;
using namespace uniledger::accounting;
using namespace uniledger::literals;
using namespace uniledger::test;

using namespace testing;

//-------------------------------------------------------------------------

struct BalanceAccountStoreTest : Test
{
    virtual void SetUp() override
    {
        for (auto& account : makeShopAccounts()) {
            store.add(std::move(account));
        }
    }

    ManualClock clock{at("2026-03-01T10:00:00Z")};
    BalanceAccountStore store{std::chrono::milliseconds{250}, clock};
};

//-------------------------------------------------------------------------

TEST_F(BalanceAccountStoreTest, DebitWritesSignedEntry)
{
    const auto entry = store.debit(kPettyCash, 20'000_dec, "Papeleria", "EXP-1");
    ASSERT_TRUE(entry.has_value()) << entry.error();

    EXPECT_EQ(entry->kind, EntryKind::DEBIT);
    EXPECT_EQ(entry->amount, -20'000_dec);
    EXPECT_EQ(entry->balanceAfter, 30'000_dec);
    EXPECT_EQ(entry->reference, "EXP-1");
    EXPECT_EQ(entry->createdAt, at("2026-03-01T10:00:00Z"));
    EXPECT_EQ(store.getBalance(kPettyCash).value(), 30'000_dec);

    const auto entries = store.entries(kPettyCash).value();
    ASSERT_EQ(entries.size(), 1);
    EXPECT_EQ(entries.front().id, entry->id);
}

TEST_F(BalanceAccountStoreTest, CreditWritesSignedEntry)
{
    const auto entry = store.credit(kBank, DEC(1500.25), "Abono", "AR-1");
    ASSERT_TRUE(entry.has_value()) << entry.error();
    EXPECT_EQ(entry->amount, DEC(1500.25));
    EXPECT_EQ(entry->balanceAfter, DEC(1001500.25));
}

TEST_F(BalanceAccountStoreTest, DebitBeyondBalanceFails)
{
    const auto entry = store.debit(kPettyCash, DEC(50000.01), "Arriendo", "EXP-1");
    ASSERT_FALSE(entry.has_value());
    EXPECT_EQ(entry.error().code, LedgerErrorCode::INSUFFICIENT_FUNDS);
    ASSERT_TRUE(entry.error().funds.has_value());
    EXPECT_EQ(entry.error().funds->balance, 50'000_dec);
    EXPECT_EQ(store.getBalance(kPettyCash).value(), 50'000_dec);
    EXPECT_THAT(store.entries(kPettyCash).value(), IsEmpty());
}

TEST_F(BalanceAccountStoreTest, UnknownAccountIsNotFound)
{
    EXPECT_EQ(store.getBalance(42).error().code, LedgerErrorCode::NOT_FOUND);
    EXPECT_EQ(store.credit(42, 1_dec, "x", "y").error().code, LedgerErrorCode::NOT_FOUND);
}

//-------------------------------------------------------------------------

struct InvalidAmountTest : BalanceAccountStoreTest, WithParamInterface<decimal_t> {};

TEST_P(InvalidAmountTest, IsRejected)
{
    const auto amount = GetParam();
    EXPECT_EQ(
        store.debit(kBank, amount, "x", "y").error().code, LedgerErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(
        store.credit(kBank, amount, "x", "y").error().code, LedgerErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(store.getBalance(kBank).value(), 1'000'000_dec);
}

INSTANTIATE_TEST_SUITE_P(
    BalanceAccountStoreTest,
    InvalidAmountTest,
    Values(0_dec, -100_dec, DEC(10.005), -DEC(0.01)));

//-------------------------------------------------------------------------

TEST_F(BalanceAccountStoreTest, ApplyIsAllOrNothing)
{
    const auto result = store.apply({
        Movement{
            .accountId = kPettyCash,
            .kind = EntryKind::CREDIT,
            .amount = 10'000_dec,
            .description = "Return",
            .reference = "ADJ-1"
        },
        Movement{
            .accountId = kWallet,
            .kind = EntryKind::DEBIT,
            .amount = DEC(30000.01),
            .description = "Move",
            .reference = "ADJ-1"
        }
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, LedgerErrorCode::INSUFFICIENT_FUNDS);
    EXPECT_EQ(store.getBalance(kPettyCash).value(), 50'000_dec);
    EXPECT_EQ(store.getBalance(kWallet).value(), 30'000_dec);
    EXPECT_THAT(store.entries(kPettyCash).value(), IsEmpty());
}

TEST_F(BalanceAccountStoreTest, ApplyMovesBetweenAccounts)
{
    const auto result = store.apply({
        Movement{
            .accountId = kBank,
            .kind = EntryKind::CREDIT,
            .amount = 30'000_dec,
            .description = "Return",
            .reference = "ADJ-1"
        },
        Movement{
            .accountId = kPettyCash,
            .kind = EntryKind::DEBIT,
            .amount = 30'000_dec,
            .description = "Move",
            .reference = "ADJ-1"
        }
    });
    ASSERT_TRUE(result.has_value()) << result.error();
    ASSERT_EQ(result->size(), 2);
    EXPECT_EQ(result->at(0).balanceAfter, 1'030'000_dec);
    EXPECT_EQ(result->at(1).balanceAfter, 20'000_dec);
    EXPECT_LT(result->at(0).id, result->at(1).id);
}

TEST_F(BalanceAccountStoreTest, EveryEntryMatchesRunningBalance)
{
    ASSERT_TRUE(store.debit(kBank, 100_dec, "a", "r").has_value());
    ASSERT_TRUE(store.credit(kBank, 250_dec, "b", "r").has_value());
    ASSERT_TRUE(store.setBalance(kBank, 5_dec, "count").has_value());
    ASSERT_TRUE(store.debit(kBank, 5_dec, "c", "r").has_value());

    decimal_t running = 1'000'000_dec;
    for (const auto& entry : store.entries(kBank).value()) {
        running += entry.amount;
        EXPECT_EQ(entry.balanceAfter, running);
    }
    EXPECT_EQ(running, store.getBalance(kBank).value());
}

//-------------------------------------------------------------------------

TEST_F(BalanceAccountStoreTest, SetBalanceRecordsManualEntry)
{
    const auto entry = store.setBalance(kVaultCash, 185'000_dec, "  Arqueo de caja  ");
    ASSERT_TRUE(entry.has_value()) << entry.error();
    ASSERT_TRUE(entry->has_value());
    EXPECT_EQ((*entry)->kind, EntryKind::MANUAL_SET);
    EXPECT_EQ((*entry)->amount, -15'000_dec);
    EXPECT_EQ((*entry)->balanceAfter, 185'000_dec);
    EXPECT_EQ((*entry)->reference, "MANUAL");
    EXPECT_EQ((*entry)->description, "Arqueo de caja");
}

TEST_F(BalanceAccountStoreTest, SetBalanceToSameValueIsNoop)
{
    const auto entry = store.setBalance(kVaultCash, 200'000_dec, "");
    ASSERT_TRUE(entry.has_value());
    EXPECT_FALSE(entry->has_value());
    EXPECT_THAT(store.entries(kVaultCash).value(), IsEmpty());
}

TEST_F(BalanceAccountStoreTest, SetBalanceAllowsNegativeAndDefaultsReason)
{
    const auto entry = store.setBalance(kWallet, -500_dec, "");
    ASSERT_TRUE(entry.has_value() && entry->has_value());
    EXPECT_EQ((*entry)->description, "Manual balance adjustment");
    EXPECT_EQ(store.getBalance(kWallet).value(), -500_dec);
}

//-------------------------------------------------------------------------

TEST_F(BalanceAccountStoreTest, CreatesFixedAssetAtNetValue)
{
    const auto account = store.createFixedAsset(FixedAssetRequest{
        .name = "Maquina de coser",
        .code = "1502",
        .value = 2'000'000_dec,
        .accumulatedDepreciation = 400'000_dec,
        .description = "Industrial"
    });
    ASSERT_TRUE(account.has_value()) << account.error();
    EXPECT_EQ(account->id(), kCapital + 1);
    EXPECT_EQ(account->kind(), AccountKind::ASSET_FIXED);
    EXPECT_EQ(account->balance(), 1'600'000_dec);
    EXPECT_EQ(account->netValue(), 1'600'000_dec);
    EXPECT_EQ(store.findByCode("1502").value().id(), account->id());
}

TEST_F(BalanceAccountStoreTest, RejectsDepreciationAboveValue)
{
    const auto account = store.createFixedAsset(FixedAssetRequest{
        .name = "Mesa",
        .code = "",
        .value = 100_dec,
        .accumulatedDepreciation = 101_dec,
        .description = ""
    });
    EXPECT_EQ(account.error().code, LedgerErrorCode::VALIDATION_ERROR);
}

TEST_F(BalanceAccountStoreTest, RejectsDuplicateCode)
{
    const auto account = store.createDebt(DebtAccountRequest{
        .name = "Prestamo",
        .code = "1101",
        .amount = 1000_dec,
        .creditor = "Banco",
        .longTerm = false,
        .description = ""
    });
    EXPECT_EQ(account.error().code, LedgerErrorCode::VALIDATION_ERROR);
    EXPECT_THROW(
        store.add(BalanceAccount{99, "1102", "Otra", AccountKind::BANK}), std::invalid_argument);
}

TEST_F(BalanceAccountStoreTest, CreatesLongTermDebt)
{
    const auto account = store.createDebt(DebtAccountRequest{
        .name = "Credito local",
        .code = "2501",
        .amount = 5'000'000_dec,
        .creditor = "Banco Popular",
        .longTerm = true,
        .description = "60 cuotas"
    });
    ASSERT_TRUE(account.has_value()) << account.error();
    EXPECT_EQ(account->kind(), AccountKind::LIABILITY_LONG);
    EXPECT_EQ(account->creditor(), "Banco Popular");
}

//-------------------------------------------------------------------------

TEST_F(BalanceAccountStoreTest, GroupsCashBalances)
{
    const auto balances = store.cashBalances();
    ASSERT_TRUE(balances.has_value());
    EXPECT_EQ(balances->cashTotal(), 250'000_dec);
    EXPECT_EQ(balances->digitalTotal(), 1'030'000_dec);
    EXPECT_EQ(balances->liquidTotal(), 1'280'000_dec);
    EXPECT_EQ(balances->accounts.size(), 4);
}

TEST_F(BalanceAccountStoreTest, ListsByKind)
{
    const auto accounts = store.listAccounts(AccountKind::EQUITY).value();
    ASSERT_EQ(accounts.size(), 1);
    EXPECT_EQ(accounts.front().id(), kCapital);
}

TEST_F(BalanceAccountStoreTest, PublishesEntries)
{
    std::vector<EntryId> published;
    bs2::scoped_connection conn = store.signals().entry.connect(
        [&](const BalanceEntry& entry) { published.push_back(entry.id); });

    const auto first = store.debit(kBank, 1_dec, "a", "r").value();
    const auto second = store.setBalance(kBank, 7_dec, "b").value().value();

    EXPECT_THAT(published, ElementsAre(first.id, second.id));
}

TEST_F(BalanceAccountStoreTest, SubscribersRunOutsideAccountLocks)
{
    std::vector<decimal_t> observed;
    bs2::scoped_connection conn = store.signals().entry.connect([&](const BalanceEntry& entry) {
        const auto balance = store.getBalance(entry.accountId);
        ASSERT_TRUE(balance.has_value()) << balance.error();
        observed.push_back(balance.value());
    });

    ASSERT_TRUE(store.apply({
        Movement{
            .accountId = kBank,
            .kind = EntryKind::CREDIT,
            .amount = 30'000_dec,
            .description = "Return",
            .reference = "ADJ-1"
        },
        Movement{
            .accountId = kPettyCash,
            .kind = EntryKind::DEBIT,
            .amount = 30'000_dec,
            .description = "Move",
            .reference = "ADJ-1"
        }
    }));
    ASSERT_TRUE(store.setBalance(kWallet, 12'000_dec, "Arqueo"));

    EXPECT_THAT(observed, ElementsAre(1'030'000_dec, 20'000_dec, 12'000_dec));
}

//-------------------------------------------------------------------------
