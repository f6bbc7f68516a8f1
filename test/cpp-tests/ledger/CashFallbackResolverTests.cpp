/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "CashFallbackResolver.hpp"
#include "test-common/fixtures.hpp"

#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace uniledger;
using namespace uniledger::ledger;
using namespace uniledger::literals;
using namespace uniledger::test;

using namespace testing;

//-------------------------------------------------------------------------

struct CashFallbackResolverTest : Test
{
    virtual void SetUp() override
    {
        for (auto& account : makeShopAccounts()) {
            store.add(std::move(account));
        }
        resolver = std::make_unique<CashFallbackResolver>(&store, makeShopPayments());
    }

    accounting::BalanceAccountStore store{std::chrono::milliseconds{250}};
    std::unique_ptr<CashFallbackResolver> resolver;
};

//-------------------------------------------------------------------------

struct CheckTestParams
{
    decimal_t amount;
    bool canPay;
    bool fallbackAvailable;
};

void PrintTo(const CheckTestParams& params, std::ostream* os)
{
    *os << fmt::format(
        "{{.amount = {}, .canPay = {}, .fallbackAvailable = {}}}",
        params.amount,
        params.canPay,
        params.fallbackAvailable);
}

struct CheckTest : CashFallbackResolverTest, WithParamInterface<CheckTestParams> {};

TEST_P(CheckTest, WorksCorrectly)
{
    const auto [amount, canPay, fallbackAvailable] = GetParam();
    const auto check = resolver->check(amount, kPettyCash);
    ASSERT_TRUE(check.has_value()) << check.error();
    EXPECT_EQ(check->canPay, canPay);
    EXPECT_EQ(check->fallbackAvailable, fallbackAvailable);
    EXPECT_EQ(check->sourceBalance, 50'000_dec);
    EXPECT_EQ(check->fallbackAccountId, kVaultCash);
    EXPECT_EQ(check->fallbackBalance, 200'000_dec);
}

INSTANTIATE_TEST_SUITE_P(
    CashFallbackResolverTest,
    CheckTest,
    Values(
        CheckTestParams{.amount = 20'000_dec, .canPay = true, .fallbackAvailable = true},
        CheckTestParams{.amount = 50'000_dec, .canPay = true, .fallbackAvailable = true},
        CheckTestParams{.amount = 80'000_dec, .canPay = false, .fallbackAvailable = true},
        CheckTestParams{.amount = 200'000_dec, .canPay = false, .fallbackAvailable = true},
        CheckTestParams{.amount = 250'000_dec, .canPay = false, .fallbackAvailable = false}));

//-------------------------------------------------------------------------

TEST_F(CashFallbackResolverTest, AccountWithoutFallback)
{
    const auto check = resolver->check(10'000_dec, kVaultCash);
    ASSERT_TRUE(check.has_value());
    EXPECT_TRUE(check->canPay);
    EXPECT_FALSE(check->fallbackAvailable);
    EXPECT_FALSE(check->fallbackAccountId.has_value());
}

TEST_F(CashFallbackResolverTest, CheckLeavesBalancesUntouched)
{
    ASSERT_TRUE(resolver->check(80'000_dec, kPettyCash).has_value());
    EXPECT_EQ(store.getBalance(kPettyCash).value(), 50'000_dec);
    EXPECT_EQ(store.getBalance(kVaultCash).value(), 200'000_dec);
    EXPECT_TRUE(store.entries(kPettyCash).value().empty());
}

TEST_F(CashFallbackResolverTest, ChecksByPaymentMethod)
{
    const auto check = resolver->checkForMethod(2'000'000_dec, PaymentMethod::CARD);
    ASSERT_TRUE(check.has_value());
    EXPECT_EQ(check->sourceAccountId, kBank);
    EXPECT_FALSE(check->canPay);

    EXPECT_EQ(
        resolver->checkForMethod(1_dec, PaymentMethod::CREDIT).error().code,
        LedgerErrorCode::VALIDATION_ERROR);
}

TEST_F(CashFallbackResolverTest, RejectsInvalidAmountAndUnknownAccount)
{
    EXPECT_EQ(resolver->check(0_dec, kPettyCash).error().code, LedgerErrorCode::VALIDATION_ERROR);
    EXPECT_EQ(resolver->check(1_dec, 42).error().code, LedgerErrorCode::NOT_FOUND);
}

struct InvalidConfigurationTest
    : CashFallbackResolverTest, WithParamInterface<CashFallbackResolver::Parameters> {};

TEST_P(InvalidConfigurationTest, Throws)
{
    EXPECT_THROW(CashFallbackResolver(&store, GetParam()), std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    CashFallbackResolverTest,
    InvalidConfigurationTest,
    Values(
        CashFallbackResolver::Parameters{.fallbacks = {{kPettyCash, kBank}}, .methodAccounts = {}},
        CashFallbackResolver::Parameters{
            .fallbacks = {{kPettyCash, kPettyCash}}, .methodAccounts = {}},
        CashFallbackResolver::Parameters{.fallbacks = {{kPettyCash, 42}}, .methodAccounts = {}},
        CashFallbackResolver::Parameters{
            .fallbacks = {}, .methodAccounts = {{PaymentMethod::CASH, kMachinery}}}));

//-------------------------------------------------------------------------
