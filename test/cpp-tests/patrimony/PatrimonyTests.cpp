/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Ledger.hpp"
#include "test-common/fixtures.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <algorithm>
#include <array>
#include <random>

//-------------------------------------------------------------------------

using namespace uniledger;
using namespace uniledger::patrimony;
using namespace uniledger::literals;
using namespace uniledger::test;

using namespace testing;

//-------------------------------------------------------------------------

TEST(InventoryValuationTest, EstimatesMissingCostFromPrice)
{
    const InventoryValuation inventory{{.costMargin = DEC(0.80)}, makeShopInventory()};
    const auto value = inventory.value();

    EXPECT_EQ(value.totalUnits, 15);
    EXPECT_EQ(value.totalValue, 18'000_dec);
    EXPECT_EQ(value.itemsWithCost, 1);
    EXPECT_EQ(value.itemsEstimated, 1);
    EXPECT_EQ(value.costMargin, DEC(0.80));

    ASSERT_EQ(value.breakdown.size(), 2);
    EXPECT_EQ(value.breakdown[0].code, "CAM-08");
    EXPECT_FALSE(value.breakdown[0].isEstimated);
    EXPECT_EQ(value.breakdown[1].code, "PAN-10");
    EXPECT_TRUE(value.breakdown[1].isEstimated);
    EXPECT_EQ(value.breakdown[1].unitCost, 1'600_dec);
    EXPECT_EQ(value.breakdown[1].value, 8'000_dec);
}

TEST(InventoryValuationTest, EstimatedCostKeepsCents)
{
    const InventoryValuation inventory{
        {.costMargin = DEC(0.80)},
        {InventoryItem{
            .code = "CHA-01", .name = "Chaqueta", .quantity = 3, .unitCost = {}, .price = DEC(1999.99)
        }}};
    const auto value = inventory.value();
    ASSERT_EQ(value.breakdown.size(), 1);
    EXPECT_EQ(value.breakdown.front().unitCost, DEC(1599.99));
    EXPECT_EQ(value.totalValue, DEC(4799.97));
}

TEST(InventoryValuationTest, EmptyInventoryIsWorthNothing)
{
    const InventoryValuation inventory{{}, {}};
    EXPECT_EQ(inventory.value().totalValue, 0_dec);
    EXPECT_THAT(inventory.value().breakdown, IsEmpty());
}

struct InvalidCostMarginTest : TestWithParam<decimal_t> {};

TEST_P(InvalidCostMarginTest, IsRejected)
{
    EXPECT_THROW(
        (InventoryValuation{{.costMargin = GetParam()}, makeShopInventory()}),
        std::invalid_argument);
}

INSTANTIATE_TEST_SUITE_P(
    InventoryValuationTest,
    InvalidCostMarginTest,
    Values(0_dec, -DEC(0.5), DEC(1.01)));

//-------------------------------------------------------------------------

struct PatrimonyTest : Test
{
    PatrimonySnapshot snapshot() const
    {
        auto snapshot = ledger.patrimony().snapshot();
        EXPECT_TRUE(snapshot.has_value());
        return snapshot.value();
    }

    ManualClock clock{at("2026-03-01T12:00:00Z")};
    Ledger ledger{makeShopConfig(), clock};
};

//-------------------------------------------------------------------------

TEST_F(PatrimonyTest, AggregatesEveryStore)
{
    const auto patrimony = snapshot();

    EXPECT_EQ(patrimony.assets.liquid.cashTotal(), 250'000_dec);
    EXPECT_EQ(patrimony.assets.liquid.digitalTotal(), 1'030'000_dec);
    EXPECT_EQ(patrimony.assets.liquid.liquidTotal(), 1'280'000_dec);
    EXPECT_EQ(patrimony.assets.inventory.totalValue, 18'000_dec);
    EXPECT_EQ(patrimony.assets.fixed, 4'500'000_dec);
    EXPECT_EQ(patrimony.assets.current, 1'298'000_dec);
    EXPECT_EQ(patrimony.assets.total, 5'798'000_dec);

    EXPECT_EQ(patrimony.liabilities.currentAccounts, 300'000_dec);
    EXPECT_EQ(patrimony.liabilities.total, 300'000_dec);

    EXPECT_EQ(patrimony.netPatrimony, 5'498'000_dec);
    EXPECT_TRUE(patrimony.isPositive());
    EXPECT_EQ(patrimony.generatedAt, day("2026-03-01"));

    ASSERT_EQ(patrimony.equityAccounts.size(), 1);
    EXPECT_EQ(patrimony.equityAccounts.front().id(), kCapital);
}

TEST_F(PatrimonyTest, CountsDebtsAndPendingExpenses)
{
    ASSERT_TRUE(ledger.debts().create(
        debt::DebtKind::RECEIVABLE,
        debt::DebtRequest{
            .description = "Venta a credito",
            .amount = 50'000_dec,
            .invoiceDate = {},
            .dueDate = {},
            .counterparty = "Cliente",
            .invoiceNumber = "",
            .notes = ""
        }));
    ASSERT_TRUE(ledger.debts().create(
        debt::DebtKind::PAYABLE,
        debt::DebtRequest{
            .description = "Compra de hilo",
            .amount = 20'000_dec,
            .invoiceDate = {},
            .dueDate = {},
            .counterparty = "Hilos SAS",
            .invoiceNumber = "",
            .notes = ""
        }));
    const auto expense = ledger.expenses().createExpense(ledger::ExpenseRequest{
        .category = ledger::ExpenseCategory::UTILITIES,
        .description = "Energia",
        .amount = 100'000_dec,
        .dueDate = {},
        .expenseDate = {},
        .vendor = "",
        .receiptNumber = "",
        .notes = ""
    });
    ASSERT_TRUE(expense.has_value());
    ASSERT_TRUE(ledger.accounts().createDebt(accounting::DebtAccountRequest{
        .name = "Credito bancario",
        .code = "2501",
        .amount = 2'000'000_dec,
        .creditor = "Banco",
        .longTerm = true,
        .description = ""
    }));

    const auto before = snapshot();
    EXPECT_EQ(before.assets.receivables.pendingTotal, 50'000_dec);
    EXPECT_EQ(before.liabilities.payables.pendingTotal, 20'000_dec);
    EXPECT_EQ(before.liabilities.pendingExpenses, 100'000_dec);
    EXPECT_EQ(before.liabilities.pendingExpenseCount, 1);
    EXPECT_EQ(before.liabilities.longTerm, 2'000'000_dec);
    EXPECT_EQ(before.liabilities.current, 420'000_dec);
    EXPECT_EQ(before.netPatrimony, 5'498'000_dec + 50'000_dec - 20'000_dec - 100'000_dec - 2'000'000_dec);
    EXPECT_EQ(before.netPatrimony, before.assets.total - before.liabilities.total);

    // Paying an expense moves value between two sides of the equation.
    ASSERT_TRUE(ledger.expenses().payExpense(
        expense->id,
        ledger::PaymentRequest{
            .amount = 40'000_dec, .accountId = kBank, .method = {}, .useFallback = false
        }));
    const auto after = snapshot();
    EXPECT_EQ(after.assets.liquid.bank, 960'000_dec);
    EXPECT_EQ(after.liabilities.pendingExpenses, 60'000_dec);
    EXPECT_EQ(after.netPatrimony, before.netPatrimony);
}

TEST_F(PatrimonyTest, FollowsDepreciation)
{
    ASSERT_TRUE(ledger.accounts().createFixedAsset(accounting::FixedAssetRequest{
        .name = "Mostrador",
        .code = "1502",
        .value = 800'000_dec,
        .accumulatedDepreciation = 200'000_dec,
        .description = ""
    }));
    const auto patrimony = snapshot();
    EXPECT_EQ(patrimony.assets.fixed, 5'100'000_dec);
    EXPECT_EQ(patrimony.assets.fixedAccounts.size(), 2);
    EXPECT_EQ(patrimony.netPatrimony, 6'098'000_dec);
}

TEST_F(PatrimonyTest, NegativeWhenLiabilitiesDominate)
{
    ASSERT_TRUE(ledger.accounts().createDebt(accounting::DebtAccountRequest{
        .name = "Hipoteca",
        .code = "",
        .amount = 9'000'000_dec,
        .creditor = "Banco",
        .longTerm = true,
        .description = ""
    }));
    const auto patrimony = snapshot();
    EXPECT_EQ(patrimony.netPatrimony, -3'502'000_dec);
    EXPECT_FALSE(patrimony.isPositive());
}

// Drives a ledger through seeded random operations and checks the equation
// against totals gathered straight from the stores after every step.
struct PatrimonyEquationTest : PatrimonyTest, WithParamInterface<uint32_t>
{
    decimal_t money(uint64_t maxUnits)
    {
        const auto cents = std::uniform_int_distribution<int64_t>{1, int64_t(maxUnits) * 100}(rng);
        return decimal_t{cents} / decimal_t{100};
    }

    AccountId anyLiquidAccount()
    {
        static constexpr std::array kLiquid{kPettyCash, kVaultCash, kWallet, kBank};
        return kLiquid[std::uniform_int_distribution<size_t>{0, kLiquid.size() - 1}(rng)];
    }

    bool coin() { return std::bernoulli_distribution{0.5}(rng); }

    debt::DebtStatement createDebtRecord(debt::DebtKind kind)
    {
        auto statement = ledger.debts().create(
            kind,
            debt::DebtRequest{
                .description = "Factura",
                .amount = money(300'000),
                .invoiceDate = {},
                .dueDate = {},
                .counterparty = "Tercero",
                .invoiceNumber = "",
                .notes = ""
            });
        EXPECT_TRUE(statement.has_value());
        return statement.value();
    }

    void step()
    {
        switch (std::uniform_int_distribution<int>{0, 5}(rng)) {
            case 0: {
                const auto expense = ledger.expenses().createExpense(ledger::ExpenseRequest{
                    .category = ledger::ExpenseCategory::SUPPLIES,
                    .description = "Compra",
                    .amount = money(200'000),
                    .dueDate = {},
                    .expenseDate = {},
                    .vendor = "",
                    .receiptNumber = "",
                    .notes = ""
                });
                ASSERT_TRUE(expense.has_value());
                if (coin()) {
                    // Refusals are fine here, only the equation matters.
                    static_cast<void>(ledger.expenses().payExpense(
                        expense->id,
                        ledger::PaymentRequest{
                            .amount = std::min(money(200'000), expense->amount),
                            .accountId = anyLiquidAccount(),
                            .method = {},
                            .useFallback = coin()
                        }));
                }
                break;
            }
            case 1:
            case 2: {
                const auto kind = coin() ? debt::DebtKind::RECEIVABLE : debt::DebtKind::PAYABLE;
                const auto created = createDebtRecord(kind);
                if (coin()) {
                    static_cast<void>(ledger.debts().recordPayment(
                        kind,
                        created.debt.id,
                        debt::DebtPayment{
                            .amount = std::min(money(300'000), created.debt.amount),
                            .method = ledger::PaymentMethod::TRANSFER,
                            .accountId = coin() ? std::make_optional(anyLiquidAccount())
                                                : std::nullopt
                        }));
                }
                break;
            }
            case 3: {
                const decimal_t target = coin() ? money(500'000) : -money(50'000);
                ASSERT_TRUE(ledger.accounts().setBalance(anyLiquidAccount(), target, "Arqueo"));
                break;
            }
            case 4: {
                const decimal_t value = money(1'000'000);
                ASSERT_TRUE(ledger.accounts().createFixedAsset(accounting::FixedAssetRequest{
                    .name = "Activo",
                    .code = "",
                    .value = value,
                    .accumulatedDepreciation = coin() ? std::min(money(1'000'000), value) : 0_dec,
                    .description = ""
                }));
                break;
            }
            case 5: {
                ASSERT_TRUE(ledger.accounts().createDebt(accounting::DebtAccountRequest{
                    .name = "Obligacion",
                    .code = "",
                    .amount = money(2'000'000),
                    .creditor = "Banco",
                    .longTerm = coin(),
                    .description = ""
                }));
                break;
            }
        }
    }

    decimal_t netFromStores() const
    {
        using accounting::AccountKind;

        decimal_t net = ledger.inventory().value().totalValue;
        for (const auto& account : ledger.accounts().listAccounts().value()) {
            if (account.isLiquid() || account.kind() == AccountKind::ASSET_OTHER) {
                net += account.balance();
            } else if (account.kind() == AccountKind::ASSET_FIXED) {
                net += account.netValue();
            } else if (account.kind() == AccountKind::LIABILITY_CURRENT
                || account.kind() == AccountKind::LIABILITY_LONG) {
                net -= account.balance();
            }
        }
        for (const auto& statement : ledger.debts().list(debt::DebtKind::RECEIVABLE, true).value()) {
            net += statement.debt.balance();
        }
        for (const auto& statement : ledger.debts().list(debt::DebtKind::PAYABLE, true).value()) {
            net -= statement.debt.balance();
        }
        for (const auto& expense : ledger.expenses().pendingExpenses().value()) {
            net -= expense.balance();
        }
        return net;
    }

    std::mt19937 rng{GetParam()};
};

TEST_P(PatrimonyEquationTest, HoldsAfterEveryOperation)
{
    static constexpr int kSteps = 30;
    for (int i = 0; i < kSteps; ++i) {
        ASSERT_NO_FATAL_FAILURE(step());
        const auto patrimony = snapshot();
        ASSERT_EQ(patrimony.netPatrimony, patrimony.assets.total - patrimony.liabilities.total)
            << "after step " << i;
        ASSERT_EQ(
            patrimony.assets.total,
            patrimony.assets.current + patrimony.assets.fixed + patrimony.assets.other)
            << "after step " << i;
        ASSERT_EQ(
            patrimony.liabilities.total,
            patrimony.liabilities.current + patrimony.liabilities.longTerm)
            << "after step " << i;
        ASSERT_EQ(patrimony.netPatrimony, netFromStores()) << "after step " << i;
    }
}

INSTANTIATE_TEST_SUITE_P(PatrimonyTest, PatrimonyEquationTest, Range(1u, 21u));

//-------------------------------------------------------------------------
