/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "PatrimonyAggregator.hpp"

//-------------------------------------------------------------------------

namespace uniledger::patrimony
{

//-------------------------------------------------------------------------

PatrimonyAggregator::PatrimonyAggregator(
    const accounting::BalanceAccountStore* accounts,
    const ledger::ExpenseLedger* expenses,
    const debt::DebtLedger* debts,
    const InventoryValuation* inventory,
    Clock clock) noexcept
    : m_accounts{accounts},
      m_expenses{expenses},
      m_debts{debts},
      m_inventory{inventory},
      m_clock{std::move(clock)}
{}

//-------------------------------------------------------------------------

Expected<PatrimonySnapshot> PatrimonyAggregator::snapshot() const
{
    using accounting::AccountKind;

    auto accounts = m_accounts->listAccounts();
    if (!accounts) {
        return std::unexpected{std::move(accounts).error()};
    }
    auto receivables = m_debts->totals(debt::DebtKind::RECEIVABLE);
    if (!receivables) {
        return std::unexpected{std::move(receivables).error()};
    }
    auto payables = m_debts->totals(debt::DebtKind::PAYABLE);
    if (!payables) {
        return std::unexpected{std::move(payables).error()};
    }
    auto pendingExpenses = m_expenses->pendingExpenses();
    if (!pendingExpenses) {
        return std::unexpected{std::move(pendingExpenses).error()};
    }

    PatrimonySnapshot snapshot;
    auto& assets = snapshot.assets;
    auto& liabilities = snapshot.liabilities;

    for (auto& account : accounts.value()) {
        switch (account.kind()) {
            case AccountKind::CASH_PRIMARY:
                assets.liquid.cashPrimary += account.balance();
                assets.liquid.accounts.push_back(std::move(account));
                break;
            case AccountKind::CASH_SECONDARY:
                assets.liquid.cashSecondary += account.balance();
                assets.liquid.accounts.push_back(std::move(account));
                break;
            case AccountKind::DIGITAL_WALLET:
                assets.liquid.digitalWallet += account.balance();
                assets.liquid.accounts.push_back(std::move(account));
                break;
            case AccountKind::BANK:
                assets.liquid.bank += account.balance();
                assets.liquid.accounts.push_back(std::move(account));
                break;
            case AccountKind::ASSET_FIXED:
                assets.fixed += account.netValue();
                assets.fixedAccounts.push_back(std::move(account));
                break;
            case AccountKind::ASSET_OTHER:
                assets.other += account.balance();
                assets.otherAccounts.push_back(std::move(account));
                break;
            case AccountKind::LIABILITY_CURRENT:
                liabilities.currentAccounts += account.balance();
                liabilities.accounts.push_back(std::move(account));
                break;
            case AccountKind::LIABILITY_LONG:
                liabilities.longTerm += account.balance();
                liabilities.accounts.push_back(std::move(account));
                break;
            case AccountKind::EQUITY:
                snapshot.equityAccounts.push_back(std::move(account));
                break;
        }
    }

    assets.inventory = m_inventory->value();
    assets.receivables = std::move(receivables).value();
    assets.current =
        assets.liquid.liquidTotal() + assets.inventory.totalValue + assets.receivables.pendingTotal;
    assets.total = assets.current + assets.fixed + assets.other;

    liabilities.payables = std::move(payables).value();
    liabilities.pendingExpenseCount = static_cast<uint32_t>(pendingExpenses->size());
    liabilities.pendingExpenses = ranges::accumulate(
        pendingExpenses.value() | views::transform(&ledger::Expense::balance), decimal_t{});
    liabilities.current =
        liabilities.currentAccounts + liabilities.payables.pendingTotal + liabilities.pendingExpenses;
    liabilities.total = liabilities.current + liabilities.longTerm;

    snapshot.netPatrimony = assets.total - liabilities.total;
    snapshot.generatedAt = util::toDate(m_clock());

    // Same components in a different grouping. Decimal64 rounds past 16 significant digits.
    const decimal_t recombined =
        (assets.liquid.cashTotal() - liabilities.currentAccounts)
        + (assets.liquid.digitalTotal() - liabilities.payables.pendingTotal)
        + (assets.inventory.totalValue - liabilities.pendingExpenses)
        + (assets.receivables.pendingTotal - liabilities.longTerm)
        + assets.fixed
        + assets.other;
    if (recombined != snapshot.netPatrimony) {
        throw std::runtime_error{fmt::format(
            "{}: Patrimony equation violated: assets {} - liabilities {} = {}, components give {}",
            std::source_location::current().function_name(),
            assets.total,
            liabilities.total,
            snapshot.netPatrimony,
            recombined)};
    }

    return snapshot;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::patrimony

//-------------------------------------------------------------------------
