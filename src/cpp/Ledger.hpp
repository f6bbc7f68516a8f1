/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "AdjustmentEngine.hpp"
#include "AdjustmentLogger.hpp"
#include "BalanceEntryLogger.hpp"
#include "DebtLedger.hpp"
#include "LedgerConfig.hpp"
#include "PatrimonyAggregator.hpp"

//-------------------------------------------------------------------------

namespace uniledger
{

//-------------------------------------------------------------------------

// Owns every store of the ledger and wires them together.
class Ledger
{
public:
    explicit Ledger(config::LedgerConfig config, Clock clock = util::systemNow);

    Ledger(const Ledger&) = delete;
    Ledger& operator=(const Ledger&) = delete;

    [[nodiscard]] const config::LedgerConfig& config() const noexcept { return m_config; }

    [[nodiscard]] auto&& accounts(this auto&& self) noexcept { return *self.m_accounts; }
    [[nodiscard]] auto&& resolver(this auto&& self) noexcept { return *self.m_resolver; }
    [[nodiscard]] auto&& expenses(this auto&& self) noexcept { return *self.m_expenses; }
    [[nodiscard]] auto&& adjustments(this auto&& self) noexcept { return *self.m_adjustments; }
    [[nodiscard]] auto&& debts(this auto&& self) noexcept { return *self.m_debts; }
    [[nodiscard]] auto&& inventory(this auto&& self) noexcept { return *self.m_inventory; }
    [[nodiscard]] auto&& patrimony(this auto&& self) noexcept { return *self.m_patrimony; }

    // CSV audit trails of balance entries and adjustment records under logDir.
    void enableAuditLogs(const fs::path& logDir);

    void checkpointSerialize(rapidjson::Document& json, const std::string& key = {}) const;
    void saveCheckpoint(const fs::path& path) const;
    void restoreCheckpoint(const rapidjson::Value& json);

    [[nodiscard]] static std::unique_ptr<Ledger> fromCheckpoint(
        config::LedgerConfig config, const fs::path& path, Clock clock = util::systemNow);

private:
    config::LedgerConfig m_config;
    Clock m_clock;
    std::unique_ptr<accounting::BalanceAccountStore> m_accounts;
    std::unique_ptr<ledger::CashFallbackResolver> m_resolver;
    std::unique_ptr<ledger::ExpenseLedger> m_expenses;
    std::unique_ptr<ledger::AdjustmentEngine> m_adjustments;
    std::unique_ptr<debt::DebtLedger> m_debts;
    std::unique_ptr<patrimony::InventoryValuation> m_inventory;
    std::unique_ptr<patrimony::PatrimonyAggregator> m_patrimony;
    std::unique_ptr<accounting::BalanceEntryLogger> m_balanceEntryLogger;
    std::unique_ptr<ledger::AdjustmentLogger> m_adjustmentLogger;
};

//-------------------------------------------------------------------------

}  // namespace uniledger

//-------------------------------------------------------------------------
