/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "Ledger.hpp"

//-------------------------------------------------------------------------

namespace uniledger
{

//-------------------------------------------------------------------------

namespace
{

inline constexpr uint32_t kCheckpointVersion = 1;

}  // namespace

//-------------------------------------------------------------------------

Ledger::Ledger(config::LedgerConfig config, Clock clock)
    : m_config{std::move(config)}, m_clock{std::move(clock)}
{
    const auto lockTimeout = m_config.policy.lockTimeout;

    m_accounts = std::make_unique<accounting::BalanceAccountStore>(lockTimeout, m_clock);
    for (const auto& account : m_config.accounts) {
        m_accounts->add(account);
    }
    m_resolver = std::make_unique<ledger::CashFallbackResolver>(
        m_accounts.get(), m_config.payments);
    m_expenses = std::make_unique<ledger::ExpenseLedger>(
        m_accounts.get(), m_resolver.get(), lockTimeout, m_clock);
    m_adjustments = std::make_unique<ledger::AdjustmentEngine>(
        m_expenses.get(), m_accounts.get(), m_config.policy.minDescriptionLength, m_clock);
    m_debts = std::make_unique<debt::DebtLedger>(m_accounts.get(), lockTimeout, m_clock);
    m_inventory = std::make_unique<patrimony::InventoryValuation>(
        m_config.inventory, m_config.inventoryItems);
    m_patrimony = std::make_unique<patrimony::PatrimonyAggregator>(
        m_accounts.get(), m_expenses.get(), m_debts.get(), m_inventory.get(), m_clock);
}

//-------------------------------------------------------------------------

void Ledger::enableAuditLogs(const fs::path& logDir)
{
    fs::create_directories(logDir);
    m_balanceEntryLogger = std::make_unique<accounting::BalanceEntryLogger>(
        logDir / "balance-entries.csv", m_accounts->signals().entry);
    m_adjustmentLogger = std::make_unique<ledger::AdjustmentLogger>(
        logDir / "adjustments.csv", m_adjustments->signals().recorded);
}

//-------------------------------------------------------------------------

void Ledger::checkpointSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("version", rapidjson::Value{kCheckpointVersion}, allocator);
        json::setTimestampMember(json, "saved_at", m_clock());
        m_accounts->checkpointSerialize(json, "accounts");
        m_expenses->checkpointSerialize(json, "expenses");
        m_adjustments->checkpointSerialize(json, "adjustments");
        m_debts->checkpointSerialize(json, "debts");
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

void Ledger::saveCheckpoint(const fs::path& path) const
{
    rapidjson::Document json;
    checkpointSerialize(json);
    if (path.has_parent_path()) {
        fs::create_directories(path.parent_path());
    }
    // Written to a sibling file, then renamed over the target.
    const fs::path tmpPath = fs::path{path}.concat(".tmp");
    {
        std::ofstream ofs{tmpPath};
        if (!ofs) {
            throw std::runtime_error{fmt::format(
                "{}: Unable to open '{}' for writing",
                std::source_location::current().function_name(), tmpPath.c_str())};
        }
        json::dumpJson(json, ofs, {.indent = json::IndentOptions{}});
    }
    fs::rename(tmpPath, path);
}

//-------------------------------------------------------------------------

void Ledger::restoreCheckpoint(const rapidjson::Value& json)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    if (!json.IsObject() || !json.HasMember("version")) {
        throw std::invalid_argument{fmt::format("{}: Not a ledger checkpoint", ctx)};
    }
    if (const auto version = json::getUint(json["version"]); version != kCheckpointVersion) {
        throw std::invalid_argument{fmt::format(
            "{}: Unsupported checkpoint version {}, expected {}", ctx, version, kCheckpointVersion)};
    }
    m_accounts->restore(json["accounts"]);
    m_expenses->restore(json["expenses"]);
    m_adjustments->restore(json["adjustments"]);
    m_debts->restore(json["debts"]);
}

//-------------------------------------------------------------------------

std::unique_ptr<Ledger> Ledger::fromCheckpoint(
    config::LedgerConfig config, const fs::path& path, Clock clock)
{
    auto ledger = std::make_unique<Ledger>(std::move(config), std::move(clock));
    ledger->restoreCheckpoint(json::loadJson(path));
    return ledger;
}

//-------------------------------------------------------------------------

}  // namespace uniledger

//-------------------------------------------------------------------------
