/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "CashFallbackResolver.hpp"
#include "InventoryValuation.hpp"

//-------------------------------------------------------------------------

namespace uniledger::config
{

//-------------------------------------------------------------------------

struct ServerConfig
{
    std::string host = "0.0.0.0";
    uint16_t port = 8080;
    uint32_t threads = 4;
};

struct PolicyConfig
{
    std::chrono::milliseconds lockTimeout{250};
    size_t minDescriptionLength = 10;
};

struct LoggingConfig
{
    fs::path dir = "logs";
    std::string level = "info";
};

struct LedgerConfig
{
    ServerConfig server;
    PolicyConfig policy;
    LoggingConfig logging;
    std::optional<fs::path> checkpoint;
    std::vector<accounting::BalanceAccount> accounts;
    ledger::CashFallbackResolver::Parameters payments;
    patrimony::InventoryValuation::Parameters inventory;
    std::vector<patrimony::InventoryItem> inventoryItems;
};

[[nodiscard]] LedgerConfig makeLedgerConfig(pugi::xml_node node);
[[nodiscard]] LedgerConfig loadLedgerConfig(const fs::path& path);

//-------------------------------------------------------------------------

}  // namespace uniledger::config

//-------------------------------------------------------------------------
