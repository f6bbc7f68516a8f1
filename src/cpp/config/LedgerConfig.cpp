/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "LedgerConfig.hpp"

#include <limits>
#include <set>

//-------------------------------------------------------------------------

namespace uniledger::config
{

//-------------------------------------------------------------------------

namespace
{

[[nodiscard]] ServerConfig makeServerConfig(pugi::xml_node node, std::source_location sl)
{
    ServerConfig config;
    if (!node) return config;
    config.host = node.attribute("host").as_string(config.host.c_str());
    const auto port = node.attribute("port").as_uint(config.port);
    if (port == 0 || port > std::numeric_limits<uint16_t>::max()) {
        throw std::invalid_argument{fmt::format(
            "{}: 'port' must lie in [1, 65535], was {}", sl.function_name(), port)};
    }
    config.port = static_cast<uint16_t>(port);
    config.threads = node.attribute("threads").as_uint(config.threads);
    if (config.threads == 0) {
        throw std::invalid_argument{fmt::format(
            "{}: 'threads' must be positive", sl.function_name())};
    }
    return config;
}

//-------------------------------------------------------------------------

[[nodiscard]] PolicyConfig makePolicyConfig(pugi::xml_node node)
{
    PolicyConfig config;
    if (!node) return config;
    config.lockTimeout = std::chrono::milliseconds{
        node.attribute("lockTimeoutMs").as_uint(static_cast<uint32_t>(config.lockTimeout.count()))};
    config.minDescriptionLength =
        node.attribute("minDescriptionLength").as_uint(
            static_cast<uint32_t>(config.minDescriptionLength));
    return config;
}

//-------------------------------------------------------------------------

[[nodiscard]] LoggingConfig makeLoggingConfig(pugi::xml_node node)
{
    LoggingConfig config;
    if (!node) return config;
    config.dir = node.attribute("dir").as_string(config.dir.c_str());
    config.level = node.attribute("level").as_string(config.level.c_str());
    return config;
}

//-------------------------------------------------------------------------

[[nodiscard]] std::vector<accounting::BalanceAccount> makeAccounts(
    pugi::xml_node node, std::source_location sl)
{
    std::vector<accounting::BalanceAccount> accounts;
    std::set<AccountId> ids;
    for (pugi::xml_node accountNode : node.children("Account")) {
        auto account = accounting::BalanceAccount::fromXML(accountNode);
        if (account.id() == 0 || !ids.insert(account.id()).second) {
            throw std::invalid_argument{fmt::format(
                "{}: Account ids must be positive and unique, got {}",
                sl.function_name(), account.id())};
        }
        accounts.push_back(std::move(account));
    }
    return accounts;
}

//-------------------------------------------------------------------------

[[nodiscard]] ledger::CashFallbackResolver::Parameters makePaymentParameters(
    pugi::xml_node fallbackNode, pugi::xml_node methodsNode, std::source_location sl)
{
    ledger::CashFallbackResolver::Parameters params;
    for (pugi::xml_node pair : fallbackNode.children("Pair")) {
        const AccountId primary = pair.attribute("primary").as_uint();
        const AccountId fallback = pair.attribute("fallback").as_uint();
        if (primary == 0 || fallback == 0) {
            throw std::invalid_argument{fmt::format(
                "{}: Fallback pair requires 'primary' and 'fallback' account ids",
                sl.function_name())};
        }
        if (!params.fallbacks.emplace(primary, fallback).second) {
            throw std::invalid_argument{fmt::format(
                "{}: Account #{} has more than one fallback", sl.function_name(), primary)};
        }
    }
    for (pugi::xml_attribute attr : methodsNode.attributes()) {
        params.methodAccounts[requireEnum<ledger::PaymentMethod>(attr.name(), sl)] =
            attr.as_uint();
    }
    return params;
}

}  // namespace

//-------------------------------------------------------------------------

LedgerConfig makeLedgerConfig(pugi::xml_node node)
{
    static constexpr auto sl = std::source_location::current();

    if (std::string_view{node.name()} != "Ledger") {
        throw std::invalid_argument{fmt::format(
            "{}: Expected a <Ledger> root element, got <{}>", sl.function_name(), node.name())};
    }

    LedgerConfig config;
    config.server = makeServerConfig(node.child("Server"), sl);
    config.policy = makePolicyConfig(node.child("Policy"));
    config.logging = makeLoggingConfig(node.child("Logging"));
    if (auto attr = node.child("Checkpoint").attribute("path")) {
        config.checkpoint = attr.as_string();
    }
    config.accounts = makeAccounts(node.child("Accounts"), sl);
    config.payments =
        makePaymentParameters(node.child("CashFallback"), node.child("PaymentMethods"), sl);

    pugi::xml_node inventoryNode = node.child("Inventory");
    if (auto attr = inventoryNode.attribute("costMargin")) {
        const auto margin = util::parseDecimal(attr.as_string());
        if (!margin.has_value()) {
            throw std::invalid_argument{fmt::format(
                "{}: 'costMargin' {} is not a decimal", sl.function_name(), attr.as_string())};
        }
        config.inventory.costMargin = margin.value();
    }
    for (pugi::xml_node itemNode : inventoryNode.children("Item")) {
        config.inventoryItems.push_back(patrimony::InventoryItem::fromXML(itemNode));
    }

    return config;
}

//-------------------------------------------------------------------------

LedgerConfig loadLedgerConfig(const fs::path& path)
{
    pugi::xml_document doc;
    pugi::xml_parse_result result = doc.load_file(path.c_str());
    if (!result) {
        throw std::invalid_argument{fmt::format(
            "{}: Error loading configuration '{}': {} at offset {}",
            std::source_location::current().function_name(),
            path.c_str(),
            result.description(),
            result.offset)};
    }
    return makeLedgerConfig(doc.child("Ledger"));
}

//-------------------------------------------------------------------------

}  // namespace uniledger::config

//-------------------------------------------------------------------------
