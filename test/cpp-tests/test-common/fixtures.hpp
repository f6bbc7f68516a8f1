/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "LedgerConfig.hpp"
#include "test-common/formatting.hpp"

//-------------------------------------------------------------------------

namespace uniledger::test
{

//-------------------------------------------------------------------------

inline constexpr AccountId kPettyCash = 1;
inline constexpr AccountId kVaultCash = 2;
inline constexpr AccountId kWallet = 3;
inline constexpr AccountId kBank = 4;
inline constexpr AccountId kMachinery = 5;
inline constexpr AccountId kSuppliers = 6;
inline constexpr AccountId kCapital = 7;

//-------------------------------------------------------------------------

// Clock whose copies share one settable instant.
class ManualClock
{
public:
    explicit ManualClock(Timestamp start)
        : m_now{std::make_shared<Timestamp>(start)}
    {}

    Timestamp operator()() const { return *m_now; }

    void set(Timestamp ts) { *m_now = ts; }
    void advance(std::chrono::seconds duration) { *m_now += duration; }

private:
    std::shared_ptr<Timestamp> m_now;
};

//-------------------------------------------------------------------------

[[nodiscard]] inline Timestamp at(std::string_view iso)
{
    return util::parseTimestamp(iso).value();
}

[[nodiscard]] inline Date day(std::string_view iso)
{
    return util::parseDate(iso).value();
}

//-------------------------------------------------------------------------

[[nodiscard]] inline std::vector<accounting::BalanceAccount> makeShopAccounts()
{
    using accounting::AccountKind;
    using accounting::BalanceAccount;

    BalanceAccount machinery{kMachinery, "1501", "Maquinaria", AccountKind::ASSET_FIXED, 4'500'000_dec};
    machinery.originalValue() = 6'000'000_dec;
    machinery.accumulatedDepreciation() = 1'500'000_dec;

    BalanceAccount suppliers{
        kSuppliers, "2101", "Proveedores", AccountKind::LIABILITY_CURRENT, 300'000_dec};
    suppliers.creditor() = "Textiles Andinos";

    return {
        BalanceAccount{kPettyCash, "1101", "Caja Menor", AccountKind::CASH_PRIMARY, 50'000_dec},
        BalanceAccount{kVaultCash, "1105", "Caja Mayor", AccountKind::CASH_SECONDARY, 200'000_dec},
        BalanceAccount{kWallet, "1110", "Nequi", AccountKind::DIGITAL_WALLET, 30'000_dec},
        BalanceAccount{kBank, "1102", "Banco", AccountKind::BANK, 1'000'000_dec},
        machinery,
        suppliers,
        BalanceAccount{kCapital, "3101", "Capital", AccountKind::EQUITY, 10'000'000_dec}
    };
}

[[nodiscard]] inline ledger::CashFallbackResolver::Parameters makeShopPayments()
{
    return {
        .fallbacks = {{kPettyCash, kVaultCash}},
        .methodAccounts = {
            {ledger::PaymentMethod::CASH, kPettyCash},
            {ledger::PaymentMethod::TRANSFER, kBank},
            {ledger::PaymentMethod::CARD, kBank}
        }
    };
}

// Inventory worth 18000: 10 x 1000 at known cost plus 5 x (2000 x 0.80) estimated.
[[nodiscard]] inline std::vector<patrimony::InventoryItem> makeShopInventory()
{
    return {
        patrimony::InventoryItem{
            .code = "CAM-08", .name = "Camisa", .quantity = 10, .unitCost = 1000_dec, .price = 1500_dec
        },
        patrimony::InventoryItem{
            .code = "PAN-10", .name = "Pantalon", .quantity = 5, .unitCost = {}, .price = 2000_dec
        },
        patrimony::InventoryItem{
            .code = "SUD-12", .name = "Sudadera", .quantity = 0, .unitCost = {}, .price = 4500_dec
        }
    };
}

[[nodiscard]] inline config::LedgerConfig makeShopConfig()
{
    config::LedgerConfig config;
    config.policy.lockTimeout = std::chrono::milliseconds{250};
    config.policy.minDescriptionLength = 10;
    config.accounts = makeShopAccounts();
    config.payments = makeShopPayments();
    config.inventoryItems = makeShopInventory();
    return config;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::test

//-------------------------------------------------------------------------
