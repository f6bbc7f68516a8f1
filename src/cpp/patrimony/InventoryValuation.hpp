/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "JsonSerializable.hpp"
#include "uniledger/accounting/common.hpp"

//-------------------------------------------------------------------------

namespace uniledger::patrimony
{

//-------------------------------------------------------------------------

struct InventoryItem
{
    std::string code;
    std::string name;
    uint64_t quantity{};
    std::optional<decimal_t> unitCost;
    decimal_t price{};

    [[nodiscard]] static InventoryItem fromXML(pugi::xml_node node);
};

//-------------------------------------------------------------------------

struct InventoryLine
{
    std::string code;
    std::string name;
    uint64_t quantity{};
    decimal_t unitCost{};
    bool isEstimated{};
    decimal_t value{};
};

struct InventoryValue : public JsonSerializable
{
    uint64_t totalUnits{};
    decimal_t totalValue{};
    uint32_t itemsWithCost{};
    uint32_t itemsEstimated{};
    decimal_t costMargin{};
    std::vector<InventoryLine> breakdown;

    virtual void jsonSerialize(
        rapidjson::Document& json, const std::string& key = {}) const override;
};

//-------------------------------------------------------------------------

// Items are valued at quantity x unit cost; without a known cost the unit cost
// is estimated as price x cost margin.
class InventoryValuation
{
public:
    struct Parameters
    {
        decimal_t costMargin = DEC(0.80);
    };

    InventoryValuation(const Parameters& params, std::vector<InventoryItem> items);

    [[nodiscard]] const Parameters& parameters() const noexcept { return m_params; }
    [[nodiscard]] const std::vector<InventoryItem>& items() const noexcept { return m_items; }

    [[nodiscard]] InventoryValue value() const;

private:
    Parameters m_params;
    std::vector<InventoryItem> m_items;
};

//-------------------------------------------------------------------------

}  // namespace uniledger::patrimony

//-------------------------------------------------------------------------
