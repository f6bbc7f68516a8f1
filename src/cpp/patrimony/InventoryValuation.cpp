/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "InventoryValuation.hpp"

//-------------------------------------------------------------------------

namespace uniledger::patrimony
{

//-------------------------------------------------------------------------

InventoryItem InventoryItem::fromXML(pugi::xml_node node)
{
    static constexpr auto ctx = std::source_location::current().function_name();

    auto requireMoney = [](const char* text, std::string_view what) {
        const auto value = util::parseDecimal(text);
        if (!value.has_value() || !util::hasAtMostDecimals(value.value())
            || value.value() < 0_dec) {
            throw std::invalid_argument{fmt::format(
                "{}: '{}' is not a valid {} for an inventory item", ctx, text, what)};
        }
        return value.value();
    };

    InventoryItem item;
    item.code = node.attribute("code").as_string();
    if (item.code.empty()) {
        throw std::invalid_argument{fmt::format("{}: Inventory item requires a 'code'", ctx)};
    }
    item.name = node.attribute("name").as_string(item.code.c_str());
    item.quantity = node.attribute("quantity").as_ullong();
    if (auto attr = node.attribute("unitCost")) {
        item.unitCost = requireMoney(attr.as_string(), "unitCost");
    }
    item.price = requireMoney(node.attribute("price").as_string("0"), "price");
    return item;
}

//-------------------------------------------------------------------------

void InventoryValue::jsonSerialize(rapidjson::Document& json, const std::string& key) const
{
    auto serialize = [this](rapidjson::Document& json) {
        json.SetObject();
        auto& allocator = json.GetAllocator();
        json.AddMember("total_units", rapidjson::Value{totalUnits}, allocator);
        json::setDecimalMember(json, "total_value", totalValue);
        json.AddMember("items_with_cost", rapidjson::Value{itemsWithCost}, allocator);
        json.AddMember("items_estimated", rapidjson::Value{itemsEstimated}, allocator);
        json::setDecimalMember(json, "cost_margin_used", costMargin);
        rapidjson::Value breakdownJson{rapidjson::kArrayType};
        for (const auto& line : breakdown) {
            rapidjson::Document lineJson{&allocator};
            lineJson.SetObject();
            json::setStringMember(lineJson, "code", line.code);
            json::setStringMember(lineJson, "name", line.name);
            lineJson.AddMember("quantity", rapidjson::Value{line.quantity}, allocator);
            json::setDecimalMember(lineJson, "unit_cost", line.unitCost);
            lineJson.AddMember("is_estimated", rapidjson::Value{line.isEstimated}, allocator);
            json::setDecimalMember(lineJson, "total_value", line.value);
            breakdownJson.PushBack(lineJson, allocator);
        }
        json.AddMember("breakdown", breakdownJson, allocator);
    };
    json::serializeHelper(json, key, serialize);
}

//-------------------------------------------------------------------------

InventoryValuation::InventoryValuation(
    const Parameters& params, std::vector<InventoryItem> items)
    : m_params{params}, m_items{std::move(items)}
{
    if (m_params.costMargin <= 0_dec || m_params.costMargin > 1_dec) {
        throw std::invalid_argument{fmt::format(
            "{}: Cost margin must lie in (0, 1], was {}",
            std::source_location::current().function_name(),
            util::formatDecimal(m_params.costMargin, 4))};
    }
}

//-------------------------------------------------------------------------

InventoryValue InventoryValuation::value() const
{
    InventoryValue result;
    result.costMargin = m_params.costMargin;
    for (const auto& item : m_items) {
        if (item.quantity == 0) continue;
        InventoryLine line{
            .code = item.code,
            .name = item.name,
            .quantity = item.quantity,
            .unitCost = item.unitCost.value_or(util::round(item.price * m_params.costMargin)),
            .isEstimated = !item.unitCost.has_value(),
            .value = {}
        };
        line.value = line.unitCost * decimal_t{static_cast<unsigned long long>(line.quantity)};
        result.totalUnits += line.quantity;
        result.totalValue += line.value;
        ++(line.isEstimated ? result.itemsEstimated : result.itemsWithCost);
        result.breakdown.push_back(std::move(line));
    }
    return result;
}

//-------------------------------------------------------------------------

}  // namespace uniledger::patrimony

//-------------------------------------------------------------------------
