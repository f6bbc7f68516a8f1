/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#pragma once

#include "json_util.hpp"

//-------------------------------------------------------------------------

class JsonSerializable
{
public:
    virtual ~JsonSerializable() noexcept = default;

    virtual void jsonSerialize(rapidjson::Document& json, const std::string& key = {}) const = 0;

protected:
    JsonSerializable() noexcept = default;
};

//-------------------------------------------------------------------------

namespace uniledger::json
{

// Serializes a range of serializables into a Json array stored under key.
void serializeArray(
    rapidjson::Document& json, const std::string& key, const auto& range)
{
    serializeHelper(
        json,
        key,
        [&](rapidjson::Document& json) {
            json.SetArray();
            auto& allocator = json.GetAllocator();
            for (const auto& item : range) {
                rapidjson::Document itemJson{&allocator};
                item.jsonSerialize(itemJson);
                json.PushBack(itemJson, allocator);
            }
        });
}

}  // namespace uniledger::json

//-------------------------------------------------------------------------
