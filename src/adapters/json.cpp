/*
 * AEVUMDB COMMUNITY LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 Ananda Firmansyah.
 * Official Organization: AevumDB (https://github.com/aevumdb)
 *
 * This source code is licensed under the AevumDB Community License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file json.cpp
 * @brief Implementation of the cJSON document adapter.
 */

#include "quid/adapters/json.hpp"

#include "quid/codec/codec.hpp"
#include "quid/infra/logger.hpp"

#include <string>

namespace quid::adapters {

using quid::codec::Codec;
using quid::core::Uuid;
using quid::infra::LogLevel;
using quid::infra::Logger;

cJSON* Json::encode(const Uuid& uuid)
{
    const std::string text = Codec::to_string(uuid);
    return cJSON_CreateString(text.c_str());
}

bool Json::add_to_object(cJSON* object, const char* key, const Uuid& uuid)
{
    const std::string text = Codec::to_string(uuid);
    return cJSON_AddStringToObject(object, key, text.c_str()) != nullptr;
}

std::optional<Uuid> Json::decode(const cJSON* item)
{
    if (!cJSON_IsString(item) || !item->valuestring) {
        return std::nullopt;
    }
    return Codec::parse_canonical(item->valuestring);
}

bool Json::decode_into(Uuid& target, const cJSON* item)
{
    std::optional<Uuid> decoded = decode(item);
    if (!decoded) {
        Logger::log(LogLevel::DEBUG, "Adapter: json item is not a canonical UUID string");
        return false;
    }
    target = *decoded;
    return true;
}

std::optional<Uuid> Json::get_from_object(const cJSON* object, const char* key)
{
    return decode(cJSON_GetObjectItemCaseSensitive(object, key));
}

} // namespace quid::adapters
