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
 * @file scalar.cpp
 * @brief Implementation of the persistence scalar adapter.
 */

#include "quid/adapters/scalar.hpp"

#include "quid/codec/codec.hpp"
#include "quid/infra/logger.hpp"

namespace quid::adapters {

using quid::codec::Codec;
using quid::core::Uuid;
using quid::infra::LogLevel;
using quid::infra::Logger;

Scalar ScalarAdapter::encode(const Uuid& uuid)
{
    return Scalar(Codec::to_string(uuid));
}

std::optional<Uuid> ScalarAdapter::decode(const Scalar& value)
{
    if (const auto* blob = std::get_if<std::vector<std::uint8_t>>(&value)) {
        return Codec::parse(*blob);
    }
    if (const auto* text = std::get_if<std::string>(&value)) {
        return Codec::parse(std::string_view(*text));
    }
    return std::nullopt;
}

bool ScalarAdapter::decode_into(Uuid& target, const Scalar& value)
{
    std::optional<Uuid> decoded = decode(value);
    if (!decoded) {
        Logger::log(LogLevel::DEBUG, "Adapter: scalar rejected value of variant index " +
                                         std::to_string(value.index()));
        return false;
    }
    target = *decoded;
    return true;
}

} // namespace quid::adapters
