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
 * @file text_adapters.cpp
 * @brief Implementation of the binary, text and quoted-text adapters.
 */

#include "quid/adapters/text_adapters.hpp"

#include "quid/codec/codec.hpp"
#include "quid/infra/logger.hpp"

namespace quid::adapters {

using quid::codec::Codec;
using quid::core::Uuid;
using quid::infra::LogLevel;
using quid::infra::Logger;

namespace {

bool assign(Uuid& target, const std::optional<Uuid>& decoded, const char* adapter,
            std::size_t size)
{
    if (!decoded) {
        Logger::log(LogLevel::DEBUG, std::string("Adapter: ") + adapter +
                                         " rejected input of " + std::to_string(size) +
                                         " bytes");
        return false;
    }
    target = *decoded;
    return true;
}

} // namespace

// ----------------------------------------------------------------------------
// Binary
// ----------------------------------------------------------------------------

std::vector<std::uint8_t> Binary::encode(const Uuid& uuid)
{
    return std::vector<std::uint8_t>(uuid.bytes().begin(), uuid.bytes().end());
}

std::optional<Uuid> Binary::decode(const std::uint8_t* data, std::size_t size)
{
    if (size != Uuid::size) {
        return std::nullopt;
    }
    return Codec::parse(data, size);
}

std::optional<Uuid> Binary::decode(const std::vector<std::uint8_t>& bytes)
{
    return decode(bytes.data(), bytes.size());
}

bool Binary::decode_into(Uuid& target, const std::vector<std::uint8_t>& bytes)
{
    return assign(target, decode(bytes), "binary", bytes.size());
}

// ----------------------------------------------------------------------------
// Text
// ----------------------------------------------------------------------------

std::string Text::encode(const Uuid& uuid)
{
    return Codec::to_string(uuid);
}

std::optional<Uuid> Text::decode(std::string_view text)
{
    return Codec::parse(text);
}

bool Text::decode_into(Uuid& target, std::string_view text)
{
    return assign(target, decode(text), "text", text.size());
}

// ----------------------------------------------------------------------------
// QuotedText
// ----------------------------------------------------------------------------

std::string QuotedText::encode(const Uuid& uuid)
{
    const Codec::Text text = Codec::format(uuid);

    std::string out;
    out.reserve(length);
    out.push_back('"');
    out.append(text.data(), text.size());
    out.push_back('"');
    return out;
}

std::optional<Uuid> QuotedText::decode(std::string_view quoted)
{
    if (quoted.size() != length || quoted.front() != '"' || quoted.back() != '"') {
        return std::nullopt;
    }
    return Codec::parse_canonical(quoted.substr(1, Codec::canonical_length));
}

bool QuotedText::decode_into(Uuid& target, std::string_view quoted)
{
    return assign(target, decode(quoted), "quoted text", quoted.size());
}

} // namespace quid::adapters
