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
 * @file codec.cpp
 * @brief Implementation of the canonical formatter and the three-shape parser.
 *
 * @details
 * The canonical layout is described once, as a table of five groups, and both
 * directions walk that table. This keeps the byte-to-offset mapping in a single
 * place:
 *
 * | Group | Source bytes | Text offset | Digits |
 * |-------|--------------|-------------|--------|
 * | 1     | 0-3          | 0           | 8      |
 * | 2     | 4-5          | 9           | 4      |
 * | 3     | 6-7          | 14          | 4      |
 * | 4     | 8-9          | 19          | 4      |
 * | 5     | 10-15        | 24          | 12     |
 */

#include "quid/codec/codec.hpp"

#include "quid/core/error.hpp"
#include "quid/infra/hex.hpp"

#include <algorithm>

namespace quid::codec {

using quid::core::Uuid;
using quid::infra::Hex;

namespace {

struct Group {
    std::size_t byte_offset;
    std::size_t byte_count;
    std::size_t text_offset;
};

constexpr Group kGroups[] = {
    {0, 4, 0}, {4, 2, 9}, {6, 2, 14}, {8, 2, 19}, {10, 6, 24},
};

constexpr std::size_t kHyphens[] = {8, 13, 18, 23};

std::optional<Uuid> decode_compact(const char* text)
{
    Uuid::Bytes bytes{};
    if (!Hex::decode(text, Uuid::size, bytes.data())) {
        return std::nullopt;
    }
    return Uuid(bytes);
}

std::optional<Uuid> decode_canonical(const char* text)
{
    for (std::size_t pos : kHyphens) {
        if (text[pos] != '-') {
            return std::nullopt;
        }
    }

    Uuid::Bytes bytes{};
    for (const Group& g : kGroups) {
        if (!Hex::decode(text + g.text_offset, g.byte_count, bytes.data() + g.byte_offset)) {
            return std::nullopt;
        }
    }
    return Uuid(bytes);
}

} // namespace

Codec::Text Codec::format(const Uuid& uuid)
{
    Text out{};
    const Uuid::Bytes& bytes = uuid.bytes();

    for (const Group& g : kGroups) {
        Hex::encode(bytes.data() + g.byte_offset, g.byte_count, out.data() + g.text_offset);
    }
    for (std::size_t pos : kHyphens) {
        out[pos] = '-';
    }
    return out;
}

std::string Codec::to_string(const Uuid& uuid)
{
    const Text text = format(uuid);
    return std::string(text.data(), text.size());
}

/**
 * @details
 * Dispatch is decided by length alone. The 16-byte path deliberately skips
 * version/variant validation so that arbitrary opaque 128-bit values survive a
 * round trip through binary storage.
 */
std::optional<Uuid> Codec::parse(const std::uint8_t* data, std::size_t size)
{
    switch (size) {
    case binary_length: {
        Uuid::Bytes bytes{};
        std::copy(data, data + binary_length, bytes.begin());
        return Uuid(bytes);
    }
    case compact_length:
        return decode_compact(reinterpret_cast<const char*>(data));
    case canonical_length:
        return decode_canonical(reinterpret_cast<const char*>(data));
    default:
        return std::nullopt;
    }
}

std::optional<Uuid> Codec::parse(std::string_view text)
{
    return parse(reinterpret_cast<const std::uint8_t*>(text.data()), text.size());
}

std::optional<Uuid> Codec::parse(const std::vector<std::uint8_t>& bytes)
{
    return parse(bytes.data(), bytes.size());
}

std::optional<Uuid> Codec::parse_canonical(std::string_view text)
{
    if (text.size() != canonical_length) {
        return std::nullopt;
    }
    return decode_canonical(text.data());
}

Uuid must(const std::optional<Uuid>& parsed)
{
    if (!parsed) {
        throw quid::core::InvalidUuidError();
    }
    return *parsed;
}

} // namespace quid::codec
