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
 * @file text_adapters.hpp
 * @brief Marshalling adapters for binary, plain-text and quoted-text encodings.
 *
 * @details
 * Serialization frameworks each have their own marshal/unmarshal conventions.
 * The classes in this header expose a `Uuid` through the three encodings those
 * frameworks ask for, without adding any semantics of their own: every decode
 * delegates validation to `quid::codec::Codec`.
 *
 * Each decoder comes in two shapes:
 * - `decode(...)` returns `std::optional<Uuid>`.
 * - `decode_into(target, ...)` returns `bool` and overwrites all 16 bytes of
 * `target` on success. On failure `target` is left untouched.
 */

#pragma once

#include "quid/core/uuid.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quid::adapters {

/**
 * @class Binary
 * @brief Raw 16-byte encoding.
 */
class Binary {
  public:
    static std::vector<std::uint8_t> encode(const core::Uuid& uuid);

    /// Accepts exactly 16 bytes; any other size is an invalid identifier.
    static std::optional<core::Uuid> decode(const std::uint8_t* data, std::size_t size);
    static std::optional<core::Uuid> decode(const std::vector<std::uint8_t>& bytes);

    static bool decode_into(core::Uuid& target, const std::vector<std::uint8_t>& bytes);
};

/**
 * @class Text
 * @brief Unquoted canonical text.
 *
 * Encoding yields the 36-character canonical form. Decoding applies the full
 * parse rules, so raw 16-byte and compact 32-digit inputs are accepted as well.
 */
class Text {
  public:
    static std::string encode(const core::Uuid& uuid);
    static std::optional<core::Uuid> decode(std::string_view text);
    static bool decode_into(core::Uuid& target, std::string_view text);
};

/**
 * @class QuotedText
 * @brief Canonical text wrapped in double quotes, as a JSON string scalar.
 *
 * @details
 * Wire shape: `"9e754ef6-8dd9-4903-af43-7aea99bfb1fe"` (38 bytes). Decoding
 * requires exactly 38 bytes with a `"` at both ends and a canonical interior.
 * No escape sequences or surrounding whitespace are tolerated.
 */
class QuotedText {
  public:
    static constexpr std::size_t length = 38;

    static std::string encode(const core::Uuid& uuid);
    static std::optional<core::Uuid> decode(std::string_view quoted);
    static bool decode_into(core::Uuid& target, std::string_view quoted);
};

} // namespace quid::adapters
