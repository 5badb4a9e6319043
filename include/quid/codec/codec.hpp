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
 * @file codec.hpp
 * @brief Canonical text formatting and multi-shape parsing of identifiers.
 *
 * @details
 * This header declares the `Codec` class, the single authority on how a `Uuid`
 * is rendered as text and how text or bytes are turned back into a `Uuid`.
 * The canonical form is wire-visible, so its byte offsets are fixed:
 *
 * @code
 * offset:  0        9    14   19   24
 *          9e754ef6-8dd9-4903-af43-7aea99bfb1fe
 *                  ^8   ^13  ^18  ^23   (hyphens)
 * @endcode
 */

#pragma once

#include "quid/core/uuid.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace quid::codec {

/**
 * @class Codec
 * @brief Stateless formatter and parser for RFC 4122 identifiers.
 *
 * @details
 * **Accepted parse shapes** (selected purely by input length):
 * | Length | Shape                              | Validation                   |
 * |--------|------------------------------------|------------------------------|
 * | 16     | raw binary                         | none, copied through         |
 * | 32     | hex digits, no separators          | every character is hex       |
 * | 36     | canonical 8-4-4-4-12 dashed text   | hyphens at 8/13/18/23, hex   |
 *
 * Every other length is rejected without looking at the content. Version and
 * variant bits are never validated by the parser.
 */
class Codec {
  public:
    static constexpr std::size_t binary_length = core::Uuid::size;
    static constexpr std::size_t compact_length = 32;
    static constexpr std::size_t canonical_length = 36;

    /// Fixed-size canonical text, without terminator.
    using Text = std::array<char, canonical_length>;

    /**
     * @brief Renders the canonical 36-character lowercase form.
     *
     * Total over every possible byte pattern; it cannot fail.
     */
    static Text format(const core::Uuid& uuid);

    /// Same as `format`, materialised as a `std::string`.
    static std::string to_string(const core::Uuid& uuid);

    /**
     * @brief Parses 16, 32 or 36 bytes of input.
     *
     * @param data Pointer to the first input byte.
     * @param size Number of input bytes.
     * @return The identifier, or an empty optional on any malformed input.
     */
    static std::optional<core::Uuid> parse(const std::uint8_t* data, std::size_t size);

    /// Text overload. Text is treated as its underlying byte sequence.
    static std::optional<core::Uuid> parse(std::string_view text);

    /// Byte-vector overload.
    static std::optional<core::Uuid> parse(const std::vector<std::uint8_t>& bytes);

    /**
     * @brief Parses the canonical 36-character dashed form only.
     *
     * Raw and compact shapes are rejected. Used where a container format fixes
     * the representation (e.g. a JSON string value).
     */
    static std::optional<core::Uuid> parse_canonical(std::string_view text);
};

/**
 * @brief Unwraps a parse result that the caller has already proven valid.
 *
 * Intended for constants and other trusted literals. Only parse results are
 * wrapped: the generators already throw on failure and never hand back an
 * empty value, so `IdGenerator::v4()` needs no unwrapping.
 * @code
 * const auto id = quid::codec::must(Codec::parse("9e754ef6-8dd9-4903-af43-7aea99bfb1fe"));
 * @endcode
 *
 * @throws quid::core::InvalidUuidError if `parsed` is empty.
 */
core::Uuid must(const std::optional<core::Uuid>& parsed);

} // namespace quid::codec
