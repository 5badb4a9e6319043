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
 * @file hex.hpp
 * @brief Base-16 encoding primitives used by the codec.
 *
 * @details
 * This header defines the `Hex` utility class, a stateless set of routines for
 * converting between raw octets and ASCII hexadecimal digits. Encoding always
 * emits lowercase; decoding accepts both cases.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace quid::infra {

/**
 * @class Hex
 * @brief A static container for hexadecimal transcoding.
 */
class Hex {
  public:
    /**
     * @brief Writes `2 * size` lowercase hex digits for `size` input bytes.
     *
     * @param src Source octets.
     * @param size Number of octets to encode.
     * @param dst Output buffer with room for at least `2 * size` characters.
     * No terminator is written.
     *
     * @code
     * // Example Usage:
     * const std::uint8_t raw[2] = {0x9e, 0x75};
     * char out[4];
     * quid::infra::Hex::encode(raw, 2, out); // "9e75"
     * @endcode
     */
    static void encode(const std::uint8_t* src, std::size_t size, char* dst);

    /**
     * @brief Decodes `2 * size` hex digits into `size` octets.
     *
     * @param src Source characters (`0-9`, `a-f`, `A-F`).
     * @param size Number of octets to produce.
     * @param dst Output buffer with room for `size` octets.
     * @return false on the first character that is not a hex digit. The content
     * of `dst` is unspecified in that case.
     */
    static bool decode(const char* src, std::size_t size, std::uint8_t* dst);

    /**
     * @brief Maps a single ASCII character to its nibble value.
     * @return The value 0-15, or -1 when `c` is not a hex digit.
     */
    static int nibble(char c);
};

} // namespace quid::infra
