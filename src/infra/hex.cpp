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
 * @file hex.cpp
 * @brief Implementation of the hexadecimal transcoding primitives.
 *
 * @details
 * Both directions are table-free linear scans over fixed-size buffers. No
 * allocation takes place; callers own every buffer involved.
 */

#include "quid/infra/hex.hpp"

namespace quid::infra {

namespace {

constexpr char kDigits[] = "0123456789abcdef";

} // namespace

void Hex::encode(const std::uint8_t* src, std::size_t size, char* dst)
{
    for (std::size_t i = 0; i < size; ++i) {
        dst[2 * i] = kDigits[src[i] >> 4];
        dst[2 * i + 1] = kDigits[src[i] & 0x0F];
    }
}

/**
 * @note Characters are compared as plain ASCII ranges rather than through
 * `std::isxdigit`, so the result never depends on the active locale.
 */
int Hex::nibble(char c)
{
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return c - 'a' + 10;
    }
    if (c >= 'A' && c <= 'F') {
        return c - 'A' + 10;
    }
    return -1;
}

bool Hex::decode(const char* src, std::size_t size, std::uint8_t* dst)
{
    for (std::size_t i = 0; i < size; ++i) {
        const int hi = nibble(src[2 * i]);
        const int lo = nibble(src[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return false;
        }
        dst[i] = static_cast<std::uint8_t>((hi << 4) | lo);
    }
    return true;
}

} // namespace quid::infra
