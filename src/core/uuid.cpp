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
 * @file uuid.cpp
 * @brief Field accessors for the `Uuid` value type.
 */

#include "quid/core/uuid.hpp"

#include "quid/codec/codec.hpp"

namespace quid::core {

int Uuid::version() const
{
    return bytes_[6] >> 4;
}

/**
 * @details
 * Decoding follows the table of RFC 4122 Section 4.1.1, where only the
 * leading bits up to the first zero are significant.
 */
Variant Uuid::variant() const
{
    const std::uint8_t b = bytes_[8];
    if ((b & 0x80) == 0x00) {
        return Variant::NCS;
    }
    if ((b & 0xC0) == 0x80) {
        return Variant::RFC4122;
    }
    if ((b & 0xE0) == 0xC0) {
        return Variant::Microsoft;
    }
    return Variant::Future;
}

bool Uuid::is_nil() const
{
    for (std::uint8_t b : bytes_) {
        if (b != 0) {
            return false;
        }
    }
    return true;
}

std::optional<Uuid::TimePoint> Uuid::time() const
{
    if (version() != 7) {
        return std::nullopt;
    }

    // Bytes 0-5: unix_ts_ms, big-endian.
    std::uint64_t millis = 0;
    for (std::size_t i = 0; i < 6; ++i) {
        millis = (millis << 8) | bytes_[i];
    }

    return TimePoint(std::chrono::milliseconds(static_cast<std::int64_t>(millis)));
}

std::string Uuid::to_string() const
{
    return quid::codec::Codec::to_string(*this);
}

std::ostream& operator<<(std::ostream& os, const Uuid& uuid)
{
    const auto text = quid::codec::Codec::format(uuid);
    return os.write(text.data(), static_cast<std::streamsize>(text.size()));
}

} // namespace quid::core
