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
 * @file id_generator.cpp
 * @brief Implementation of the identifier construction algorithms.
 *
 * @details
 * All generators share the same final step: overlay the version nibble on
 * byte 6 and the RFC 4122 variant bits on byte 8. Everything else is the
 * algorithm-specific fill of the 16 payload bytes.
 */

#include "quid/gen/id_generator.hpp"

#include "quid/core/error.hpp"
#include "quid/infra/logger.hpp"

#include <algorithm>

namespace quid::gen {

using quid::core::Uuid;
using quid::infra::LogLevel;
using quid::infra::Logger;

namespace {

/**
 * Protocol Compliance:
 * - Version bits: high nibble of the 7th byte.
 * - Variant bits: `10` in the two high bits of the 9th byte.
 */
void stamp(Uuid::Bytes& bytes, int version)
{
    bytes[6] = static_cast<std::uint8_t>((bytes[6] & 0x0F) | (version << 4));
    bytes[8] = static_cast<std::uint8_t>((bytes[8] & 0x3F) | 0x80);
}

void draw(infra::RandomSource& source, std::uint8_t* buffer, std::size_t size)
{
    try {
        source.fill(buffer, size);
    } catch (const core::RandomSourceError& e) {
        Logger::log(LogLevel::ERROR, std::string("Generator: random source failed: ") + e.what());
        throw;
    }
}

} // namespace

Uuid IdGenerator::from_name(crypto::Algorithm algorithm, const Uuid& ns,
                            const std::uint8_t* name, std::size_t size, int version)
{
    auto digest = crypto::make_digest(algorithm);
    digest->update(ns.bytes().data(), Uuid::size);
    digest->update(name, size);
    const std::vector<std::uint8_t> sum = digest->finish();

    // MD5 yields exactly 16 bytes; SHA-1 yields 20 and is truncated.
    Uuid::Bytes bytes{};
    std::copy_n(sum.begin(), std::min(sum.size(), Uuid::size), bytes.begin());
    stamp(bytes, version);
    return Uuid(bytes);
}

Uuid IdGenerator::v3(const Uuid& ns, std::string_view name)
{
    return from_name(crypto::Algorithm::MD5, ns, reinterpret_cast<const std::uint8_t*>(name.data()),
                     name.size(), 3);
}

Uuid IdGenerator::v3(const Uuid& ns, const std::vector<std::uint8_t>& name)
{
    return from_name(crypto::Algorithm::MD5, ns, name.data(), name.size(), 3);
}

Uuid IdGenerator::v5(const Uuid& ns, std::string_view name)
{
    return from_name(crypto::Algorithm::SHA1, ns,
                     reinterpret_cast<const std::uint8_t*>(name.data()), name.size(), 5);
}

Uuid IdGenerator::v5(const Uuid& ns, const std::vector<std::uint8_t>& name)
{
    return from_name(crypto::Algorithm::SHA1, ns, name.data(), name.size(), 5);
}

Uuid IdGenerator::v4()
{
    return v4(infra::SystemRandomSource::instance());
}

/**
 * @details
 * The random bytes land in a local buffer first, so a failing source never
 * exposes a half-written identifier to the caller.
 */
Uuid IdGenerator::v4(infra::RandomSource& source)
{
    Uuid::Bytes bytes{};
    draw(source, bytes.data(), bytes.size());
    stamp(bytes, 4);
    return Uuid(bytes);
}

Uuid IdGenerator::v7()
{
    return v7(std::chrono::system_clock::now(), infra::SystemRandomSource::instance());
}

Uuid IdGenerator::v7(TimePoint time)
{
    return v7(time, infra::SystemRandomSource::instance());
}

/**
 * @details
 * Layout (RFC 9562 Section 5.7):
 * - Bytes 0-5: `unix_ts_ms`, big-endian.
 * - Byte 6: version `0111` + 4 random bits.
 * - Byte 8: variant `10` + 6 random bits.
 * - Remaining bytes: random.
 */
Uuid IdGenerator::v7(TimePoint time, infra::RandomSource& source)
{
    const auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count();
    const auto stamp_ms = static_cast<std::uint64_t>(millis) & 0xFFFFFFFFFFFFULL;

    Uuid::Bytes bytes{};
    for (std::size_t i = 0; i < 6; ++i) {
        bytes[i] = static_cast<std::uint8_t>(stamp_ms >> (8 * (5 - i)));
    }

    draw(source, bytes.data() + 6, Uuid::size - 6);
    stamp(bytes, 7);
    return Uuid(bytes);
}

} // namespace quid::gen
