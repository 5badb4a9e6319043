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
 * @file uuid.hpp
 * @brief The 128-bit RFC 4122 identifier value type.
 *
 * @details
 * `Uuid` is a plain value: sixteen bytes with byte-wise equality and
 * lexicographic ordering. It carries no state besides those bytes, so copies are
 * cheap and instances may be shared freely across threads.
 *
 * ## Field Layout (RFC 4122 Section 4.1.2)
 * - Byte 6, high nibble: **version** (3, 4, 5 and 7 are generated by quid).
 * - Byte 8, high bits: **variant** (generated identifiers always carry `10`).
 * - Version 7 only: bytes 0-5 hold a 48-bit big-endian Unix millisecond timestamp.
 *
 * Construction from text lives in `quid::codec::Codec`; construction from
 * entropy or names lives in `quid::gen::IdGenerator`.
 */

#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>

namespace quid::core {

/**
 * @enum Variant
 * @brief The layout family encoded in the high bits of byte 8.
 */
enum class Variant {
    NCS,       ///< `0xx`: reserved, NCS backward compatibility.
    RFC4122,   ///< `10x`: the layout described by RFC 4122.
    Microsoft, ///< `110`: reserved, Microsoft backward compatibility.
    Future     ///< `111`: reserved for future definition.
};

/**
 * @class Uuid
 * @brief An immutable 16-byte universally unique identifier.
 */
class Uuid {
  public:
    /// Fixed cardinality of every identifier.
    static constexpr std::size_t size = 16;

    using Bytes = std::array<std::uint8_t, size>;
    /// Millisecond resolution covers the whole 48-bit v7 field without overflow.
    using TimePoint = std::chrono::time_point<std::chrono::system_clock, std::chrono::milliseconds>;

    /// Constructs the nil identifier (all bits zero).
    constexpr Uuid() : bytes_{} {}

    /// Wraps an existing 16-byte buffer without any validation.
    explicit constexpr Uuid(const Bytes& bytes) : bytes_(bytes) {}

    /// Read-only view of the underlying storage.
    const Bytes& bytes() const
    {
        return bytes_;
    }

    std::uint8_t operator[](std::size_t index) const
    {
        return bytes_[index];
    }

    /**
     * @brief Returns the version number stored in the high nibble of byte 6.
     *
     * Any value 0-15 is possible for parsed input; no validation is performed.
     */
    int version() const;

    /// Decodes the variant bits of byte 8.
    Variant variant() const;

    /// True for the all-zero identifier.
    bool is_nil() const;

    /**
     * @brief Extracts the embedded timestamp of a version 7 identifier.
     *
     * @return The millisecond-precision instant stored in bytes 0-5, or an empty
     * optional when `version() != 7`. A non-v7 identifier is not an error here,
     * it simply has no timestamp.
     */
    std::optional<TimePoint> time() const;

    /// Canonical 36-character lowercase representation.
    std::string to_string() const;

    friend bool operator==(const Uuid& lhs, const Uuid& rhs)
    {
        return lhs.bytes_ == rhs.bytes_;
    }

    friend bool operator!=(const Uuid& lhs, const Uuid& rhs)
    {
        return !(lhs == rhs);
    }

    friend bool operator<(const Uuid& lhs, const Uuid& rhs)
    {
        return lhs.bytes_ < rhs.bytes_;
    }

  private:
    Bytes bytes_;
};

/// Writes the canonical text form.
std::ostream& operator<<(std::ostream& os, const Uuid& uuid);

// ============================================================================
//  RFC 4122 APPENDIX C NAMESPACES
// ============================================================================

/// Name string is a fully-qualified domain name.
inline constexpr Uuid kNamespaceDns{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x10, 0x9d, 0xad, 0x11, 0xd1,
                                                0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

/// Name string is a URL.
inline constexpr Uuid kNamespaceUrl{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x11, 0x9d, 0xad, 0x11, 0xd1,
                                                0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

/// Name string is an ISO OID.
inline constexpr Uuid kNamespaceOid{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x12, 0x9d, 0xad, 0x11, 0xd1,
                                                0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

/// Name string is an X.500 DN (in DER or a text output format).
inline constexpr Uuid kNamespaceX500{Uuid::Bytes{0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x11, 0xd1,
                                                 0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8}};

} // namespace quid::core

namespace std {

template <> struct hash<quid::core::Uuid> {
    size_t operator()(const quid::core::Uuid& uuid) const noexcept
    {
        // FNV-1a over the 16 bytes.
        uint64_t h = 0xcbf29ce484222325ULL;
        for (uint8_t b : uuid.bytes()) {
            h ^= b;
            h *= 0x100000001b3ULL;
        }
        return static_cast<size_t>(h);
    }
};

} // namespace std
