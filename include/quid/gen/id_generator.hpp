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
 * @file id_generator.hpp
 * @brief Construction algorithms for RFC 4122 identifiers.
 *
 * @details
 * This file declares the `IdGenerator` class, a stateless utility producing
 * name-based (v3, v5), random (v4) and time-ordered (v7) identifiers. Every
 * generated identifier carries its version in the high nibble of byte 6 and the
 * RFC 4122 variant `10` in the high bits of byte 8.
 */

#pragma once

#include "quid/core/uuid.hpp"
#include "quid/crypto/digest.hpp"
#include "quid/infra/random_source.hpp"

#include <chrono>
#include <cstdint>
#include <string_view>
#include <vector>

namespace quid::gen {

/**
 * @class IdGenerator
 * @brief A static utility for generating RFC 4122 identifiers.
 *
 * @details
 * **Failure model:**
 * - v3 / v5 are pure functions of their inputs and never fail on input.
 * - v4 / v7 throw `quid::core::RandomSourceError` when the random source cannot
 * deliver. Nothing is returned in that case, not even a partial value.
 *
 * All members are thread-safe: there is no shared mutable state, and the
 * default random source issues an independent kernel request per call.
 */
class IdGenerator {
  public:
    /// Generation input at clock resolution; truncated to milliseconds when stamped.
    using TimePoint = std::chrono::system_clock::time_point;

    /**
     * @brief Version 3: MD5 of `namespace ++ name`.
     *
     * @code
     * // Example Usage:
     * auto id = IdGenerator::v3(quid::core::kNamespaceDns, "python.org");
     * // id.to_string() == "6fa459ea-ee8a-3ca4-894e-db77e160355e"
     * @endcode
     */
    static core::Uuid v3(const core::Uuid& ns, std::string_view name);

    /// Version 3 over an arbitrary byte name.
    static core::Uuid v3(const core::Uuid& ns, const std::vector<std::uint8_t>& name);

    /**
     * @brief Generates a random Version 4 identifier.
     *
     * Canonical text shape: `xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx` where `y` is
     * one of `{8, 9, a, b}`.
     *
     * @throws quid::core::RandomSourceError if the system source fails.
     */
    static core::Uuid v4();

    /// Version 4 drawing from a caller-supplied source.
    static core::Uuid v4(infra::RandomSource& source);

    /// Version 5: SHA-1 of `namespace ++ name`, truncated to 16 bytes.
    static core::Uuid v5(const core::Uuid& ns, std::string_view name);

    /// Version 5 over an arbitrary byte name.
    static core::Uuid v5(const core::Uuid& ns, const std::vector<std::uint8_t>& name);

    /// Version 7 stamped with the current system time.
    static core::Uuid v7();

    /**
     * @brief Generates a time-ordered Version 7 identifier.
     *
     * Bytes 0-5 receive the whole milliseconds of `time` since the Unix epoch
     * (48-bit big-endian, taken modulo 2^48); bytes 6-15 receive randomness.
     *
     * @throws quid::core::RandomSourceError if the system source fails.
     */
    static core::Uuid v7(TimePoint time);

    /// Version 7 drawing from a caller-supplied source.
    static core::Uuid v7(TimePoint time, infra::RandomSource& source);

  private:
    static core::Uuid from_name(crypto::Algorithm algorithm, const core::Uuid& ns,
                                const std::uint8_t* name, std::size_t size, int version);
};

} // namespace quid::gen
