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
 * @file scalar.hpp
 * @brief Bridge between `Uuid` and loosely typed persistence scalars.
 *
 * @details
 * Database drivers hand column values over as one of a handful of primitive
 * types. `Scalar` models that boundary as a `std::variant`, and
 * `ScalarAdapter` maps it to and from identifiers.
 */

#pragma once

#include "quid/core/uuid.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace quid::adapters {

/**
 * @brief A value as delivered by a SQL-like driver.
 *
 * Alternatives, in order: NULL, integer, floating point, boolean, text, blob.
 */
using Scalar = std::variant<std::monostate, std::int64_t, double, bool, std::string,
                            std::vector<std::uint8_t>>;

/**
 * @class ScalarAdapter
 * @brief Stores identifiers as text and reads them back from text or blobs.
 *
 * @details
 * **Decode Dispatch:**
 * - blob (`std::vector<std::uint8_t>`): byte parse rule (16, 32 or 36 bytes).
 * - text (`std::string`): text parse rule (same three shapes).
 * - anything else: invalid identifier.
 */
class ScalarAdapter {
  public:
    /// Produces the canonical text as a text scalar.
    static Scalar encode(const core::Uuid& uuid);

    static std::optional<core::Uuid> decode(const Scalar& value);

    /// Overwrites `target` only when `value` holds a valid identifier.
    static bool decode_into(core::Uuid& target, const Scalar& value);
};

} // namespace quid::adapters
