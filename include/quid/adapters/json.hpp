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
 * @file json.hpp
 * @brief cJSON document adapter for identifiers.
 *
 * @details
 * Complements `QuotedText`, which works on serialized bytes, by operating on
 * parsed cJSON trees. Inside a tree the quotes are already gone, so an
 * identifier is a string item whose value is the canonical 36-character form.
 *
 * **Ownership:** items returned by `encode` belong to the caller until they are
 * attached to a parent with `cJSON_AddItemToObject` / `cJSON_AddItemToArray`
 * (or released with `cJSON_Delete`).
 */

#pragma once

#include "quid/core/uuid.hpp"

#include <cJSON.h>

#include <optional>

namespace quid::adapters {

/**
 * @class Json
 * @brief Converts identifiers to and from cJSON string items.
 */
class Json {
  public:
    /**
     * @brief Creates a detached cJSON string item holding the canonical text.
     * @return A new item, or `nullptr` if cJSON could not allocate it.
     */
    static cJSON* encode(const core::Uuid& uuid);

    /**
     * @brief Adds `uuid` to `object` under `key`.
     * @return false if cJSON could not allocate the member.
     *
     * @code
     * // Example Usage:
     * cJSON* doc = cJSON_CreateObject();
     * quid::adapters::Json::add_to_object(doc, "_id", IdGenerator::v7());
     * @endcode
     */
    static bool add_to_object(cJSON* object, const char* key, const core::Uuid& uuid);

    /**
     * @brief Reads an identifier from a string item.
     *
     * Non-string items (numbers, arrays, null, ...) and strings that are not in
     * canonical form are invalid identifiers.
     */
    static std::optional<core::Uuid> decode(const cJSON* item);

    static bool decode_into(core::Uuid& target, const cJSON* item);

    /// Looks up `key` in `object` and decodes it.
    static std::optional<core::Uuid> get_from_object(const cJSON* object, const char* key);
};

} // namespace quid::adapters
