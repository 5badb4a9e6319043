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
 * @file error.hpp
 * @brief Exception types raised by the quid library.
 *
 * @details
 * quid distinguishes exactly two failure kinds:
 * 1. **Random source failure**: the entropy provider could not deliver bytes.
 * Raised as `RandomSourceError` by the v4 and v7 generators.
 * 2. **Invalid identifier**: malformed parse or decode input. The fallible APIs
 * report this through `std::optional` / `bool` results; the exception form
 * `InvalidUuidError` is only raised by the opt-in `quid::codec::must` helper.
 */

#pragma once

#include <stdexcept>
#include <string>
#include <system_error>

namespace quid::core {

/**
 * @class InvalidUuidError
 * @brief Raised when input that was asserted to be well-formed is not.
 *
 * Carries no detail about which rule was violated (length, hyphen position or
 * hex digit): callers only ever branch on success versus failure.
 */
class InvalidUuidError : public std::invalid_argument {
  public:
    InvalidUuidError() : std::invalid_argument("quid: invalid UUID") {}
};

/**
 * @class RandomSourceError
 * @brief Raised when the random source cannot supply the requested bytes.
 *
 * The error code is the one reported by the underlying source (for the system
 * source, the `errno` of `getrandom(2)`), passed through unchanged.
 */
class RandomSourceError : public std::system_error {
  public:
    RandomSourceError(std::error_code code, const std::string& what)
        : std::system_error(code, what)
    {
    }
};

} // namespace quid::core
