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
 * @file random_source.hpp
 * @brief Entropy providers for the random (v4) and time-ordered (v7) generators.
 *
 * @details
 * Generators draw their randomness through the narrow `RandomSource` interface so
 * that callers can substitute their own provider. The default implementation,
 * `SystemRandomSource`, reads from the kernel CSPRNG via `getrandom(2)`.
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace quid::infra {

/**
 * @class RandomSource
 * @brief Abstract provider of uniformly distributed random bytes.
 *
 * Implementations must either fill the entire buffer or throw
 * `quid::core::RandomSourceError`; a partially filled buffer is never reported
 * as success.
 */
class RandomSource {
  public:
    virtual ~RandomSource() = default;

    /**
     * @brief Fills `size` bytes starting at `buffer`.
     * @throws quid::core::RandomSourceError when the source cannot deliver.
     */
    virtual void fill(std::uint8_t* buffer, std::size_t size) = 0;
};

/**
 * @class SystemRandomSource
 * @brief The operating system's cryptographically secure random source.
 *
 * @details
 * Stateless: every `fill` call issues its own `getrandom(2)` request, so a
 * single instance is safe to use concurrently from any number of threads.
 * Errors reported by the kernel are surfaced unchanged; there is no retry and
 * no fallback to a weaker generator.
 */
class SystemRandomSource : public RandomSource {
  public:
    void fill(std::uint8_t* buffer, std::size_t size) override;

    /// Process-wide shared instance used by the default generator overloads.
    static SystemRandomSource& instance();
};

} // namespace quid::infra
