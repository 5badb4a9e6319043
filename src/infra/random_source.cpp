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
 * @file random_source.cpp
 * @brief `getrandom(2)` backed implementation of the system random source.
 */

#include "quid/infra/random_source.hpp"

#include "quid/core/error.hpp"

#include <cerrno>
#include <sys/random.h>
#include <sys/types.h>
#include <system_error>

namespace quid::infra {

/**
 * @details
 * A single request of up to 256 bytes is never split by the kernel once the
 * entropy pool is initialised. Larger requests may come back short; the loop
 * then asks for the remainder. A return of -1 ends the call with the kernel's
 * `errno` attached, including `EINTR`.
 */
void SystemRandomSource::fill(std::uint8_t* buffer, std::size_t size)
{
    std::size_t filled = 0;
    while (filled < size) {
        ssize_t n = getrandom(buffer + filled, size - filled, 0);
        if (n < 0) {
            throw quid::core::RandomSourceError(std::error_code(errno, std::system_category()),
                                                "getrandom");
        }
        filled += static_cast<std::size_t>(n);
    }
}

SystemRandomSource& SystemRandomSource::instance()
{
    static SystemRandomSource source;
    return source;
}

} // namespace quid::infra
