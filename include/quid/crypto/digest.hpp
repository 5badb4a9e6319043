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
 * @file digest.hpp
 * @brief Message digest bridge between quid and the OpenSSL EVP interface.
 *
 * @details
 * Name-based identifiers (v3 and v5) need nothing more from a hash function
 * than "absorb bytes, then produce a digest". This header exposes exactly that
 * capability through the abstract `Digest` class and provides the OpenSSL
 * backed implementation.
 *
 * ## Architecture
 * 1. **Raw Interface**: OpenSSL's `EVP_MD_CTX` C API, which requires explicit
 * `EVP_MD_CTX_new` / `EVP_MD_CTX_free` pairing.
 * 2. **Safe Wrapper (`quid::crypto`)**: `ScopedMdContext` owns the context
 * through RAII, and `EvpDigest` converts every non-success return code into a
 * `DigestError` exception.
 *
 * @note MD5 and SHA-1 are used purely as well-distributed digest functions for
 * deterministic identifier derivation. No security property is implied.
 */

#pragma once

#include <openssl/evp.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace quid::crypto {

/**
 * @enum Algorithm
 * @brief Digest functions available to the name-based generators.
 */
enum class Algorithm {
    MD5, ///< 128-bit digest, used by version 3.
    SHA1 ///< 160-bit digest, used by version 5.
};

/**
 * @class DigestError
 * @brief The crypto back-end refused an operation.
 *
 * This signals an environment fault (for instance a restricted OpenSSL provider
 * configuration without MD5), never bad caller input.
 */
class DigestError : public std::runtime_error {
  public:
    explicit DigestError(const std::string& what) : std::runtime_error(what) {}
};

/**
 * @class ScopedMdContext
 * @brief RAII owner of an OpenSSL `EVP_MD_CTX`.
 *
 * The destructor releases the context on every exit path, including
 * exceptions thrown half-way through a digest computation.
 */
class ScopedMdContext {
  public:
    /// Allocates a fresh context. Throws `DigestError` on allocation failure.
    ScopedMdContext();

    // Non-copyable: the context has a single owner.
    ScopedMdContext(const ScopedMdContext&) = delete;
    ScopedMdContext& operator=(const ScopedMdContext&) = delete;

    ~ScopedMdContext()
    {
        if (ctx_) {
            EVP_MD_CTX_free(ctx_);
        }
    }

    EVP_MD_CTX* get() const
    {
        return ctx_;
    }

  private:
    EVP_MD_CTX* ctx_;
};

/**
 * @class Digest
 * @brief Narrow hashing capability: absorb bytes, then emit the digest.
 */
class Digest {
  public:
    virtual ~Digest() = default;

    /// Absorbs `size` bytes starting at `data`.
    virtual void update(const std::uint8_t* data, std::size_t size) = 0;

    /**
     * @brief Finalises the computation and returns the digest bytes.
     *
     * The instance must not be updated or finished again afterwards.
     */
    virtual std::vector<std::uint8_t> finish() = 0;
};

/**
 * @class EvpDigest
 * @brief `Digest` implementation backed by OpenSSL's EVP layer.
 */
class EvpDigest : public Digest {
  public:
    /// Initialises a context for `algorithm`. Throws `DigestError` on failure.
    explicit EvpDigest(Algorithm algorithm);

    void update(const std::uint8_t* data, std::size_t size) override;
    std::vector<std::uint8_t> finish() override;

  private:
    ScopedMdContext ctx_;
};

/**
 * @brief Factory for the default digest implementation.
 *
 * @code
 * // Example Usage:
 * auto md5 = quid::crypto::make_digest(quid::crypto::Algorithm::MD5);
 * md5->update(data, size);
 * std::vector<std::uint8_t> sum = md5->finish(); // 16 bytes
 * @endcode
 */
std::unique_ptr<Digest> make_digest(Algorithm algorithm);

} // namespace quid::crypto
