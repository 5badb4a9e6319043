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
 * @file digest.cpp
 * @brief Implementation of the OpenSSL EVP digest wrapper.
 *
 * @details
 * Every EVP call returns 1 on success. Any other value is translated into a
 * `DigestError` carrying the name of the failing step; the owning
 * `ScopedMdContext` then releases the context during stack unwinding.
 */

#include "quid/crypto/digest.hpp"

namespace quid::crypto {

namespace {

const EVP_MD* resolve(Algorithm algorithm)
{
    switch (algorithm) {
    case Algorithm::MD5:
        return EVP_md5();
    case Algorithm::SHA1:
        return EVP_sha1();
    }
    return nullptr;
}

} // namespace

ScopedMdContext::ScopedMdContext() : ctx_(EVP_MD_CTX_new())
{
    if (!ctx_) {
        throw DigestError("EVP_MD_CTX_new failed");
    }
}

EvpDigest::EvpDigest(Algorithm algorithm)
{
    const EVP_MD* md = resolve(algorithm);
    if (!md || EVP_DigestInit_ex(ctx_.get(), md, nullptr) != 1) {
        throw DigestError("EVP_DigestInit_ex failed");
    }
}

void EvpDigest::update(const std::uint8_t* data, std::size_t size)
{
    if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
        throw DigestError("EVP_DigestUpdate failed");
    }
}

std::vector<std::uint8_t> EvpDigest::finish()
{
    unsigned char sum[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), sum, &length) != 1) {
        throw DigestError("EVP_DigestFinal_ex failed");
    }
    return std::vector<std::uint8_t>(sum, sum + length);
}

std::unique_ptr<Digest> make_digest(Algorithm algorithm)
{
    return std::make_unique<EvpDigest>(algorithm);
}

} // namespace quid::crypto
