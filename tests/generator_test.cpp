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
 * @file generator_test.cpp
 * @brief Unit tests for the v3, v4, v5 and v7 construction algorithms.
 *
 * @details
 * Random generators are exercised twice: against the real system source, and
 * against injected sources that either produce a fixed pattern (to pin the v7
 * byte layout) or fail (to verify error propagation).
 */

#include "quid/core/error.hpp"
#include "quid/gen/id_generator.hpp"
#include "quid/infra/random_source.hpp"
#include "framework.hpp"

#include <cerrno>
#include <chrono>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <vector>

using quid::core::Uuid;
using quid::gen::IdGenerator;

namespace {

/**
 * @class PatternRandomSource
 * @brief Deterministic source that fills every byte with a fixed value.
 */
class PatternRandomSource : public quid::infra::RandomSource {
  public:
    explicit PatternRandomSource(std::uint8_t value) : value_(value) {}

    void fill(std::uint8_t* buffer, std::size_t size) override
    {
        for (std::size_t i = 0; i < size; ++i) {
            buffer[i] = value_;
        }
        requested_ += size;
    }

    std::size_t requested() const
    {
        return requested_;
    }

  private:
    std::uint8_t value_;
    std::size_t requested_ = 0;
};

/**
 * @class FailingRandomSource
 * @brief Source that always reports an exhausted entropy pool.
 */
class FailingRandomSource : public quid::infra::RandomSource {
  public:
    void fill(std::uint8_t*, std::size_t) override
    {
        throw quid::core::RandomSourceError(std::error_code(EAGAIN, std::system_category()),
                                            "entropy pool exhausted");
    }
};

using Clock = std::chrono::system_clock;

Clock::time_point from_millis(long long millis)
{
    return Clock::time_point(std::chrono::milliseconds(millis));
}

long long to_millis(Clock::time_point time)
{
    return static_cast<long long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(time.time_since_epoch()).count());
}

long long to_millis(Uuid::TimePoint time)
{
    return static_cast<long long>(time.time_since_epoch().count());
}

bool has_rfc_variant(const Uuid& uuid)
{
    return (uuid[8] >> 6) == 2;
}

} // namespace

/**
 * @brief RFC known answers for the DNS namespace and "python.org".
 */
void test_name_based_known_vectors()
{
    ASSERT_EQ(IdGenerator::v3(quid::core::kNamespaceDns, "python.org").to_string(),
              std::string("6fa459ea-ee8a-3ca4-894e-db77e160355e"));
    ASSERT_EQ(IdGenerator::v5(quid::core::kNamespaceDns, "python.org").to_string(),
              std::string("886313e1-3b8a-5372-9b90-0c9aee199e5d"));
}

/**
 * @brief Same namespace and name always produce the same identifier.
 */
void test_name_based_determinism()
{
    Uuid ns = IdGenerator::v4();

    Uuid a3 = IdGenerator::v3(ns, "testing");
    Uuid b3 = IdGenerator::v3(ns, "testing");
    ASSERT_EQ(a3, b3);
    ASSERT_EQ(a3.version(), 3);
    ASSERT_TRUE(has_rfc_variant(a3));

    Uuid a5 = IdGenerator::v5(ns, "testing");
    Uuid b5 = IdGenerator::v5(ns, "testing");
    ASSERT_EQ(a5, b5);
    ASSERT_EQ(a5.version(), 5);
    ASSERT_TRUE(has_rfc_variant(a5));

    // Different hash, different name or different namespace: different result.
    ASSERT_NE(a3, a5);
    ASSERT_NE(a5, IdGenerator::v5(ns, "testing!"));
    ASSERT_NE(a5, IdGenerator::v5(quid::core::kNamespaceUrl, "testing"));
}

/**
 * @brief Text names and byte names hash identically.
 */
void test_name_based_byte_names()
{
    const std::string name = "www.example.com";
    const std::vector<std::uint8_t> bytes(name.begin(), name.end());

    ASSERT_EQ(IdGenerator::v3(quid::core::kNamespaceDns, bytes),
              IdGenerator::v3(quid::core::kNamespaceDns, name));
    ASSERT_EQ(IdGenerator::v5(quid::core::kNamespaceDns, bytes),
              IdGenerator::v5(quid::core::kNamespaceDns, name));

    // Empty names are valid input.
    ASSERT_EQ(IdGenerator::v5(quid::core::kNamespaceDns, "").version(), 5);
}

/**
 * @brief v4 carries version 4, the RFC variant, and is not repeated.
 */
void test_v4_random()
{
    Uuid a = IdGenerator::v4();
    Uuid b = IdGenerator::v4();
    ASSERT_EQ(a.version(), 4);
    ASSERT_EQ(b.version(), 4);
    ASSERT_TRUE(has_rfc_variant(a));
    ASSERT_TRUE(has_rfc_variant(b));
    ASSERT_NE(a, b);
    ASSERT_FALSE(a.time().has_value());
}

/**
 * @brief With a constant source only the version and variant bits differ.
 */
void test_v4_injected_source()
{
    PatternRandomSource source(0xFF);
    Uuid uuid = IdGenerator::v4(source);
    ASSERT_EQ(uuid.to_string(), std::string("ffffffff-ffff-4fff-bfff-ffffffffffff"));
    ASSERT_EQ(source.requested(), static_cast<std::size_t>(16));

    PatternRandomSource zeros(0x00);
    ASSERT_EQ(IdGenerator::v4(zeros).to_string(),
              std::string("00000000-0000-4000-8000-000000000000"));
}

/**
 * @brief v7 layout: big-endian milliseconds, then random bytes under the version/variant.
 */
void test_v7_layout()
{
    PatternRandomSource source(0xFF);
    Uuid uuid = IdGenerator::v7(from_millis(0x0123456789ABLL), source);
    ASSERT_EQ(uuid.to_string(), std::string("01234567-89ab-7fff-bfff-ffffffffffff"));
    ASSERT_EQ(source.requested(), static_cast<std::size_t>(10));

    PatternRandomSource zeros(0x00);
    ASSERT_EQ(IdGenerator::v7(from_millis(0), zeros).to_string(),
              std::string("00000000-0000-7000-8000-000000000000"));
}

/**
 * @brief The embedded time reads back truncated to the millisecond.
 */
void test_v7_time_fidelity()
{
    const long long now_ms = to_millis(Clock::now());
    Uuid uuid = IdGenerator::v7(from_millis(now_ms));
    ASSERT_EQ(uuid.version(), 7);
    ASSERT_TRUE(has_rfc_variant(uuid));

    auto time = uuid.time();
    ASSERT_TRUE(time.has_value());
    ASSERT_EQ(to_millis(*time), now_ms);

    // Sub-millisecond precision is dropped, not rounded.
    auto precise = from_millis(1000) + std::chrono::microseconds(999);
    auto truncated = IdGenerator::v7(precise).time();
    ASSERT_TRUE(truncated.has_value());
    ASSERT_EQ(to_millis(*truncated), 1000LL);

    ASSERT_TRUE(IdGenerator::v7().time().has_value());
}

/**
 * @brief Pre-epoch instants wrap modulo 2^48 and read back without overflow.
 */
void test_v7_pre_epoch_wraps()
{
    auto wrapped = IdGenerator::v7(from_millis(-1)).time();
    ASSERT_TRUE(wrapped.has_value());
    ASSERT_EQ(to_millis(*wrapped), 281474976710655LL);

    auto earlier = IdGenerator::v7(from_millis(-1000)).time();
    ASSERT_TRUE(earlier.has_value());
    ASSERT_EQ(to_millis(*earlier), 281474976710655LL - 999LL);
}

/**
 * @brief Byte order of v7 identifiers follows their timestamps.
 */
void test_v7_ordering()
{
    Uuid earlier = IdGenerator::v7(from_millis(1700000000000LL));
    Uuid later = IdGenerator::v7(from_millis(1700000000001LL));
    ASSERT_TRUE(earlier < later);
}

/**
 * @brief Random source failures reach the caller with their error code intact.
 */
void test_random_source_failure()
{
    FailingRandomSource source;
    ASSERT_THROWS(quid::core::RandomSourceError, IdGenerator::v4(source));
    ASSERT_THROWS(quid::core::RandomSourceError, IdGenerator::v7(Clock::now(), source));

    try {
        IdGenerator::v4(source);
    } catch (const quid::core::RandomSourceError& e) {
        ASSERT_EQ(e.code().value(), EAGAIN);
        return;
    }
    ASSERT_TRUE(false);
}

/**
 * @brief Every generator sets the variant bits to binary 10.
 */
void test_variant_bits_all_versions()
{
    Uuid ns = IdGenerator::v4();
    for (int i = 0; i < 64; ++i) {
        const std::string name = "name-" + std::to_string(i);
        ASSERT_TRUE(has_rfc_variant(IdGenerator::v3(ns, name)));
        ASSERT_TRUE(has_rfc_variant(IdGenerator::v4()));
        ASSERT_TRUE(has_rfc_variant(IdGenerator::v5(ns, name)));
        ASSERT_TRUE(has_rfc_variant(IdGenerator::v7(from_millis(i))));
    }
}

/**
 * @brief Concurrent callers draw independently from the system source.
 */
void test_v4_concurrent_generation()
{
    constexpr int kThreads = 4;
    constexpr int kPerThread = 256;

    std::vector<std::vector<Uuid>> results(kThreads);
    std::vector<std::exception_ptr> errors(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; ++t) {
        workers.emplace_back([&results, &errors, t] {
            try {
                for (int i = 0; i < kPerThread; ++i) {
                    results[t].push_back(IdGenerator::v4());
                }
            } catch (...) {
                errors[t] = std::current_exception();
            }
        });
    }
    for (std::thread& worker : workers) {
        worker.join();
    }

    // Surface worker failures on the test thread so the runner can report them.
    for (const std::exception_ptr& error : errors) {
        if (error) {
            std::rethrow_exception(error);
        }
    }

    std::unordered_set<Uuid> unique;
    for (const auto& batch : results) {
        unique.insert(batch.begin(), batch.end());
    }
    ASSERT_EQ(unique.size(), static_cast<size_t>(kThreads * kPerThread));
}
