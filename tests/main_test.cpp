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
 * @file main_test.cpp
 * @brief Central orchestrator for the quid test suite.
 *
 * @details
 * This file serves as the main entry point for the testing environment. It
 * aggregates unit tests across all subsystems: Infrastructure, Identifier
 * Type, Codec, Generators and Conversion Adapters.
 */

#include "framework.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================

// Infrastructure Subsystem (infra_test.cpp)
void test_hex_encode();
void test_hex_decode();
void test_logger_parse_level();
void test_logger_threshold();
void test_digest_known_answers();
void test_digest_incremental();
void test_system_random_source();

// Identifier Type (uuid_test.cpp)
void test_uuid_default_is_nil();
void test_uuid_version_nibble();
void test_uuid_variant_decoding();
void test_uuid_time_absent_for_other_versions();
void test_uuid_time_decodes_v7_prefix();
void test_uuid_equality_ordering_hash();
void test_uuid_namespace_constants();
void test_uuid_stream_insertion();

// Codec (codec_test.cpp)
void test_format_shape();
void test_format_byte_mapping();
void test_parse_canonical();
void test_parse_compact();
void test_parse_raw_bytes();
void test_parse_uppercase();
void test_parse_rejects_invalid_hex();
void test_parse_rejects_misplaced_hyphen();
void test_parse_rejects_bad_length();
void test_parse_canonical_only();
void test_parse_round_trip();
void test_must();

// Generators (generator_test.cpp)
void test_name_based_known_vectors();
void test_name_based_determinism();
void test_name_based_byte_names();
void test_v4_random();
void test_v4_injected_source();
void test_v7_layout();
void test_v7_time_fidelity();
void test_v7_pre_epoch_wraps();
void test_v7_ordering();
void test_random_source_failure();
void test_variant_bits_all_versions();
void test_v4_concurrent_generation();

// Conversion Adapters (adapters_test.cpp)
void test_binary_adapter();
void test_text_adapter();
void test_quoted_text_adapter();
void test_quoted_text_rejects_malformed();
void test_decode_into_is_all_or_nothing();
void test_scalar_adapter();
void test_scalar_adapter_rejects_other_types();
void test_json_adapter_round_trip();
void test_json_adapter_rejects_non_canonical();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed (Success).
 * - 1: One or more assertions failed (Exit failure for CI pipelines).
 */
int main()
{
    std::cout << "\033[36mInitiating quid Test Suite...\033[0m" << std::endl;

    // --- 1. Infrastructure ---
    RUN_TEST(test_hex_encode);
    RUN_TEST(test_hex_decode);
    RUN_TEST(test_logger_parse_level);
    RUN_TEST(test_logger_threshold);
    RUN_TEST(test_digest_known_answers);
    RUN_TEST(test_digest_incremental);
    RUN_TEST(test_system_random_source);

    // --- 2. Identifier Type ---
    RUN_TEST(test_uuid_default_is_nil);
    RUN_TEST(test_uuid_version_nibble);
    RUN_TEST(test_uuid_variant_decoding);
    RUN_TEST(test_uuid_time_absent_for_other_versions);
    RUN_TEST(test_uuid_time_decodes_v7_prefix);
    RUN_TEST(test_uuid_equality_ordering_hash);
    RUN_TEST(test_uuid_namespace_constants);
    RUN_TEST(test_uuid_stream_insertion);

    // --- 3. Codec ---
    RUN_TEST(test_format_shape);
    RUN_TEST(test_format_byte_mapping);
    RUN_TEST(test_parse_canonical);
    RUN_TEST(test_parse_compact);
    RUN_TEST(test_parse_raw_bytes);
    RUN_TEST(test_parse_uppercase);
    RUN_TEST(test_parse_rejects_invalid_hex);
    RUN_TEST(test_parse_rejects_misplaced_hyphen);
    RUN_TEST(test_parse_rejects_bad_length);
    RUN_TEST(test_parse_canonical_only);
    RUN_TEST(test_parse_round_trip);
    RUN_TEST(test_must);

    // --- 4. Generators ---
    RUN_TEST(test_name_based_known_vectors);
    RUN_TEST(test_name_based_determinism);
    RUN_TEST(test_name_based_byte_names);
    RUN_TEST(test_v4_random);
    RUN_TEST(test_v4_injected_source);
    RUN_TEST(test_v7_layout);
    RUN_TEST(test_v7_time_fidelity);
    RUN_TEST(test_v7_pre_epoch_wraps);
    RUN_TEST(test_v7_ordering);
    RUN_TEST(test_random_source_failure);
    RUN_TEST(test_variant_bits_all_versions);
    RUN_TEST(test_v4_concurrent_generation);

    // --- 5. Conversion Adapters ---
    RUN_TEST(test_binary_adapter);
    RUN_TEST(test_text_adapter);
    RUN_TEST(test_quoted_text_adapter);
    RUN_TEST(test_quoted_text_rejects_malformed);
    RUN_TEST(test_decode_into_is_all_or_nothing);
    RUN_TEST(test_scalar_adapter);
    RUN_TEST(test_scalar_adapter_rejects_other_types);
    RUN_TEST(test_json_adapter_round_trip);
    RUN_TEST(test_json_adapter_rejects_non_canonical);

    quid::test::print_summary();

    return (quid::test::failed_count == 0) ? 0 : 1;
}
