/*
 * QRLABEL LICENSE
 * Version 1.0, February 2026
 *
 * Copyright (c) 2026 The qrlabel Authors.
 * See the LICENSE file at the repository root.
 *
 * This source code is licensed under the MIT License.
 * You may not use this file except in compliance with the License.
 */

/**
 * @file main_test.cpp
 * @brief Central orchestrator for the qrlabel test suite.
 *
 * @details
 * Aggregates unit and integration tests across all subsystems:
 * Infrastructure, Storage, Generation, Encoding, Layout, Configuration and
 * the Pipeline that ties them together.
 */

#include "framework.hpp"
#include "qrlabel/infra/logger.hpp"

#include <iostream>

// ============================================================================
// Forward Declarations
// ============================================================================
// The following test functions are implemented in their respective
// translation units (e.g., infra_test.cpp, storage_test.cpp, etc.).

// Infrastructure (infra_test.cpp)
void test_string_trim();
void test_string_trim_empty();
void test_string_split_keeps_empty_fields();
void test_string_split_multichar_separator();
void test_string_helpers();
void test_base64_known_vectors();
void test_base64_binary_bytes();
void test_base64_decode_rejects_garbage();
void test_log_level_parsing();
void test_error_messages_carry_context();

// Duplicate Store (storage_test.cpp)
void test_store_creates_file_with_header();
void test_store_append_and_reload();
void test_store_skips_malformed_rows();
void test_store_parse_row_reports_line();
void test_store_isolates_torn_tail();
void test_store_never_truncates();
void test_store_max_sequence_per_series();
void test_store_rejects_duplicate_append();
void test_store_unwritable_path_is_io_error();
void test_store_reads_two_column_rows();
void test_store_rejects_token_disagreeing_with_columns();

// Token Format and Generator (generator_test.cpp)
void test_token_format_default_rendering();
void test_token_format_compact_layout();
void test_token_format_parse();
void test_token_format_rejects_bad_values();
void test_token_format_rejects_bad_definitions();
void test_generator_first_token();
void test_generator_is_deterministic();
void test_generator_skips_known_tokens();
void test_generator_sequence_exhausted();
void test_generator_exhausted_by_collisions();
void test_generator_rejects_unfit_series();

// QR Encoder (encoder_test.cpp)
void test_encoder_dimensions();
void test_encoder_is_deterministic();
void test_encoder_capacity_error();
void test_encoder_raster_layout();
void test_encoder_data_uri();
void test_error_correction_parsing();
void test_encoder_rejects_bad_options();
void test_png_rejects_garbage();

// Page Layout (layout_test.cpp)
void test_geometry_dimensions();
void test_geometry_fixed_sheet();
void test_page_row_major_positions();
void test_page_state_transitions();
void test_page_rejects_mismatched_symbol();
void test_page_svg_content();
void test_page_label_wrap();
void test_assembler_zero_items();
void test_assembler_batches_pages();
void test_assembler_huge_grid_single_label();
void test_assembler_exact_multiple();
void test_file_page_writer();

// Configuration (config_test.cpp)
void test_config_defaults();
void test_config_overrides();
void test_config_sheet_size();
void test_config_missing_required_key();
void test_config_rejects_bad_types();
void test_config_rejects_invalid_json();
void test_config_rejects_unfit_series();
void test_config_ignores_unknown_keys();
void test_config_load_file();

// Pipeline (pipeline_test.cpp)
void test_pipeline_example_run();
void test_pipeline_resumes_after_restart();
void test_pipeline_zero_count();
void test_pipeline_stop_flag();
void test_pipeline_first_sequence();
void test_pipeline_resumes_two_column_store();
void test_pipeline_unique_across_runs();
void test_pipeline_sequence_exhausted();
void test_pipeline_encoding_capacity_halts();
void test_pipeline_commits_before_printing();
void test_pipeline_rejects_invalid_config();
void test_pipeline_writes_svg_files();

/**
 * @brief Test Suite Execution Entry Point.
 *
 * @return
 * - 0: All tests passed.
 * - 1: One or more assertions failed.
 */
int main()
{
    std::cout << "\033[36mInitiating qrlabel Test Suite...\033[0m" << std::endl;

    // Pipeline runs log every page; keep the report readable.
    qrlabel::infra::Logger::set_level(qrlabel::infra::LogLevel::WARN);

    // --- 1. Infrastructure Tests ---
    // Verifies string, base64, logging and error primitives.
    RUN_TEST(test_string_trim);
    RUN_TEST(test_string_trim_empty);
    RUN_TEST(test_string_split_keeps_empty_fields);
    RUN_TEST(test_string_split_multichar_separator);
    RUN_TEST(test_string_helpers);
    RUN_TEST(test_base64_known_vectors);
    RUN_TEST(test_base64_binary_bytes);
    RUN_TEST(test_base64_decode_rejects_garbage);
    RUN_TEST(test_log_level_parsing);
    RUN_TEST(test_error_messages_carry_context);

    // --- 2. Duplicate Store Tests ---
    // Verifies append-only persistence, replay, and recovery from damaged rows.
    RUN_TEST(test_store_creates_file_with_header);
    RUN_TEST(test_store_append_and_reload);
    RUN_TEST(test_store_skips_malformed_rows);
    RUN_TEST(test_store_parse_row_reports_line);
    RUN_TEST(test_store_isolates_torn_tail);
    RUN_TEST(test_store_never_truncates);
    RUN_TEST(test_store_max_sequence_per_series);
    RUN_TEST(test_store_rejects_duplicate_append);
    RUN_TEST(test_store_unwritable_path_is_io_error);
    RUN_TEST(test_store_reads_two_column_rows);
    RUN_TEST(test_store_rejects_token_disagreeing_with_columns);

    // --- 3. Token Format and Generator Tests ---
    // Verifies rendering, parsing, and collision-free sequence selection.
    RUN_TEST(test_token_format_default_rendering);
    RUN_TEST(test_token_format_compact_layout);
    RUN_TEST(test_token_format_parse);
    RUN_TEST(test_token_format_rejects_bad_values);
    RUN_TEST(test_token_format_rejects_bad_definitions);
    RUN_TEST(test_generator_first_token);
    RUN_TEST(test_generator_is_deterministic);
    RUN_TEST(test_generator_skips_known_tokens);
    RUN_TEST(test_generator_sequence_exhausted);
    RUN_TEST(test_generator_exhausted_by_collisions);
    RUN_TEST(test_generator_rejects_unfit_series);

    // --- 4. QR Encoder Tests ---
    // Verifies symbol sizing, capacity limits, and the PNG raster.
    RUN_TEST(test_encoder_dimensions);
    RUN_TEST(test_encoder_is_deterministic);
    RUN_TEST(test_encoder_capacity_error);
    RUN_TEST(test_encoder_raster_layout);
    RUN_TEST(test_encoder_data_uri);
    RUN_TEST(test_error_correction_parsing);
    RUN_TEST(test_encoder_rejects_bad_options);
    RUN_TEST(test_png_rejects_garbage);

    // --- 5. Page Layout Tests ---
    // Verifies grid placement, SVG output, and page batching.
    RUN_TEST(test_geometry_dimensions);
    RUN_TEST(test_geometry_fixed_sheet);
    RUN_TEST(test_page_row_major_positions);
    RUN_TEST(test_page_state_transitions);
    RUN_TEST(test_page_rejects_mismatched_symbol);
    RUN_TEST(test_page_svg_content);
    RUN_TEST(test_page_label_wrap);
    RUN_TEST(test_assembler_zero_items);
    RUN_TEST(test_assembler_batches_pages);
    RUN_TEST(test_assembler_huge_grid_single_label);
    RUN_TEST(test_assembler_exact_multiple);
    RUN_TEST(test_file_page_writer);

    // --- 6. Configuration Tests ---
    // Verifies JSON parsing, defaults, and validation.
    RUN_TEST(test_config_defaults);
    RUN_TEST(test_config_overrides);
    RUN_TEST(test_config_sheet_size);
    RUN_TEST(test_config_missing_required_key);
    RUN_TEST(test_config_rejects_bad_types);
    RUN_TEST(test_config_rejects_invalid_json);
    RUN_TEST(test_config_rejects_unfit_series);
    RUN_TEST(test_config_ignores_unknown_keys);
    RUN_TEST(test_config_load_file);

    // --- 7. Pipeline Tests ---
    // End-to-end runs over a scratch store, including restarts.
    RUN_TEST(test_pipeline_example_run);
    RUN_TEST(test_pipeline_resumes_after_restart);
    RUN_TEST(test_pipeline_zero_count);
    RUN_TEST(test_pipeline_stop_flag);
    RUN_TEST(test_pipeline_first_sequence);
    RUN_TEST(test_pipeline_resumes_two_column_store);
    RUN_TEST(test_pipeline_unique_across_runs);
    RUN_TEST(test_pipeline_sequence_exhausted);
    RUN_TEST(test_pipeline_encoding_capacity_halts);
    RUN_TEST(test_pipeline_commits_before_printing);
    RUN_TEST(test_pipeline_rejects_invalid_config);
    RUN_TEST(test_pipeline_writes_svg_files);

    qrlabel::test::print_summary("qrlabel");

    return (qrlabel::test::failed_count == 0) ? 0 : 1;
}
