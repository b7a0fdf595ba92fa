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
 * @file pipeline_test.cpp
 * @brief End-to-end runs: store, generator, encoder and layout together.
 *
 * @details
 * Each test uses its own scratch directory so the duplicate store starts
 * from a known state. Consecutive `Pipeline` instances over the same
 * directory model process restarts.
 */

#include "fixtures.hpp"
#include "framework.hpp"
#include "qrlabel/codec/qr_encoder.hpp"
#include "qrlabel/core/pipeline.hpp"
#include "qrlabel/infra/errors.hpp"
#include "qrlabel/layout/page_writer.hpp"
#include "qrlabel/storage/duplicate_store.hpp"

#include <atomic>
#include <filesystem>
#include <string>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

using qrlabel::core::Pipeline;
using qrlabel::test::RecordingPageWriter;
using qrlabel::test::ScratchDir;

/**
 * @brief Five labels on a 2 x 2 grid from an empty store.
 */
void test_pipeline_example_run()
{
    ScratchDir dir("pipeline_example");
    RecordingPageWriter writer;
    auto config = qrlabel::test::example_config(dir, 5);

    auto summary = Pipeline(config, writer).run();

    ASSERT_EQ(summary.tokens.size(), static_cast<size_t>(5));
    ASSERT_EQ(summary.tokens.front(), std::string("1-24-2024-D0-01"));
    ASSERT_EQ(summary.tokens.back(), std::string("1-24-2024-D0-05"));
    ASSERT_EQ(summary.pages.size(), static_cast<size_t>(2));
    ASSERT_FALSE(summary.interrupted);

    ASSERT_EQ(writer.pages.size(), static_cast<size_t>(2));
    ASSERT_EQ(writer.pages[0].tokens.size(), static_cast<size_t>(4));
    ASSERT_EQ(writer.pages[1].tokens.size(), static_cast<size_t>(1));
    ASSERT_EQ(writer.pages[1].tokens[0], std::string("1-24-2024-D0-05"));

    qrlabel::storage::DuplicateStore store(config.store_path);
    auto report = store.load();
    ASSERT_EQ(report.entries, static_cast<size_t>(5));
    for (const auto& token : summary.tokens) {
        ASSERT_TRUE(store.contains(token));
    }
}

/**
 * @brief A second run resumes after the highest committed sequence.
 */
void test_pipeline_resumes_after_restart()
{
    ScratchDir dir("pipeline_resume");
    RecordingPageWriter first_writer;
    Pipeline(qrlabel::test::example_config(dir, 5), first_writer).run();

    RecordingPageWriter second_writer;
    auto summary = Pipeline(qrlabel::test::example_config(dir, 3), second_writer).run();

    ASSERT_EQ(summary.tokens.size(), static_cast<size_t>(3));
    ASSERT_EQ(summary.tokens[0], std::string("1-24-2024-D0-06"));
    ASSERT_EQ(summary.tokens[2], std::string("1-24-2024-D0-08"));
    ASSERT_EQ(second_writer.pages.size(), static_cast<size_t>(1));

    qrlabel::storage::DuplicateStore store(dir.file("used_ids.csv"));
    ASSERT_EQ(store.load().entries, static_cast<size_t>(8));
}

void test_pipeline_zero_count()
{
    ScratchDir dir("pipeline_zero");
    RecordingPageWriter writer;
    auto summary = Pipeline(qrlabel::test::example_config(dir, 0), writer).run();

    ASSERT_TRUE(summary.tokens.empty());
    ASSERT_TRUE(summary.pages.empty());
    ASSERT_TRUE(writer.pages.empty());
    ASSERT_TRUE(fs::exists(dir.file("used_ids.csv")));
}

/**
 * @brief A pre-set stop flag issues nothing; no partial page is produced.
 */
void test_pipeline_stop_flag()
{
    ScratchDir dir("pipeline_stop");
    RecordingPageWriter writer;
    std::atomic<bool> stop{true};

    auto summary = Pipeline(qrlabel::test::example_config(dir, 5), writer).run(&stop);

    ASSERT_TRUE(summary.interrupted);
    ASSERT_TRUE(summary.tokens.empty());
    ASSERT_TRUE(writer.pages.empty());
}

void test_pipeline_first_sequence()
{
    ScratchDir dir("pipeline_first_sequence");
    RecordingPageWriter writer;
    auto config = qrlabel::test::example_config(dir, 2);
    config.first_sequence = 50;

    auto summary = Pipeline(config, writer).run();
    ASSERT_EQ(summary.tokens[0], std::string("1-24-2024-D0-50"));
    ASSERT_EQ(summary.tokens[1], std::string("1-24-2024-D0-51"));

    // The store is ahead of first_sequence now; the store wins.
    config.first_sequence = 10;
    auto next = Pipeline(config, writer).run();
    ASSERT_EQ(next.tokens[0], std::string("1-24-2024-D0-52"));
}

/**
 * @brief A store left by the earlier two-column script is resumed, not restarted.
 */
void test_pipeline_resumes_two_column_store()
{
    ScratchDir dir("pipeline_two_column");
    auto config = qrlabel::test::example_config(dir, 2);
    qrlabel::test::write_file(config.store_path, "ID,Generated On\r\n"
                                                 "1-24-2024-D0-01,2024-05-01 10:00:00\r\n"
                                                 "1-24-2024-D0-02,2024-05-01 10:00:00\r\n"
                                                 "broken row\n");

    RecordingPageWriter writer;
    auto summary = Pipeline(config, writer).run();

    ASSERT_EQ(summary.skipped_rows, static_cast<size_t>(1));
    ASSERT_EQ(summary.tokens[0], std::string("1-24-2024-D0-03"));
    ASSERT_EQ(summary.tokens[1], std::string("1-24-2024-D0-04"));

    qrlabel::storage::DuplicateStore store(config.store_path);
    ASSERT_EQ(store.load().entries, static_cast<size_t>(4));
}

void test_pipeline_unique_across_runs()
{
    ScratchDir dir("pipeline_unique");
    std::unordered_set<std::string> seen;

    for (int run = 0; run < 4; ++run) {
        RecordingPageWriter writer;
        auto summary = Pipeline(qrlabel::test::example_config(dir, 6), writer).run();
        for (const auto& token : summary.tokens) {
            ASSERT_TRUE(seen.insert(token).second);
        }
    }
    ASSERT_EQ(seen.size(), static_cast<size_t>(24));
}

/**
 * @brief A batch larger than the sequences left is refused before anything is issued.
 */
void test_pipeline_sequence_exhausted()
{
    ScratchDir dir("pipeline_exhausted");
    RecordingPageWriter writer;
    auto config = qrlabel::test::example_config(dir, 3);
    config.first_sequence = 98;

    ASSERT_THROWS(Pipeline(config, writer).run(), qrlabel::infra::SequenceExhaustedError);
    ASSERT_TRUE(writer.pages.empty());
    {
        qrlabel::storage::DuplicateStore store(config.store_path);
        ASSERT_EQ(store.load().entries, static_cast<size_t>(0));
        ASSERT_FALSE(store.contains("1-24-2024-D0-98"));
    }

    // Exactly the remaining sequences still fit.
    config.count = 2;
    auto summary = Pipeline(config, writer).run();
    ASSERT_EQ(summary.tokens.back(), std::string("1-24-2024-D0-99"));
}

/**
 * @brief A token too long for the symbol halts the run before it is committed.
 */
void test_pipeline_encoding_capacity_halts()
{
    ScratchDir dir("pipeline_capacity");
    RecordingPageWriter writer;
    auto config = qrlabel::test::example_config(dir, 1);
    config.encode.ecc = qrlabel::codec::ErrorCorrection::HIGH;
    config.encode.max_version = 1;

    ASSERT_THROWS(Pipeline(config, writer).run(), qrlabel::infra::EncodingCapacityError);
    ASSERT_TRUE(writer.pages.empty());

    qrlabel::storage::DuplicateStore store(config.store_path);
    ASSERT_EQ(store.load().entries, static_cast<size_t>(0));
    ASSERT_FALSE(store.contains("1-24-2024-D0-01"));
}

namespace {

/// @brief Records pages, but replaces the store file with a directory on the first one.
class StoreBreakingWriter : public RecordingPageWriter {
  public:
    explicit StoreBreakingWriter(std::string store_path) : store_path_(std::move(store_path)) {}

    std::string write(const qrlabel::layout::LayoutPage& page, const std::string& svg) override
    {
        if (!broken_) {
            saved_ = qrlabel::test::read_file(store_path_);
            fs::remove(store_path_);
            fs::create_directory(store_path_);
            broken_ = true;
        }
        return RecordingPageWriter::write(page, svg);
    }

    void restore()
    {
        fs::remove_all(store_path_);
        qrlabel::test::write_file(store_path_, saved_);
    }

  private:
    std::string store_path_;
    std::string saved_;
    bool broken_ = false;
};

} // namespace

/**
 * @brief Every printed label is already durable when its page is written.
 *
 * The store stops accepting appends right after the first page, so the run
 * fails on the next token. Every token on the page must already be in the
 * restored store, and the following run must not print any of them again.
 */
void test_pipeline_commits_before_printing()
{
    ScratchDir dir("pipeline_commit_order");
    auto config = qrlabel::test::example_config(dir, 5);
    StoreBreakingWriter writer(config.store_path);

    ASSERT_THROWS(Pipeline(config, writer).run(), qrlabel::infra::IoError);
    ASSERT_EQ(writer.pages.size(), static_cast<size_t>(1));
    writer.restore();

    std::unordered_set<std::string> printed;
    {
        qrlabel::storage::DuplicateStore store(config.store_path);
        store.load();
        for (const auto& token : writer.pages[0].tokens) {
            ASSERT_TRUE(store.contains(token));
            printed.insert(token);
        }
        ASSERT_FALSE(store.contains("1-24-2024-D0-05"));
    }

    RecordingPageWriter next_writer;
    config.count = 1;
    auto summary = Pipeline(config, next_writer).run();
    ASSERT_EQ(summary.tokens[0], std::string("1-24-2024-D0-05"));
    ASSERT_TRUE(printed.count(summary.tokens[0]) == 0);
}

void test_pipeline_rejects_invalid_config()
{
    ScratchDir dir("pipeline_invalid");
    RecordingPageWriter writer;
    auto config = qrlabel::test::example_config(dir, 1);
    config.geometry.rows = 0;

    ASSERT_THROWS(Pipeline(config, writer), qrlabel::infra::ConfigurationError);
}

/**
 * @brief The file writer produces one SVG per page under the output directory.
 */
void test_pipeline_writes_svg_files()
{
    ScratchDir dir("pipeline_files");
    auto config = qrlabel::test::example_config(dir, 5);
    qrlabel::layout::FilePageWriter writer(config.output_dir);

    auto summary = Pipeline(config, writer).run();

    ASSERT_EQ(summary.pages.size(), static_cast<size_t>(2));
    ASSERT_TRUE(fs::exists(fs::path(config.output_dir) /
                           "sticker_page_1-24-2024-D0-01-1-24-2024-D0-04.svg"));
    ASSERT_TRUE(fs::exists(fs::path(config.output_dir) /
                           "sticker_page_1-24-2024-D0-05-1-24-2024-D0-05.svg"));

    std::string svg = qrlabel::test::read_file(summary.pages[1]);
    ASSERT_EQ(qrlabel::test::count_occurrences(svg, "<image "), static_cast<size_t>(1));
}
