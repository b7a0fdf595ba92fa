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
 * @file pipeline.hpp
 * @brief Generation run driver: generate, encode, place, persist.
 */

#pragma once

#include "qrlabel/core/config.hpp"
#include "qrlabel/layout/page_writer.hpp"

#include <atomic>
#include <cstddef>
#include <string>
#include <vector>

namespace qrlabel::core {

/**
 * @struct RunSummary
 * @brief What one run committed.
 */
struct RunSummary {
    std::vector<std::string> tokens; ///< Newly issued tokens, in issue order.
    std::vector<std::string> pages;  ///< Writer results for each finalized page.
    std::size_t skipped_rows = 0;    ///< Malformed store rows ignored at load.
    bool interrupted = false;        ///< True if the stop flag ended the run early.
};

/**
 * @class Pipeline
 * @brief Runs one batch against the duplicate store.
 *
 * **Per identifier, strictly in sequence:**
 * 1. `IdentifierGenerator::next` against the store's known tokens.
 * 2. `QrEncoder::encode`.
 * 3. `DuplicateStore::append`.
 * 4. `LayoutAssembler::place` (may finalize a full page).
 *
 * A token therefore reaches a page only once it is durable. A failed page
 * write can leave committed tokens unprinted, never printed ones uncommitted.
 *
 * The starting sequence is recomputed from the store on every run, so a
 * restarted process resumes without reissuing anything already committed.
 */
class Pipeline {
  public:
    /**
     * @param config Validated run options.
     * @param writer Destination for finalized pages; must outlive the pipeline.
     */
    Pipeline(Config config, layout::PageWriter& writer);

    /**
     * @brief Executes the run.
     *
     * @param stop Optional flag polled between identifiers. When set, the
     * trailing page is finalized and the run returns early.
     *
     * @throws infra::SequenceExhaustedError before anything is issued when
     * `count` exceeds the sequences left in the series.
     * @throws infra::Error subclasses from any stage; nothing is retried.
     */
    RunSummary run(const std::atomic<bool>* stop = nullptr);

  private:
    Config config_;
    layout::PageWriter& writer_;
};

} // namespace qrlabel::core
