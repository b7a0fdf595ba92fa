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
 * @file assembler.hpp
 * @brief Streams (identifier, symbol) pairs into consecutive label pages.
 */

#pragma once

#include "qrlabel/codec/qr_encoder.hpp"
#include "qrlabel/core/record.hpp"
#include "qrlabel/layout/page.hpp"
#include "qrlabel/layout/page_writer.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace qrlabel::layout {

/**
 * @class LayoutAssembler
 * @brief Fills pages one at a time and hands each to a `PageWriter` when done.
 *
 * A page is finalized the moment its last slot is taken; the next placement
 * opens a new page. `finish` finalizes a trailing partial page. No placement
 * at all means no page at all.
 */
class LayoutAssembler {
  public:
    /**
     * @param geometry Grid shared by every page.
     * @param writer Destination for finalized pages; must outlive the assembler.
     * @throws infra::ConfigurationError if the geometry is invalid.
     */
    LayoutAssembler(Geometry geometry, PageWriter& writer);

    /**
     * @brief Places one label, finalizing the page if it becomes full.
     *
     * @throws infra::Error after `finish` has been called.
     */
    void place(const core::IdentifierRecord& record, codec::EncodedSymbol symbol);

    /// @brief Finalizes the current partial page, if any. Idempotent.
    void finish();

    /// @brief Number of pages handed to the writer so far.
    std::size_t pages_written() const { return outputs_.size(); }

    /// @brief Values returned by the writer, in page order.
    const std::vector<std::string>& outputs() const { return outputs_; }

    /// @brief Cells placed on the current (not yet finalized) page.
    std::size_t pending_cells() const { return current_ ? current_->cells().size() : 0; }

  private:
    void flush_current();

    Geometry geometry_;
    PageWriter& writer_;
    std::optional<LayoutPage> current_;
    std::vector<std::string> outputs_;
    std::size_t next_page_number_ = 1;
    bool finished_ = false;
};

} // namespace qrlabel::layout
