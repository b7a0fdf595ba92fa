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
 * @file page.hpp
 * @brief Fixed-grid label page and its SVG serialization.
 *
 * @details
 * A `LayoutPage` holds up to `rows * columns` cells, filled strictly in
 * row-major order. Cell positions are pure functions of the cell index and
 * the `Geometry`, so the same input always serializes to the same document.
 *
 * **Page lifecycle:** `EMPTY -> FILLING -> FULL -> FINALIZED`. A partially
 * filled page may go straight from `FILLING` to `FINALIZED` when the
 * identifier stream ends.
 */

#pragma once

#include "qrlabel/codec/qr_encoder.hpp"
#include "qrlabel/core/record.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace qrlabel::layout {

/**
 * @struct Geometry
 * @brief Grid and cell dimensions in SVG user units.
 *
 * The defaults place the A4 sticker sheet's labels: 3 x 9 stickers of
 * 180 x 83.9, each split into 2 x 2 labels, drawn as 18 x 6 abutting cells.
 * Each cell gets its own outline, and the column gutters between stickers
 * are not reproduced. Set `sheet_width`/`sheet_height` (595.3 x 841.9 for
 * A4) to pin the page size; left at 0 the page is sized from the grid.
 */
struct Geometry {
    int rows = 18;
    int columns = 6;
    double cell_width = 90.0;
    double cell_height = 41.95;
    double margin_x = 21.3;
    double margin_y = 43.4;
    int label_wrap = 0; ///< Characters per label line; 0 keeps the token on one line.
    double sheet_width = 0.0;  ///< Fixed page width; 0 derives it from the grid.
    double sheet_height = 0.0; ///< Fixed page height; 0 derives it from the grid.

    std::size_t capacity() const;
    double page_width() const;
    double page_height() const;

    /**
     * @throws infra::ConfigurationError if a dimension is non-positive, the
     * grid is empty, or a fixed sheet is too small for margin plus grid.
     */
    void check() const;
};

/**
 * @struct Cell
 * @brief One placed label.
 */
struct Cell {
    std::size_t index = 0;
    int row = 0;
    int column = 0;
    double x = 0.0; ///< Absolute left edge on the page.
    double y = 0.0; ///< Absolute top edge on the page.
    std::string label;
    codec::EncodedSymbol symbol;
};

enum class PageState { EMPTY, FILLING, FULL, FINALIZED };

class LayoutPage {
  public:
    /// @param number 1-based page number within the run.
    LayoutPage(std::size_t number, Geometry geometry);

    /**
     * @brief Places the next cell at the next row-major slot.
     *
     * The label is the record's token. The page becomes `FULL` when the last
     * slot is taken.
     *
     * @throws infra::Error if the page is `FULL` or `FINALIZED`, or if the
     * symbol does not belong to the record.
     */
    void place(const core::IdentifierRecord& record, codec::EncodedSymbol symbol);

    /**
     * @brief Serializes the page and freezes it.
     *
     * @return The SVG document.
     * @throws infra::Error if the page is empty or already finalized.
     */
    std::string finalize();

    /// @brief Renders the SVG document for the cells placed so far.
    std::string to_svg() const;

    PageState state() const { return state_; }
    bool full() const { return cells_.size() >= geometry_.capacity(); }
    std::size_t number() const { return number_; }
    const Geometry& geometry() const { return geometry_; }
    const std::vector<Cell>& cells() const { return cells_; }

    /// @brief Token of the first placed cell (empty when the page is empty).
    std::string first_token() const;

    /// @brief Token of the last placed cell (empty when the page is empty).
    std::string last_token() const;

  private:
    std::size_t number_;
    Geometry geometry_;
    std::vector<Cell> cells_;
    PageState state_ = PageState::EMPTY;
};

} // namespace qrlabel::layout
