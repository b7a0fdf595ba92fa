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
 * @file page_writer.hpp
 * @brief Destinations for finalized label pages.
 */

#pragma once

#include "qrlabel/layout/page.hpp"

#include <string>

namespace qrlabel::layout {

/**
 * @class PageWriter
 * @brief Receives each finalized page exactly once.
 */
class PageWriter {
  public:
    virtual ~PageWriter() = default;

    /**
     * @brief Emits one finalized page.
     *
     * @param page The finalized page (cells, tokens, geometry).
     * @param svg Its serialized document.
     * @return A description of where the page went (e.g. the file path).
     */
    virtual std::string write(const LayoutPage& page, const std::string& svg) = 0;
};

/**
 * @class FilePageWriter
 * @brief Writes pages as `sticker_page_<first>-<last>.svg` into a directory.
 */
class FilePageWriter : public PageWriter {
  public:
    explicit FilePageWriter(std::string output_dir);

    /**
     * @throws infra::IoError if the directory cannot be created or the file
     * cannot be written completely.
     */
    std::string write(const LayoutPage& page, const std::string& svg) override;

    /// @brief File name (without directory) for a page.
    static std::string file_name(const LayoutPage& page);

  private:
    std::string output_dir_;
};

} // namespace qrlabel::layout
