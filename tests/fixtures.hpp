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
 * @file fixtures.hpp
 * @brief Shared helpers: scratch directories, an in-memory page writer, file IO.
 */

#pragma once

#include "qrlabel/core/config.hpp"
#include "qrlabel/layout/page_writer.hpp"

#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <unistd.h>
#include <vector>

namespace qrlabel::test {

/**
 * @class ScratchDir
 * @brief RAII "clean room" directory under the system temp path.
 *
 * Purged on construction and removed on destruction.
 */
class ScratchDir {
  public:
    explicit ScratchDir(const std::string& name)
        : path_((std::filesystem::temp_directory_path() /
                 ("qrlabel_" + name + "_" + std::to_string(::getpid())))
                    .string())
    {
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~ScratchDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::string& path() const { return path_; }

    std::string file(const std::string& name) const
    {
        return (std::filesystem::path(path_) / name).string();
    }

  private:
    std::string path_;
};

/**
 * @struct CapturedPage
 * @brief Snapshot of one page received by `RecordingPageWriter`.
 */
struct CapturedPage {
    std::size_t number = 0;
    std::vector<std::string> tokens;
    std::vector<double> xs;
    std::vector<double> ys;
    std::string svg;
};

/**
 * @class RecordingPageWriter
 * @brief Keeps finalized pages in memory instead of writing files.
 */
class RecordingPageWriter : public layout::PageWriter {
  public:
    std::string write(const layout::LayoutPage& page, const std::string& svg) override
    {
        CapturedPage captured;
        captured.number = page.number();
        captured.svg = svg;
        for (const auto& cell : page.cells()) {
            captured.tokens.push_back(cell.label);
            captured.xs.push_back(cell.x);
            captured.ys.push_back(cell.y);
        }
        pages.push_back(std::move(captured));
        return "page-" + std::to_string(page.number());
    }

    std::vector<CapturedPage> pages;
};

inline std::string read_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

inline void write_file(const std::string& path, const std::string& content)
{
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file << content;
}

inline std::size_t count_occurrences(const std::string& haystack, const std::string& needle)
{
    std::size_t count = 0;
    for (auto pos = haystack.find(needle); pos != std::string::npos;
         pos = haystack.find(needle, pos + needle.size())) {
        count++;
    }
    return count;
}

/// @brief The worked example configuration: series 1-24-2024-D0 on a 2 x 2 grid.
inline core::Config example_config(const ScratchDir& dir, std::size_t count)
{
    core::Config config;
    config.series = {1, "24", 2024, "D0"};
    config.count = count;
    config.geometry.rows = 2;
    config.geometry.columns = 2;
    config.store_path = dir.file("used_ids.csv");
    config.output_dir = dir.file("output");
    config.encode.module_scale = 2;
    return config;
}

} // namespace qrlabel::test
