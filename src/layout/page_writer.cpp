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
 * @file page_writer.cpp
 * @brief Filesystem page writer.
 *
 * @details
 * Pages are written to a `.tmp` sibling first and renamed into place, so a
 * file with the final name is always a complete document.
 */

#include "qrlabel/layout/page_writer.hpp"

#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"

#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

namespace qrlabel::layout {

FilePageWriter::FilePageWriter(std::string output_dir) : output_dir_(std::move(output_dir)) {}

std::string FilePageWriter::file_name(const LayoutPage& page)
{
    return "sticker_page_" + page.first_token() + "-" + page.last_token() + ".svg";
}

std::string FilePageWriter::write(const LayoutPage& page, const std::string& svg)
{
    std::error_code ec;
    fs::create_directories(output_dir_, ec);
    if (ec) {
        throw infra::IoError(output_dir_, ec.message());
    }

    const std::string path = (fs::path(output_dir_) / file_name(page)).string();
    const std::string temp_path = path + ".tmp";

    {
        std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            throw infra::IoError(temp_path, "cannot open for writing");
        }
        file.write(svg.data(), static_cast<std::streamsize>(svg.size()));
        file.flush();
        if (!file.good()) {
            file.close();
            fs::remove(temp_path, ec);
            throw infra::IoError(temp_path, "write failed");
        }
    }

    fs::rename(temp_path, path, ec);
    if (ec) {
        std::string reason = ec.message();
        fs::remove(temp_path, ec);
        throw infra::IoError(path, reason);
    }

    infra::Logger::log(infra::LogLevel::INFO, "Layout: Page " + std::to_string(page.number()) +
                                                  " (" + std::to_string(page.cells().size()) +
                                                  " labels) written to " + path);
    return path;
}

} // namespace qrlabel::layout
