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
 * @file png.hpp
 * @brief In-memory grayscale PNG encoding and decoding (libpng simplified API).
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qrlabel::codec {

/**
 * @struct GrayImage
 * @brief 8-bit single-channel raster, row-major, no row padding.
 */
struct GrayImage {
    std::uint32_t width = 0;
    std::uint32_t height = 0;
    std::vector<std::uint8_t> pixels;

    std::uint8_t at(std::uint32_t x, std::uint32_t y) const
    {
        return pixels[static_cast<std::size_t>(y) * width + x];
    }
};

class Png {
  public:
    /**
     * @brief Serializes a grayscale raster to PNG bytes.
     *
     * Output carries no timestamp chunk, so identical rasters produce
     * byte-identical files.
     *
     * @throws infra::Error if libpng rejects the image.
     */
    static std::vector<std::uint8_t> encode(const GrayImage& image);

    /**
     * @brief Reads PNG bytes back into a grayscale raster (color input is converted).
     *
     * @throws infra::Error if the data is not a readable PNG.
     */
    static GrayImage decode(const std::vector<std::uint8_t>& bytes);
};

} // namespace qrlabel::codec
