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
 * @file png.cpp
 * @brief PNG codec built on libpng's `png_image` interface.
 *
 * @details
 * Writing is two-pass: a first `png_image_write_to_memory` call with a null
 * buffer reports the required size, the second fills the buffer.
 */

#include "qrlabel/codec/png.hpp"

#include "qrlabel/infra/errors.hpp"

#include <cstring>
#include <png.h>
#include <string>

namespace qrlabel::codec {

std::vector<std::uint8_t> Png::encode(const GrayImage& image)
{
    if (image.width == 0 || image.height == 0 ||
        image.pixels.size() != static_cast<std::size_t>(image.width) * image.height) {
        throw infra::Error("PNG encode: raster dimensions do not match pixel buffer");
    }

    png_image info;
    std::memset(&info, 0, sizeof(info));
    info.version = PNG_IMAGE_VERSION;
    info.width = image.width;
    info.height = image.height;
    info.format = PNG_FORMAT_GRAY;

    png_alloc_size_t size = 0;
    if (!png_image_write_to_memory(&info, nullptr, &size, 0, image.pixels.data(), 0, nullptr)) {
        std::string reason = info.message;
        png_image_free(&info);
        throw infra::Error("PNG encode: " + reason);
    }

    std::vector<std::uint8_t> out(size);
    if (!png_image_write_to_memory(&info, out.data(), &size, 0, image.pixels.data(), 0,
                                   nullptr)) {
        std::string reason = info.message;
        png_image_free(&info);
        throw infra::Error("PNG encode: " + reason);
    }
    out.resize(size);
    return out;
}

GrayImage Png::decode(const std::vector<std::uint8_t>& bytes)
{
    png_image info;
    std::memset(&info, 0, sizeof(info));
    info.version = PNG_IMAGE_VERSION;

    if (!png_image_begin_read_from_memory(&info, bytes.data(), bytes.size())) {
        std::string reason = info.message;
        png_image_free(&info);
        throw infra::Error("PNG decode: " + reason);
    }

    info.format = PNG_FORMAT_GRAY;

    GrayImage image;
    image.width = info.width;
    image.height = info.height;
    image.pixels.resize(PNG_IMAGE_SIZE(info));

    if (!png_image_finish_read(&info, nullptr, image.pixels.data(), 0, nullptr)) {
        std::string reason = info.message;
        png_image_free(&info);
        throw infra::Error("PNG decode: " + reason);
    }
    return image;
}

} // namespace qrlabel::codec
