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
 * @file qr_encoder.cpp
 * @brief QR symbol construction (qrcodegen) and rasterization (libpng).
 *
 * @details
 * Pipeline per token:
 * 1. **Segment**: `QrSegment::makeSegments` picks numeric, alphanumeric or byte mode.
 * 2. **Symbol**: `QrCode::encodeSegments` with the requested ECC and version ceiling.
 * 3. **Raster**: each module becomes a `scale x scale` block inside a light quiet zone.
 * 4. **Compress**: the raster is written as an 8-bit grayscale PNG.
 */

#include "qrlabel/codec/qr_encoder.hpp"

#include "qrlabel/codec/png.hpp"
#include "qrlabel/infra/base64.hpp"
#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"
#include "qrlabel/infra/string.hpp"

#include <algorithm>
#include <cstddef>
#include <qrcodegen.hpp>

namespace qrlabel::codec {

namespace {

constexpr std::uint8_t kDark = 0x00;
constexpr std::uint8_t kLight = 0xFF;

qrcodegen::QrCode::Ecc to_qrcodegen(ErrorCorrection level)
{
    switch (level) {
    case ErrorCorrection::LOW:
        return qrcodegen::QrCode::Ecc::LOW;
    case ErrorCorrection::MEDIUM:
        return qrcodegen::QrCode::Ecc::MEDIUM;
    case ErrorCorrection::QUARTILE:
        return qrcodegen::QrCode::Ecc::QUARTILE;
    case ErrorCorrection::HIGH:
        return qrcodegen::QrCode::Ecc::HIGH;
    }
    return qrcodegen::QrCode::Ecc::MEDIUM;
}

GrayImage rasterize(const qrcodegen::QrCode& qr, int scale, int border)
{
    const int modules = qr.getSize();
    const int side = (modules + 2 * border) * scale;

    GrayImage image;
    image.width = static_cast<std::uint32_t>(side);
    image.height = static_cast<std::uint32_t>(side);
    image.pixels.assign(static_cast<std::size_t>(side) * side, kLight);

    for (int my = 0; my < modules; ++my) {
        for (int mx = 0; mx < modules; ++mx) {
            if (!qr.getModule(mx, my)) {
                continue;
            }
            const int px0 = (mx + border) * scale;
            const int py0 = (my + border) * scale;
            for (int py = py0; py < py0 + scale; ++py) {
                auto row = image.pixels.begin() + static_cast<std::ptrdiff_t>(py) * side;
                std::fill(row + px0, row + px0 + scale, kDark);
            }
        }
    }
    return image;
}

} // namespace

ErrorCorrection parse_error_correction(const std::string& name)
{
    std::string key = infra::String::to_lower(infra::String::trim(name));

    if (key == "l" || key == "low")
        return ErrorCorrection::LOW;
    if (key == "m" || key == "medium")
        return ErrorCorrection::MEDIUM;
    if (key == "q" || key == "quartile")
        return ErrorCorrection::QUARTILE;
    if (key == "h" || key == "high")
        return ErrorCorrection::HIGH;

    throw infra::ConfigurationError("unknown error_correction '" + name +
                                    "' (expected L, M, Q or H)");
}

std::string to_string(ErrorCorrection level)
{
    switch (level) {
    case ErrorCorrection::LOW:
        return "L";
    case ErrorCorrection::MEDIUM:
        return "M";
    case ErrorCorrection::QUARTILE:
        return "Q";
    case ErrorCorrection::HIGH:
        return "H";
    }
    return "?";
}

EncodedSymbol::EncodedSymbol(std::string token, int version, int modules, int pixel_size,
                             ErrorCorrection ecc, std::vector<std::uint8_t> png)
    : token_(std::move(token)), version_(version), modules_(modules), pixel_size_(pixel_size),
      ecc_(ecc), png_(std::move(png))
{
}

std::string EncodedSymbol::data_uri() const
{
    return "data:image/png;base64," + infra::Base64::encode(png_);
}

void QrEncoder::check(const EncodeOptions& options)
{
    if (options.module_scale < 1 || options.module_scale > 64) {
        throw infra::ConfigurationError("module_scale must be within 1..64");
    }
    if (options.quiet_zone < 0 || options.quiet_zone > 16) {
        throw infra::ConfigurationError("quiet_zone must be within 0..16");
    }
    if (options.max_version < qrcodegen::QrCode::MIN_VERSION ||
        options.max_version > qrcodegen::QrCode::MAX_VERSION) {
        throw infra::ConfigurationError("max_version must be within 1..40");
    }
}

EncodedSymbol QrEncoder::encode(const std::string& token, const EncodeOptions& options)
{
    check(options);

    std::vector<qrcodegen::QrSegment> segments = qrcodegen::QrSegment::makeSegments(token.c_str());

    try {
        qrcodegen::QrCode qr = qrcodegen::QrCode::encodeSegments(
            segments, to_qrcodegen(options.ecc), qrcodegen::QrCode::MIN_VERSION,
            options.max_version, -1, false);

        GrayImage raster = rasterize(qr, options.module_scale, options.quiet_zone);
        std::vector<std::uint8_t> png = Png::encode(raster);

        infra::Logger::log(infra::LogLevel::TRACE,
                           "Encoder: " + token + " -> version " + std::to_string(qr.getVersion()) +
                               ", " + std::to_string(qr.getSize()) + " modules, " +
                               std::to_string(png.size()) + " PNG bytes");

        return EncodedSymbol(token, qr.getVersion(), qr.getSize(),
                             static_cast<int>(raster.width), options.ecc, std::move(png));
    } catch (const qrcodegen::data_too_long& e) {
        throw infra::EncodingCapacityError("token '" + token + "' (" +
                                           std::to_string(token.size()) +
                                           " chars) at ECC " + to_string(options.ecc) +
                                           ", version <= " + std::to_string(options.max_version) +
                                           ": " + e.what());
    }
}

} // namespace qrlabel::codec
