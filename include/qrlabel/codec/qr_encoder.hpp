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
 * @file qr_encoder.hpp
 * @brief Renders identifier tokens into embeddable QR symbol images.
 *
 * @details
 * The encoder builds the symbol matrix with qrcodegen, scales it to pixels,
 * compresses it to PNG with libpng and exposes the result as an immutable
 * `EncodedSymbol` that the layout can embed as a base64 data URI.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace qrlabel::codec {

/**
 * @enum ErrorCorrection
 * @brief QR error-correction strength (recoverable codewords: ~7/15/25/30%).
 */
enum class ErrorCorrection { LOW, MEDIUM, QUARTILE, HIGH };

/**
 * @brief Parses `L`/`M`/`Q`/`H` or `low`/`medium`/`quartile`/`high` (any case).
 * @throws infra::ConfigurationError on anything else.
 */
ErrorCorrection parse_error_correction(const std::string& name);

/// @brief Single-letter name (`L`, `M`, `Q`, `H`).
std::string to_string(ErrorCorrection level);

/**
 * @struct EncodeOptions
 * @brief Symbol parameters shared by every token in a run.
 */
struct EncodeOptions {
    ErrorCorrection ecc = ErrorCorrection::MEDIUM;
    int module_scale = 10; ///< Pixels per module edge (1..64).
    int quiet_zone = 4;    ///< Light border in modules (0..16).
    int max_version = 40;  ///< Largest symbol version allowed (1..40).
};

/**
 * @class EncodedSymbol
 * @brief The rendered QR artifact for one token. Immutable once built.
 */
class EncodedSymbol {
  public:
    EncodedSymbol(std::string token, int version, int modules, int pixel_size,
                  ErrorCorrection ecc, std::vector<std::uint8_t> png);

    const std::string& token() const { return token_; }
    int version() const { return version_; }

    /// @brief Modules per side, without the quiet zone.
    int modules() const { return modules_; }

    /// @brief Raster side length in pixels, quiet zone included.
    int pixel_size() const { return pixel_size_; }

    ErrorCorrection ecc() const { return ecc_; }
    const std::vector<std::uint8_t>& png() const { return png_; }

    /// @brief `data:image/png;base64,...` form for `<image href>`.
    std::string data_uri() const;

  private:
    std::string token_;
    int version_;
    int modules_;
    int pixel_size_;
    ErrorCorrection ecc_;
    std::vector<std::uint8_t> png_;
};

class QrEncoder {
  public:
    /**
     * @brief Encodes a token as a QR symbol and PNG raster.
     *
     * The requested strength is kept as-is (no automatic boosting), the
     * smallest version that fits is chosen, and the mask is selected by the
     * standard penalty rules, so the same input always gives the same bytes.
     *
     * @throws infra::EncodingCapacityError if the token does not fit in
     * `max_version` at the requested strength.
     * @throws infra::ConfigurationError if an option is out of range.
     */
    static EncodedSymbol encode(const std::string& token, const EncodeOptions& options);

    /**
     * @brief Validates option ranges.
     * @throws infra::ConfigurationError naming the offending option.
     */
    static void check(const EncodeOptions& options);
};

} // namespace qrlabel::codec
