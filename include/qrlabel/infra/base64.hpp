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
 * @file base64.hpp
 * @brief RFC 4648 Base64 codec for embedding raster payloads in SVG data URIs.
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace qrlabel::infra {

/**
 * @class Base64
 * @brief Stateless standard-alphabet Base64 encoder and decoder (with `=` padding).
 */
class Base64 {
  public:
    /**
     * @brief Encodes a byte buffer.
     *
     * @code
     * std::string s = qrlabel::infra::Base64::encode({'M', 'a', 'n'}); // "TWFu"
     * @endcode
     */
    static std::string encode(const std::vector<std::uint8_t>& bytes);

    /**
     * @brief Decodes a padded Base64 string.
     *
     * @throws Error if the input length is not a multiple of four or contains
     * characters outside the standard alphabet.
     */
    static std::vector<std::uint8_t> decode(const std::string& text);
};

} // namespace qrlabel::infra
