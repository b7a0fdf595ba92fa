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
 * @file string.hpp
 * @brief Supplementary string manipulation primitives.
 *
 * @details
 * This header defines the `String` utility class, a static extension to
 * `std::string` used by the configuration loader, the token formatter and the
 * duplicate-store row parser.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace qrlabel::infra {

/**
 * @class String
 * @brief A static container for text processing algorithms.
 */
class String {
  public:
    /**
     * @brief Trims leading and trailing whitespace from a string.
     *
     * @param s The source string to process.
     * @return std::string The trimmed content, or an empty string if the input
     * consists solely of whitespace.
     *
     * @code
     * std::string clean = qrlabel::infra::String::trim("  1-24-2024-D0-01\r\n"); // "1-24-2024-D0-01"
     * @endcode
     */
    static std::string trim(const std::string& s);

    /**
     * @brief Splits a string on every occurrence of a delimiter character.
     *
     * Empty fields are preserved, so `"a,,b"` yields three elements and an
     * empty input yields a single empty element.
     */
    static std::vector<std::string> split(const std::string& s, char delimiter);

    /**
     * @brief Splits a string on every occurrence of a (possibly multi-char) separator.
     *
     * An empty separator cannot split anything and returns the input as a
     * single element.
     */
    static std::vector<std::string> split(const std::string& s, const std::string& separator);

    static std::string to_lower(const std::string& s);

    /// @brief True when `s` is non-empty and contains only ASCII decimal digits.
    static bool is_digits(const std::string& s);

    /// @brief Left-pads `s` with `fill` up to `width` characters. Longer input is returned as-is.
    static std::string pad_left(const std::string& s, std::size_t width, char fill);
};

} // namespace qrlabel::infra
