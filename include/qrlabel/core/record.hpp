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
 * @file record.hpp
 * @brief Value types describing an issued identifier.
 */

#pragma once

#include <cstdint>
#include <string>

namespace qrlabel::core {

/**
 * @struct Series
 * @brief The structural (non-sequence) fields of an identifier.
 *
 * Two identifiers belong to the same series when all four fields are equal;
 * inside a series the sequence component alone tells them apart.
 */
struct Series {
    int area = 0;              ///< Area of activity (e.g. 1 = energy, 2 = gas).
    std::string producer_code; ///< Producer classifier.
    int year = 0;              ///< Production year, full four-digit value.
    std::string model_code;    ///< Model classifier.

    bool operator==(const Series& other) const
    {
        return area == other.area && producer_code == other.producer_code &&
               year == other.year && model_code == other.model_code;
    }
    bool operator!=(const Series& other) const { return !(*this == other); }
};

/**
 * @struct IdentifierRecord
 * @brief One generated identifier: its series, sequence and rendered token.
 *
 * Created by the generator and read-only afterwards.
 */
struct IdentifierRecord {
    Series series;
    std::uint64_t sequence = 0;
    std::string token;
};

} // namespace qrlabel::core
