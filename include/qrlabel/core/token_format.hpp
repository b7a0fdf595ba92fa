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
 * @file token_format.hpp
 * @brief Declarative description of how an identifier token is spelled.
 *
 * @details
 * A `TokenFormat` is an ordered list of fixed-width fields joined by a
 * separator. The same description renders tokens for the generator and
 * parses them back for validation, so formatting rules live in one place.
 *
 * With the default options the series `{1, "24", 2024, "D0"}` and sequence 1
 * render as `1-24-2024-D0-01`.
 */

#pragma once

#include "qrlabel/core/record.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace qrlabel::core {

/**
 * @enum FieldRule
 * @brief How a field value is turned into exactly `width` characters.
 */
enum class FieldRule {
    ZeroPad,    ///< Decimal, left-padded with '0'; a value with more digits is rejected.
    LastDigits, ///< Decimal, only the trailing `width` digits are kept (e.g. 2024 -> "24").
    Exact       ///< Text of exactly `width` characters from [0-9A-Z].
};

/**
 * @struct FieldSpec
 * @brief One fixed-width slot in a token.
 *
 * Recognized names: `area`, `producer_code`, `year`, `model_code`, `sequence`.
 */
struct FieldSpec {
    std::string name;
    std::size_t width = 0;
    FieldRule rule = FieldRule::ZeroPad;
};

/**
 * @struct FormatOptions
 * @brief Widths and separator used to build the default field list.
 */
struct FormatOptions {
    std::size_t area_width = 1;
    std::size_t producer_width = 2;
    std::size_t year_digits = 4; ///< 2 keeps the last two digits of the year, 4 the full year.
    std::size_t model_width = 2;
    std::size_t sequence_width = 2;
    std::string separator = "-";
};

/// @brief Field values of a parsed token, keyed by field name.
using TokenFields = std::unordered_map<std::string, std::string>;

class TokenFormat {
  public:
    /**
     * @throws infra::ConfigurationError if the list is empty, lacks exactly one
     * `sequence` field, names an unknown field, has a zero width, or the
     * separator contains a comma or a control character.
     */
    TokenFormat(std::vector<FieldSpec> fields, std::string separator);

    /// @brief Standard order: area, producer_code, year, model_code, sequence.
    static TokenFormat from_options(const FormatOptions& options);

    /**
     * @brief Spells a token.
     *
     * @throws infra::ConfigurationError if a value does not fit its field.
     */
    std::string render(const Series& series, std::uint64_t sequence) const;

    /**
     * @brief Verifies that every structural field of `series` fits this format.
     *
     * @throws infra::ConfigurationError naming the first offending field.
     */
    void check(const Series& series) const;

    /**
     * @brief Splits a token back into its field texts.
     *
     * @return Empty when the token does not conform (length, separators,
     * digit/alphabet rules).
     */
    std::optional<TokenFields> parse(const std::string& token) const;

    /// @brief Largest sequence value the sequence field can hold (`10^width - 1`).
    std::uint64_t sequence_capacity() const;

    /// @brief Total token length in characters.
    std::size_t length() const;

    const std::vector<FieldSpec>& fields() const { return fields_; }
    const std::string& separator() const { return separator_; }

  private:
    std::string render_field(const FieldSpec& field, const std::string& raw) const;

    std::vector<FieldSpec> fields_;
    std::string separator_;
};

} // namespace qrlabel::core
