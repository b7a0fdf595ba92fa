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
 * @file generator.hpp
 * @brief Deterministic, collision-free identifier generation.
 *
 * @details
 * This file declares the `IdentifierGenerator` class. Unlike a random UUID
 * source, it derives each identifier from the configured series and an
 * explicit `last_sequence` value, so the same inputs always yield the same
 * token and a restarted run resumes exactly where the store left off.
 */

#pragma once

#include "qrlabel/core/record.hpp"
#include "qrlabel/core/token_format.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>

namespace qrlabel::core {

/**
 * @class IdentifierGenerator
 * @brief Composes series fields and the next free sequence into a token.
 *
 * The generator holds no mutable state. It only reads the set of known tokens
 * and never touches the duplicate store.
 */
class IdentifierGenerator {
  public:
    /**
     * @throws infra::ConfigurationError if `series` does not fit `format`.
     */
    IdentifierGenerator(Series series, TokenFormat format);

    /**
     * @brief Produces the next identifier after `last_sequence`.
     *
     * Starts at `last_sequence + 1`. If that token is already in `known`
     * (possible only when sequence bookkeeping was reset), the sequence is
     * advanced one step at a time until a free token is found.
     *
     * @throws infra::SequenceExhaustedError when no free value remains within
     * the sequence field's capacity.
     *
     * @code
     * IdentifierGenerator gen({1, "24", 2024, "D0"}, TokenFormat::from_options({}));
     * auto rec = gen.next({}, 0); // rec.token == "1-24-2024-D0-01"
     * @endcode
     */
    IdentifierRecord next(const std::unordered_set<std::string>& known,
                          std::uint64_t last_sequence) const;

    const Series& series() const { return series_; }
    const TokenFormat& format() const { return format_; }

  private:
    Series series_;
    TokenFormat format_;
};

} // namespace qrlabel::core
