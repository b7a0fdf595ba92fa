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
 * @file generator.cpp
 * @brief Implementation of the sequential identifier generator.
 */

#include "qrlabel/core/generator.hpp"

#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"

namespace qrlabel::core {

IdentifierGenerator::IdentifierGenerator(Series series, TokenFormat format)
    : series_(std::move(series)), format_(std::move(format))
{
    format_.check(series_);
}

/**
 * @brief Walks forward from `last_sequence + 1` to the first unused token.
 *
 * The walk is bounded by the sequence field capacity, so it terminates even
 * when every remaining value is taken.
 */
IdentifierRecord IdentifierGenerator::next(const std::unordered_set<std::string>& known,
                                           std::uint64_t last_sequence) const
{
    const std::uint64_t capacity = format_.sequence_capacity();

    if (last_sequence >= capacity) {
        throw infra::SequenceExhaustedError("last sequence " + std::to_string(last_sequence) +
                                            " already at capacity " + std::to_string(capacity));
    }

    for (std::uint64_t sequence = last_sequence + 1; sequence <= capacity; ++sequence) {
        IdentifierRecord record;
        record.series = series_;
        record.sequence = sequence;
        record.token = format_.render(series_, sequence);

        if (known.count(record.token) == 0) {
            return record;
        }

        infra::Logger::log(infra::LogLevel::DEBUG,
                           "Generator: " + record.token + " already issued. Advancing.");
    }

    throw infra::SequenceExhaustedError("no free sequence after " + std::to_string(last_sequence) +
                                        " (capacity " + std::to_string(capacity) + ")");
}

} // namespace qrlabel::core
