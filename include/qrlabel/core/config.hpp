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
 * @file config.hpp
 * @brief Run configuration and its JSON loader.
 *
 * @details
 * All options are resolved to concrete values once, by `ConfigLoader`, and
 * then passed explicitly into the pipeline. Nothing else reads configuration.
 *
 * Example file:
 * @code
 * {
 *   "area": 1, "producer_code": "24", "year": 2024, "model_code": "D0",
 *   "count": 108, "rows": 18, "columns": 6, "error_correction": "M"
 * }
 * @endcode
 */

#pragma once

#include "qrlabel/codec/qr_encoder.hpp"
#include "qrlabel/core/record.hpp"
#include "qrlabel/core/token_format.hpp"
#include "qrlabel/infra/logger.hpp"
#include "qrlabel/layout/page.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace qrlabel::core {

/**
 * @struct Config
 * @brief Fully resolved options for one generation run.
 */
struct Config {
    Series series;
    std::size_t count = 0;            ///< Identifiers to issue in this run.
    std::uint64_t first_sequence = 1; ///< Lowest sequence this run may issue.

    FormatOptions format;
    layout::Geometry geometry;
    codec::EncodeOptions encode;

    std::string store_path = "used_ids.csv";
    std::string output_dir = "output";
    infra::LogLevel log_level = infra::LogLevel::INFO;

    /**
     * @brief Cross-checks every option.
     *
     * @throws infra::ConfigurationError describing the first problem found.
     */
    void validate() const;
};

class ConfigLoader {
  public:
    /**
     * @brief Reads and parses a JSON configuration file.
     *
     * @throws infra::IoError if the file cannot be read.
     * @throws infra::ConfigurationError for invalid content.
     */
    static Config load_file(const std::string& path);

    /**
     * @brief Parses JSON configuration text.
     *
     * Required keys: `area`, `producer_code`, `year`, `model_code`, `count`.
     * All other recognized keys are optional and default as in `Config`.
     * Unrecognized keys are reported with a warning and ignored.
     *
     * @throws infra::ConfigurationError for malformed JSON, missing required
     * keys, wrong types or out-of-range values.
     */
    static Config parse(const std::string& json_text);
};

} // namespace qrlabel::core
