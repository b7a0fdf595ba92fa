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
 * @file config.cpp
 * @brief cJSON-backed configuration loading and validation.
 */

#include "qrlabel/core/config.hpp"

#include "qrlabel/infra/errors.hpp"

#include <cJSON.h>
#include <cmath>
#include <fstream>
#include <iterator>
#include <memory>
#include <set>

namespace qrlabel::core {

namespace {

using JsonPtr = std::unique_ptr<cJSON, decltype(&cJSON_Delete)>;

const std::set<std::string> kKnownKeys = {
    // Series and run size
    "area", "producer_code", "year", "model_code", "count", "first_sequence",
    // Page grid
    "rows", "columns", "cell_width", "cell_height", "margin_x", "margin_y", "label_wrap",
    "sheet_width", "sheet_height",
    // Symbol
    "error_correction", "module_scale", "quiet_zone", "max_version",
    // Token format
    "area_width", "producer_width", "model_width", "year_digits", "sequence_width", "separator",
    // Paths and diagnostics
    "store_path", "output_dir", "log_level"};

const cJSON* item(const cJSON* root, const char* key)
{
    return cJSON_GetObjectItemCaseSensitive(root, key);
}

void require(const cJSON* root, const char* key)
{
    if (!item(root, key)) {
        throw infra::ConfigurationError("missing required option '" + std::string(key) + "'");
    }
}

/// @brief Reads an integral JSON number into `out`, checking `[min, max]`.
template <typename T>
void read_integer(const cJSON* root, const char* key, T& out, double min, double max)
{
    const cJSON* node = item(root, key);
    if (!node) {
        return;
    }
    if (!cJSON_IsNumber(node) || std::floor(node->valuedouble) != node->valuedouble) {
        throw infra::ConfigurationError("option '" + std::string(key) + "' must be an integer");
    }
    if (node->valuedouble < min || node->valuedouble > max) {
        throw infra::ConfigurationError("option '" + std::string(key) + "' is out of range");
    }
    out = static_cast<T>(node->valuedouble);
}

void read_number(const cJSON* root, const char* key, double& out)
{
    const cJSON* node = item(root, key);
    if (!node) {
        return;
    }
    if (!cJSON_IsNumber(node) || !std::isfinite(node->valuedouble)) {
        throw infra::ConfigurationError("option '" + std::string(key) + "' must be a number");
    }
    out = node->valuedouble;
}

void read_string(const cJSON* root, const char* key, std::string& out)
{
    const cJSON* node = item(root, key);
    if (!node) {
        return;
    }
    if (!cJSON_IsString(node) || node->valuestring == nullptr) {
        throw infra::ConfigurationError("option '" + std::string(key) + "' must be a string");
    }
    out = node->valuestring;
}

} // namespace

void Config::validate() const
{
    TokenFormat::from_options(format).check(series);
    geometry.check();
    codec::QrEncoder::check(encode);

    if (first_sequence < 1) {
        throw infra::ConfigurationError("first_sequence must be at least 1");
    }
    if (store_path.empty()) {
        throw infra::ConfigurationError("store_path must not be empty");
    }
    if (output_dir.empty()) {
        throw infra::ConfigurationError("output_dir must not be empty");
    }
}

Config ConfigLoader::load_file(const std::string& path)
{
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw infra::IoError(path, "cannot open configuration file");
    }

    std::string text((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw infra::IoError(path, "read failed");
    }

    infra::Logger::log(infra::LogLevel::DEBUG, "Config: Reading " + path);
    return parse(text);
}

/**
 * @brief Resolves every option from the JSON document.
 *
 * **Resolution Order:**
 * 1. **Syntax**: the text must parse as a JSON object.
 * 2. **Presence**: required keys must exist.
 * 3. **Typing**: each present key is read with its type and range check.
 * 4. **Semantics**: `Config::validate` cross-checks the result.
 */
Config ConfigLoader::parse(const std::string& json_text)
{
    JsonPtr root(cJSON_Parse(json_text.c_str()), &cJSON_Delete);
    if (!root) {
        const char* where = cJSON_GetErrorPtr();
        throw infra::ConfigurationError(std::string("invalid JSON") +
                                        (where ? std::string(" near '") +
                                                     std::string(where).substr(0, 20) + "'"
                                               : std::string()));
    }
    if (!cJSON_IsObject(root.get())) {
        throw infra::ConfigurationError("top-level JSON value must be an object");
    }

    const cJSON* json = root.get();
    for (const char* key : {"area", "producer_code", "year", "model_code", "count"}) {
        require(json, key);
    }

    const cJSON* child = nullptr;
    cJSON_ArrayForEach(child, json)
    {
        if (child->string && kKnownKeys.count(child->string) == 0) {
            infra::Logger::log(infra::LogLevel::WARN, "Config: Ignoring unknown option '" +
                                                          std::string(child->string) + "'");
        }
    }

    Config config;

    read_integer(json, "area", config.series.area, 0, 999999999);
    read_string(json, "producer_code", config.series.producer_code);
    read_integer(json, "year", config.series.year, 0, 999999999);
    read_string(json, "model_code", config.series.model_code);
    read_integer(json, "count", config.count, 0, 1e9);
    read_integer(json, "first_sequence", config.first_sequence, 1, 1e15);

    read_integer(json, "rows", config.geometry.rows, 1, 10000);
    read_integer(json, "columns", config.geometry.columns, 1, 10000);
    read_number(json, "cell_width", config.geometry.cell_width);
    read_number(json, "cell_height", config.geometry.cell_height);
    read_number(json, "margin_x", config.geometry.margin_x);
    read_number(json, "margin_y", config.geometry.margin_y);
    read_integer(json, "label_wrap", config.geometry.label_wrap, 0, 1000);
    read_number(json, "sheet_width", config.geometry.sheet_width);
    read_number(json, "sheet_height", config.geometry.sheet_height);

    std::string ecc;
    read_string(json, "error_correction", ecc);
    if (!ecc.empty()) {
        config.encode.ecc = codec::parse_error_correction(ecc);
    }
    read_integer(json, "module_scale", config.encode.module_scale, 1, 64);
    read_integer(json, "quiet_zone", config.encode.quiet_zone, 0, 16);
    read_integer(json, "max_version", config.encode.max_version, 1, 40);

    read_integer(json, "area_width", config.format.area_width, 1, 9);
    read_integer(json, "producer_width", config.format.producer_width, 1, 32);
    read_integer(json, "model_width", config.format.model_width, 1, 32);
    read_integer(json, "year_digits", config.format.year_digits, 2, 4);
    read_integer(json, "sequence_width", config.format.sequence_width, 1, 9);
    read_string(json, "separator", config.format.separator);

    read_string(json, "store_path", config.store_path);
    read_string(json, "output_dir", config.output_dir);

    std::string level;
    read_string(json, "log_level", level);
    if (!level.empty()) {
        config.log_level = infra::Logger::parse_level(level);
    }

    config.validate();
    return config;
}

} // namespace qrlabel::core
