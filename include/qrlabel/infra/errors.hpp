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
 * @file errors.hpp
 * @brief Exception taxonomy shared by every qrlabel subsystem.
 *
 * @details
 * All failures raised by the label pipeline derive from `Error`, so the driver
 * can report any of them through a single catch site. Only the duplicate store
 * catches one of these internally (row-level `StoreCorruptError` recovery).
 */

#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace qrlabel::infra {

/**
 * @class Error
 * @brief Root of the qrlabel exception hierarchy.
 */
class Error : public std::runtime_error {
  public:
    explicit Error(const std::string& message);
};

/**
 * @class ConfigurationError
 * @brief A configuration option is missing, mistyped or out of range.
 *
 * Fatal. Raised before any identifier is generated.
 */
class ConfigurationError : public Error {
  public:
    explicit ConfigurationError(const std::string& message);
};

/**
 * @class StoreCorruptError
 * @brief A single persisted duplicate-store row could not be parsed.
 *
 * The store recovers from this locally by skipping the row.
 */
class StoreCorruptError : public Error {
  public:
    StoreCorruptError(std::size_t line, const std::string& message);

    /// @brief 1-based line number of the offending row.
    std::size_t line() const noexcept { return line_; }

  private:
    std::size_t line_;
};

/**
 * @class SequenceExhaustedError
 * @brief The sequence field cannot represent the next free value.
 */
class SequenceExhaustedError : public Error {
  public:
    explicit SequenceExhaustedError(const std::string& message);
};

/**
 * @class EncodingCapacityError
 * @brief A token does not fit the chosen QR strength and version ceiling.
 */
class EncodingCapacityError : public Error {
  public:
    explicit EncodingCapacityError(const std::string& message);
};

/**
 * @class IoError
 * @brief A filesystem operation failed.
 *
 * Carries the affected path and the operating system's reason.
 */
class IoError : public Error {
  public:
    IoError(const std::string& path, const std::string& reason);

    const std::string& path() const noexcept { return path_; }

  private:
    std::string path_;
};

} // namespace qrlabel::infra
