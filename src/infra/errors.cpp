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
 * @file errors.cpp
 * @brief Constructors for the qrlabel exception hierarchy.
 */

#include "qrlabel/infra/errors.hpp"

namespace qrlabel::infra {

Error::Error(const std::string& message) : std::runtime_error(message) {}

ConfigurationError::ConfigurationError(const std::string& message)
    : Error("Configuration error: " + message)
{
}

StoreCorruptError::StoreCorruptError(std::size_t line, const std::string& message)
    : Error("Corrupt store row " + std::to_string(line) + ": " + message), line_(line)
{
}

SequenceExhaustedError::SequenceExhaustedError(const std::string& message)
    : Error("Sequence exhausted: " + message)
{
}

EncodingCapacityError::EncodingCapacityError(const std::string& message)
    : Error("Encoding capacity exceeded: " + message)
{
}

IoError::IoError(const std::string& path, const std::string& reason)
    : Error("I/O failure on '" + path + "': " + reason), path_(path)
{
}

} // namespace qrlabel::infra
