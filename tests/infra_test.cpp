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
 * @file infra_test.cpp
 * @brief Unit tests for shared infrastructure primitives (String, Base64, Logger).
 */

#include "framework.hpp"
#include "qrlabel/infra/base64.hpp"
#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"
#include "qrlabel/infra/string.hpp"

#include <cstdint>
#include <string>
#include <vector>

using qrlabel::infra::Base64;
using qrlabel::infra::String;

/**
 * @brief Tests the `String::trim` algorithm with nominal input.
 *
 * Leading and trailing padding goes, internal whitespace stays.
 */
void test_string_trim()
{
    std::string clean = String::trim("   1-24-2024-D0-01 ok \r\n");
    ASSERT_EQ(clean, std::string("1-24-2024-D0-01 ok"));
}

void test_string_trim_empty()
{
    std::string result = String::trim("  \t\n  \r ");
    ASSERT_EQ(result, std::string(""));
    ASSERT_EQ(result.length(), static_cast<size_t>(0));
}

/**
 * @brief CSV rows depend on empty columns surviving the split.
 */
void test_string_split_keeps_empty_fields()
{
    auto parts = String::split("a,,b,", ',');
    ASSERT_EQ(parts.size(), static_cast<size_t>(4));
    ASSERT_EQ(parts[0], std::string("a"));
    ASSERT_EQ(parts[1], std::string(""));
    ASSERT_EQ(parts[2], std::string("b"));
    ASSERT_EQ(parts[3], std::string(""));

    ASSERT_EQ(String::split("", ',').size(), static_cast<size_t>(1));
}

void test_string_split_multichar_separator()
{
    auto parts = String::split("1--24--2024", "--");
    ASSERT_EQ(parts.size(), static_cast<size_t>(3));
    ASSERT_EQ(parts[2], std::string("2024"));

    auto whole = String::split("1242024", "");
    ASSERT_EQ(whole.size(), static_cast<size_t>(1));
}

void test_string_helpers()
{
    ASSERT_TRUE(String::is_digits("0042"));
    ASSERT_FALSE(String::is_digits(""));
    ASSERT_FALSE(String::is_digits("4a"));
    ASSERT_EQ(String::pad_left("7", 3, '0'), std::string("007"));
    ASSERT_EQ(String::pad_left("1234", 3, '0'), std::string("1234"));
    ASSERT_EQ(String::to_lower("WARN"), std::string("warn"));
}

/**
 * @brief RFC 4648 section 10 test vectors.
 */
void test_base64_known_vectors()
{
    auto bytes = [](const std::string& s) { return std::vector<std::uint8_t>(s.begin(), s.end()); };

    ASSERT_EQ(Base64::encode(bytes("")), std::string(""));
    ASSERT_EQ(Base64::encode(bytes("f")), std::string("Zg=="));
    ASSERT_EQ(Base64::encode(bytes("fo")), std::string("Zm8="));
    ASSERT_EQ(Base64::encode(bytes("foo")), std::string("Zm9v"));
    ASSERT_EQ(Base64::encode(bytes("foob")), std::string("Zm9vYg=="));
    ASSERT_EQ(Base64::encode(bytes("fooba")), std::string("Zm9vYmE="));
    ASSERT_EQ(Base64::encode(bytes("foobar")), std::string("Zm9vYmFy"));

    ASSERT_TRUE(Base64::decode("Zm9vYmE=") == bytes("fooba"));
    ASSERT_TRUE(Base64::decode("Zg==") == bytes("f"));
}

void test_base64_binary_bytes()
{
    std::vector<std::uint8_t> png_magic = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    ASSERT_EQ(Base64::encode(png_magic), std::string("iVBORw0KGgo="));
    ASSERT_TRUE(Base64::decode("iVBORw0KGgo=") == png_magic);
}

void test_base64_decode_rejects_garbage()
{
    ASSERT_THROWS(Base64::decode("abc"), qrlabel::infra::Error);
    ASSERT_THROWS(Base64::decode("ab!d"), qrlabel::infra::Error);
    ASSERT_THROWS(Base64::decode("a=bc"), qrlabel::infra::Error);
    ASSERT_THROWS(Base64::decode("ab=c"), qrlabel::infra::Error);
}

void test_log_level_parsing()
{
    using qrlabel::infra::Logger;
    using qrlabel::infra::LogLevel;

    ASSERT_TRUE(Logger::parse_level("trace") == LogLevel::TRACE);
    ASSERT_TRUE(Logger::parse_level(" DEBUG ") == LogLevel::DEBUG);
    ASSERT_TRUE(Logger::parse_level("Warn") == LogLevel::WARN);
    ASSERT_TRUE(Logger::parse_level("fatal") == LogLevel::FATAL);
    ASSERT_THROWS(Logger::parse_level("verbose"), qrlabel::infra::ConfigurationError);

    LogLevel previous = Logger::level();
    Logger::set_level(LogLevel::ERROR);
    ASSERT_TRUE(Logger::level() == LogLevel::ERROR);
    Logger::set_level(previous);
}

void test_error_messages_carry_context()
{
    qrlabel::infra::StoreCorruptError corrupt(12, "empty token");
    ASSERT_EQ(corrupt.line(), static_cast<size_t>(12));
    ASSERT_TRUE(std::string(corrupt.what()).find("12") != std::string::npos);

    qrlabel::infra::IoError io("/nonexistent/x.csv", "No such file or directory");
    ASSERT_EQ(io.path(), std::string("/nonexistent/x.csv"));
}
