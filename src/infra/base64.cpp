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
 * @file base64.cpp
 * @brief Implementation of the Base64 codec.
 *
 * @details
 * Processes input in 3-byte groups, each producing four 6-bit symbols. The
 * final partial group is padded with `=`.
 */

#include "qrlabel/infra/base64.hpp"

#include "qrlabel/infra/errors.hpp"

namespace qrlabel::infra {

namespace {

const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int symbol_value(char c)
{
    if (c >= 'A' && c <= 'Z')
        return c - 'A';
    if (c >= 'a' && c <= 'z')
        return c - 'a' + 26;
    if (c >= '0' && c <= '9')
        return c - '0' + 52;
    if (c == '+')
        return 62;
    if (c == '/')
        return 63;
    return -1;
}

} // namespace

std::string Base64::encode(const std::vector<std::uint8_t>& bytes)
{
    std::string out;
    out.reserve(((bytes.size() + 2) / 3) * 4);

    std::size_t i = 0;
    for (; i + 3 <= bytes.size(); i += 3) {
        std::uint32_t group = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                              (static_cast<std::uint32_t>(bytes[i + 1]) << 8) |
                              static_cast<std::uint32_t>(bytes[i + 2]);
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kAlphabet[(group >> 6) & 0x3F]);
        out.push_back(kAlphabet[group & 0x3F]);
    }

    std::size_t rest = bytes.size() - i;
    if (rest == 1) {
        std::uint32_t group = static_cast<std::uint32_t>(bytes[i]) << 16;
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out += "==";
    } else if (rest == 2) {
        std::uint32_t group = (static_cast<std::uint32_t>(bytes[i]) << 16) |
                              (static_cast<std::uint32_t>(bytes[i + 1]) << 8);
        out.push_back(kAlphabet[(group >> 18) & 0x3F]);
        out.push_back(kAlphabet[(group >> 12) & 0x3F]);
        out.push_back(kAlphabet[(group >> 6) & 0x3F]);
        out.push_back('=');
    }
    return out;
}

std::vector<std::uint8_t> Base64::decode(const std::string& text)
{
    if (text.size() % 4 != 0) {
        throw Error("Base64 input length " + std::to_string(text.size()) +
                    " is not a multiple of 4");
    }

    std::vector<std::uint8_t> out;
    out.reserve((text.size() / 4) * 3);

    for (std::size_t i = 0; i < text.size(); i += 4) {
        bool last = (i + 4 == text.size());
        int padding = 0;
        std::uint32_t group = 0;

        for (std::size_t j = 0; j < 4; ++j) {
            char c = text[i + j];
            if (c == '=' && last && j >= 2) {
                padding++;
                group <<= 6;
                continue;
            }
            int v = symbol_value(c);
            if (v < 0 || padding > 0) {
                throw Error("Base64 input has an invalid character at offset " +
                            std::to_string(i + j));
            }
            group = (group << 6) | static_cast<std::uint32_t>(v);
        }

        out.push_back(static_cast<std::uint8_t>((group >> 16) & 0xFF));
        if (padding < 2)
            out.push_back(static_cast<std::uint8_t>((group >> 8) & 0xFF));
        if (padding < 1)
            out.push_back(static_cast<std::uint8_t>(group & 0xFF));
    }
    return out;
}

} // namespace qrlabel::infra
