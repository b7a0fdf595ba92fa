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
 * @file string.cpp
 * @brief Implementation of the string manipulation primitives.
 */

#include "qrlabel/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace qrlabel::infra {

/**
 * @brief Trims leading and trailing whitespace from a string instance.
 *
 * @note The use of `static_cast<unsigned char>` prevents undefined behavior
 * with `std::isspace` for characters with negative values in signed `char`
 * environments.
 */
std::string String::trim(const std::string& s)
{
    auto start = s.begin();
    while (start != s.end() && std::isspace(static_cast<unsigned char>(*start))) {
        start++;
    }

    if (start == s.end()) {
        return "";
    }

    auto end = s.end();
    do {
        end--;
    } while (std::distance(start, end) > 0 && std::isspace(static_cast<unsigned char>(*end)));

    return std::string(start, end + 1);
}

std::vector<std::string> String::split(const std::string& s, char delimiter)
{
    std::vector<std::string> parts;
    std::string::size_type begin = 0;

    while (true) {
        auto pos = s.find(delimiter, begin);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(begin));
            break;
        }
        parts.push_back(s.substr(begin, pos - begin));
        begin = pos + 1;
    }
    return parts;
}

std::vector<std::string> String::split(const std::string& s, const std::string& separator)
{
    if (separator.empty()) {
        return {s};
    }

    std::vector<std::string> parts;
    std::string::size_type begin = 0;

    while (true) {
        auto pos = s.find(separator, begin);
        if (pos == std::string::npos) {
            parts.push_back(s.substr(begin));
            break;
        }
        parts.push_back(s.substr(begin, pos - begin));
        begin = pos + separator.size();
    }
    return parts;
}

std::string String::to_lower(const std::string& s)
{
    std::string out = s;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

bool String::is_digits(const std::string& s)
{
    if (s.empty()) {
        return false;
    }
    return std::all_of(s.begin(), s.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

std::string String::pad_left(const std::string& s, std::size_t width, char fill)
{
    if (s.size() >= width) {
        return s;
    }
    return std::string(width - s.size(), fill) + s;
}

} // namespace qrlabel::infra
