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
 * @file token_format.cpp
 * @brief Rendering and parsing of fixed-width identifier tokens.
 */

#include "qrlabel/core/token_format.hpp"

#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/string.hpp"

#include <algorithm>
#include <cctype>

namespace qrlabel::core {

namespace {

// 10^19 overflows uint64_t, and the store writes sequences as decimal text.
constexpr std::size_t kMaxSequenceWidth = 18;

bool is_known_field(const std::string& name)
{
    return name == "area" || name == "producer_code" || name == "year" || name == "model_code" ||
           name == "sequence";
}

bool is_token_char(unsigned char c)
{
    return std::isdigit(c) || (c >= 'A' && c <= 'Z');
}

std::string raw_value(const std::string& name, const Series& series, std::uint64_t sequence)
{
    if (name == "area")
        return std::to_string(series.area);
    if (name == "producer_code")
        return series.producer_code;
    if (name == "year")
        return std::to_string(series.year);
    if (name == "model_code")
        return series.model_code;
    return std::to_string(sequence);
}

} // namespace

TokenFormat::TokenFormat(std::vector<FieldSpec> fields, std::string separator)
    : fields_(std::move(fields)), separator_(std::move(separator))
{
    if (fields_.empty()) {
        throw infra::ConfigurationError("token format has no fields");
    }

    std::size_t sequences = 0;
    for (const auto& field : fields_) {
        if (!is_known_field(field.name)) {
            throw infra::ConfigurationError("unknown token field '" + field.name + "'");
        }
        if (field.width == 0) {
            throw infra::ConfigurationError("token field '" + field.name + "' has zero width");
        }
        if (field.name == "sequence") {
            sequences++;
            if (field.rule != FieldRule::ZeroPad || field.width > kMaxSequenceWidth) {
                throw infra::ConfigurationError("sequence field must be zero-padded and at most " +
                                                std::to_string(kMaxSequenceWidth) + " wide");
            }
        }
    }
    if (sequences != 1) {
        throw infra::ConfigurationError("token format needs exactly one sequence field");
    }

    for (unsigned char c : separator_) {
        if (c == ',' || std::iscntrl(c)) {
            throw infra::ConfigurationError("separator may not contain commas or control characters");
        }
    }
}

TokenFormat TokenFormat::from_options(const FormatOptions& options)
{
    if (options.year_digits != 2 && options.year_digits != 4) {
        throw infra::ConfigurationError("year_digits must be 2 or 4");
    }

    std::vector<FieldSpec> fields = {
        {"area", options.area_width, FieldRule::ZeroPad},
        {"producer_code", options.producer_width, FieldRule::Exact},
        {"year", options.year_digits,
         options.year_digits == 2 ? FieldRule::LastDigits : FieldRule::ZeroPad},
        {"model_code", options.model_width, FieldRule::Exact},
        {"sequence", options.sequence_width, FieldRule::ZeroPad},
    };
    return TokenFormat(std::move(fields), options.separator);
}

std::string TokenFormat::render(const Series& series, std::uint64_t sequence) const
{
    std::string token;
    token.reserve(length());

    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) {
            token += separator_;
        }
        token += render_field(fields_[i], raw_value(fields_[i].name, series, sequence));
    }
    return token;
}

void TokenFormat::check(const Series& series) const
{
    for (const auto& field : fields_) {
        if (field.name != "sequence") {
            render_field(field, raw_value(field.name, series, 0));
        }
    }
}

std::string TokenFormat::render_field(const FieldSpec& field, const std::string& raw) const
{
    switch (field.rule) {
    case FieldRule::ZeroPad:
        if (!infra::String::is_digits(raw) || raw.size() > field.width) {
            throw infra::ConfigurationError("value '" + raw + "' does not fit " + field.name +
                                            " (" + std::to_string(field.width) + " digits)");
        }
        return infra::String::pad_left(raw, field.width, '0');

    case FieldRule::LastDigits:
        if (!infra::String::is_digits(raw)) {
            throw infra::ConfigurationError("value '" + raw + "' of " + field.name +
                                            " is not a non-negative number");
        }
        if (raw.size() > field.width) {
            return raw.substr(raw.size() - field.width);
        }
        return infra::String::pad_left(raw, field.width, '0');

    case FieldRule::Exact:
        if (raw.size() != field.width ||
            !std::all_of(raw.begin(), raw.end(),
                         [](unsigned char c) { return is_token_char(c); })) {
            throw infra::ConfigurationError(field.name + " '" + raw + "' must be exactly " +
                                            std::to_string(field.width) +
                                            " characters of 0-9 and A-Z");
        }
        return raw;
    }
    return raw;
}

std::optional<TokenFields> TokenFormat::parse(const std::string& token) const
{
    if (token.size() != length()) {
        return std::nullopt;
    }

    TokenFields out;
    std::size_t pos = 0;
    for (std::size_t i = 0; i < fields_.size(); ++i) {
        if (i > 0) {
            if (token.compare(pos, separator_.size(), separator_) != 0) {
                return std::nullopt;
            }
            pos += separator_.size();
        }

        const auto& field = fields_[i];
        std::string text = token.substr(pos, field.width);
        pos += field.width;

        bool valid = field.rule == FieldRule::Exact
                         ? std::all_of(text.begin(), text.end(),
                                       [](unsigned char c) { return is_token_char(c); })
                         : infra::String::is_digits(text);
        if (!valid) {
            return std::nullopt;
        }
        out[field.name] = text;
    }
    return out;
}

std::uint64_t TokenFormat::sequence_capacity() const
{
    for (const auto& field : fields_) {
        if (field.name == "sequence") {
            std::uint64_t capacity = 1;
            for (std::size_t i = 0; i < field.width; ++i) {
                capacity *= 10;
            }
            return capacity - 1;
        }
    }
    return 0;
}

std::size_t TokenFormat::length() const
{
    std::size_t total = separator_.size() * (fields_.size() - 1);
    for (const auto& field : fields_) {
        total += field.width;
    }
    return total;
}

} // namespace qrlabel::core
