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
 * @file duplicate_store.cpp
 * @brief Implementation of the duplicate store (journal replay and append).
 */

#include "qrlabel/storage/duplicate_store.hpp"

#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"
#include "qrlabel/infra/string.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

namespace qrlabel::storage {

namespace {

constexpr std::size_t kColumnCount = 7;
constexpr std::size_t kLegacyColumnCount = 2;

std::string local_timestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time = std::chrono::system_clock::to_time_t(now);
    std::tm parts{};
    localtime_r(&time, &parts);

    std::ostringstream out;
    out << std::put_time(&parts, "%Y-%m-%d %H:%M:%S");
    return out.str();
}

std::uint64_t parse_unsigned(const std::string& text, const char* column, std::size_t line_number)
{
    if (!infra::String::is_digits(text)) {
        throw infra::StoreCorruptError(line_number, std::string(column) + " '" + text +
                                                        "' is not a number");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw infra::StoreCorruptError(line_number, std::string(column) + " '" + text +
                                                        "' is out of range");
    }
}

} // namespace

const char* const DuplicateStore::kHeader =
    "token,area,producer_code,year,model_code,sequence,issued_at";

const char* const DuplicateStore::kLegacyHeader = "ID,Generated On";

DuplicateStore::DuplicateStore(std::string path, std::optional<core::TokenFormat> format)
    : journal_(std::move(path), kHeader), format_(std::move(format))
{
}

/**
 * @brief Replays the journal into memory.
 *
 * **Replay Strategy:**
 * 1. Create the file (with header) if it does not exist yet.
 * 2. Skip the header line.
 * 3. Parse every other line; malformed rows are logged and skipped
 *    (partial recovery), never fatal.
 * 4. Track the highest sequence observed.
 */
LoadReport DuplicateStore::load()
{
    journal_.init();

    tokens_.clear();
    entries_.clear();

    LoadReport report;
    for (const auto& line : journal_.read_lines()) {
        if (line.number == 1 && (infra::String::trim(line.text) == kHeader ||
                                 infra::String::trim(line.text) == kLegacyHeader)) {
            continue;
        }
        if (line.terminated && infra::String::trim(line.text).empty()) {
            continue;
        }

        try {
            if (!line.terminated) {
                throw infra::StoreCorruptError(line.number, "incomplete final row");
            }

            StoreEntry entry = parse_row(line.text, line.number, format_ ? &*format_ : nullptr);
            if (tokens_.count(entry.token)) {
                infra::Logger::log(infra::LogLevel::WARN,
                                   "Store: Token " + entry.token + " repeated at line " +
                                       std::to_string(line.number) + ". Keeping first entry.");
                continue;
            }
            report.max_sequence = std::max(report.max_sequence, entry.sequence);
            remember(std::move(entry));
        } catch (const infra::StoreCorruptError& e) {
            infra::Logger::log(infra::LogLevel::WARN, "Store: " + std::string(e.what()) +
                                                          ". Skipping.");
            report.skipped_rows++;
        }
    }

    report.tokens = tokens_;
    report.entries = entries_.size();

    infra::Logger::log(infra::LogLevel::INFO,
                       "Store: Loaded " + std::to_string(report.entries) + " issued tokens from " +
                           journal_.path() + " (max sequence " +
                           std::to_string(report.max_sequence) + ").");
    if (report.skipped_rows > 0) {
        infra::Logger::log(infra::LogLevel::WARN, "Store: " + std::to_string(report.skipped_rows) +
                                                      " malformed rows were skipped.");
    }
    return report;
}

bool DuplicateStore::contains(const std::string& token) const
{
    return tokens_.count(token) > 0;
}

void DuplicateStore::append(const core::IdentifierRecord& record)
{
    if (contains(record.token)) {
        throw infra::Error("Refusing to persist duplicate token " + record.token);
    }

    StoreEntry entry;
    entry.token = record.token;
    entry.series = record.series;
    entry.sequence = record.sequence;
    entry.issued_at = local_timestamp();

    // Durable first, then visible in memory.
    journal_.append(format_row(entry));
    infra::Logger::log(infra::LogLevel::TRACE, "Store: Persisted " + entry.token);
    remember(std::move(entry));
}

std::uint64_t DuplicateStore::max_sequence_for(const core::Series& series) const
{
    std::uint64_t max = 0;
    for (const auto& entry : entries_) {
        bool member = entry.classified
                          ? entry.series == series
                          : format_ && entry.sequence > 0 &&
                                format_->render(series, entry.sequence) == entry.token;
        if (member) {
            max = std::max(max, entry.sequence);
        }
    }
    return max;
}

StoreEntry DuplicateStore::parse_row(const std::string& line, std::size_t line_number,
                                     const core::TokenFormat* format)
{
    auto columns = infra::String::split(line, ',');
    if (columns.size() != kColumnCount && columns.size() != kLegacyColumnCount) {
        throw infra::StoreCorruptError(line_number, "expected " + std::to_string(kColumnCount) +
                                                        " columns, found " +
                                                        std::to_string(columns.size()));
    }
    for (auto& column : columns) {
        column = infra::String::trim(column);
    }

    StoreEntry entry;
    entry.token = columns[0];
    if (entry.token.empty()) {
        throw infra::StoreCorruptError(line_number, "empty token");
    }

    if (columns.size() == kLegacyColumnCount) {
        entry.classified = false;
        entry.issued_at = columns[1];
        if (format) {
            if (auto fields = format->parse(entry.token)) {
                entry.sequence = parse_unsigned(fields->at("sequence"), "sequence", line_number);
            }
        }
        return entry;
    }

    if (columns[2].empty() || columns[4].empty()) {
        throw infra::StoreCorruptError(line_number, "empty classifier");
    }

    std::uint64_t area = parse_unsigned(columns[1], "area", line_number);
    std::uint64_t year = parse_unsigned(columns[3], "year", line_number);
    if (area > 999999999 || year > 999999999) {
        throw infra::StoreCorruptError(line_number, "area or year is out of range");
    }

    entry.series.area = static_cast<int>(area);
    entry.series.producer_code = columns[2];
    entry.series.year = static_cast<int>(year);
    entry.series.model_code = columns[4];
    entry.sequence = parse_unsigned(columns[5], "sequence", line_number);
    entry.issued_at = columns[6];

    // A token in the run's layout must be exactly what its own columns render to.
    if (format && format->parse(entry.token)) {
        std::string expected;
        try {
            expected = format->render(entry.series, entry.sequence);
        } catch (const infra::ConfigurationError& e) {
            throw infra::StoreCorruptError(line_number, std::string("columns do not fit the token "
                                                                    "layout: ") +
                                                            e.what());
        }
        if (expected != entry.token) {
            throw infra::StoreCorruptError(line_number, "token " + entry.token +
                                                            " disagrees with its columns (" +
                                                            expected + ")");
        }
    }
    return entry;
}

std::string DuplicateStore::format_row(const StoreEntry& entry)
{
    std::ostringstream out;
    out << entry.token << ',' << entry.series.area << ',' << entry.series.producer_code << ','
        << entry.series.year << ',' << entry.series.model_code << ',' << entry.sequence << ','
        << entry.issued_at;
    return out.str();
}

void DuplicateStore::remember(StoreEntry entry)
{
    tokens_.insert(entry.token);
    entries_.push_back(std::move(entry));
}

} // namespace qrlabel::storage
