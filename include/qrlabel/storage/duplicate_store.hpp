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
 * @file duplicate_store.hpp
 * @brief Durable record of every identifier ever issued.
 *
 * @details
 * This header defines the `DuplicateStore` class, the single source of truth
 * used to prevent reissuing a token. It keeps an in-memory hash set of known
 * tokens, rebuilt from the CSV journal at startup, and appends one row per
 * newly issued identifier.
 *
 * Row layout: `token,area,producer_code,year,model_code,sequence,issued_at`
 *
 * Two-column rows (`token,issued_at`, header `ID,Generated On`) from stores
 * written by the earlier sticker script are also accepted. Their tokens join
 * the known set; their sequence is recovered through the `TokenFormat` when
 * the token conforms to it.
 */

#pragma once

#include "qrlabel/core/record.hpp"
#include "qrlabel/core/token_format.hpp"
#include "qrlabel/storage/journal.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace qrlabel::storage {

/**
 * @struct StoreEntry
 * @brief One persisted row of the duplicate store.
 */
struct StoreEntry {
    std::string token;
    core::Series series;
    std::uint64_t sequence = 0;
    std::string issued_at; ///< Local time, `YYYY-MM-DD HH:MM:SS`.
    bool classified = true; ///< False for a two-column row whose series is not recorded.
};

/**
 * @struct LoadReport
 * @brief Result of replaying the journal.
 */
struct LoadReport {
    std::unordered_set<std::string> tokens; ///< Every known token.
    std::uint64_t max_sequence = 0;         ///< Highest sequence over all rows.
    std::size_t entries = 0;                ///< Rows accepted.
    std::size_t skipped_rows = 0;           ///< Malformed rows ignored.
};

/**
 * @class DuplicateStore
 * @brief Append-only set of issued tokens backed by a CSV journal.
 *
 * **Invariants:**
 * - The in-memory set equals the union of tokens in all well-formed rows.
 * - Rows are never removed or rewritten.
 */
class DuplicateStore {
  public:
    /// @brief Header line written to a freshly created store file.
    static const char* const kHeader;

    /// @brief Header of the two-column layout.
    static const char* const kLegacyHeader;

    /**
     * @param path Store file location.
     * @param format Token layout of the run. When given, rows whose token
     * conforms to it are cross-checked against their columns, and two-column
     * rows get their sequence back.
     */
    explicit DuplicateStore(std::string path,
                            std::optional<core::TokenFormat> format = std::nullopt);

    /**
     * @brief Opens (creating if absent) and replays the store file.
     *
     * Malformed rows raise `StoreCorruptError` internally; each is caught,
     * logged as a warning with its line number, counted and skipped.
     *
     * @throws infra::IoError if the file cannot be created or read.
     */
    LoadReport load();

    /// @brief O(1) average membership test against the loaded set.
    bool contains(const std::string& token) const;

    /**
     * @brief Persists a newly issued identifier and adds it to the set.
     *
     * The row is durable when this returns.
     *
     * @throws infra::Error if the token is already known.
     * @throws infra::IoError if the write fails; the in-memory set is unchanged.
     */
    void append(const core::IdentifierRecord& record);

    /**
     * @brief Highest sequence among entries of `series`, or 0 if there are none.
     *
     * A two-column entry counts when the store's format renders `series` with
     * its sequence to exactly its token.
     */
    std::uint64_t max_sequence_for(const core::Series& series) const;

    const std::unordered_set<std::string>& tokens() const { return tokens_; }
    const std::vector<StoreEntry>& entries() const { return entries_; }
    std::size_t size() const { return entries_.size(); }
    const std::string& path() const { return journal_.path(); }

    /**
     * @brief Parses one CSV row.
     *
     * Seven-column rows carry the full series. Two-column rows carry only the
     * token and its timestamp.
     *
     * @param line Row text without terminator.
     * @param line_number Used for the error message.
     * @param format Optional token layout. A seven-column row whose token
     * conforms to it must render back from its own columns.
     * @throws infra::StoreCorruptError if the row is malformed.
     */
    static StoreEntry parse_row(const std::string& line, std::size_t line_number,
                                const core::TokenFormat* format = nullptr);

    /// @brief Serializes an entry to a CSV row (no terminator).
    static std::string format_row(const StoreEntry& entry);

  private:
    void remember(StoreEntry entry);

    Journal journal_;
    std::optional<core::TokenFormat> format_;
    std::unordered_set<std::string> tokens_;
    std::vector<StoreEntry> entries_;
};

} // namespace qrlabel::storage
