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
 * @file journal.hpp
 * @brief Low-level append-only text file used by the duplicate store.
 *
 * @details
 * This header declares the `Journal` class, which abstracts the physical file
 * interactions of the duplicate store. Records are newline-terminated text
 * lines; existing content is never rewritten or truncated.
 */

#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace qrlabel::storage {

/**
 * @struct JournalLine
 * @brief One physical line read back from the journal.
 */
struct JournalLine {
    std::size_t number = 0; ///< 1-based line number in the file.
    std::string text;       ///< Line content without the terminator (and without a trailing `\r`).
    bool terminated = true; ///< False for a final line that lacks `\n` (torn write).
};

/**
 * @class Journal
 * @brief Manages durability of newline-delimited records in a single file.
 *
 * **Storage Characteristics:**
 * 1. **Append-only:** lines are only ever added at the end of the file.
 * 2. **Per-record atomicity:** each line is emitted by one `write(2)` on an
 *    `O_APPEND` descriptor and synced before `append` returns.
 * 3. **Torn-tail isolation:** if the file ends without a newline (an interrupted
 *    write), the next append starts with one so the fragment stays on its own line.
 */
class Journal {
  public:
    /**
     * @param path Filesystem location of the journal file.
     * @param header First line written when the file is created. Empty means no header.
     */
    Journal(std::string path, std::string header);

    /**
     * @brief Creates the parent directory and the file (with header) if absent.
     *
     * Existing files are left untouched.
     *
     * @throws infra::IoError if the directory or file cannot be created.
     */
    void init();

    /**
     * @brief Reads every line of the journal in file order.
     *
     * @return An empty list when the file does not exist.
     * @throws infra::IoError if the file exists but cannot be read.
     */
    std::vector<JournalLine> read_lines() const;

    /**
     * @brief Durably appends one line.
     *
     * @param line Content without a trailing newline. Must not contain `\n`.
     * @throws infra::IoError on open, write or sync failure.
     */
    void append(const std::string& line);

    const std::string& path() const { return path_; }

  private:
    /// @brief True when the file is non-empty and its last byte is not `\n`.
    bool has_torn_tail() const;

    /// @brief Appends `data` through an `O_APPEND` descriptor and syncs it.
    void write_all(const std::string& data);

    std::string path_;
    std::string header_;
};

} // namespace qrlabel::storage
