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
 * @file journal.cpp
 * @brief Implementation of the append-only text journal.
 *
 * @details
 * Reads go through `std::ifstream`; writes use raw POSIX descriptors so that
 * each record is handed to the kernel in one `write(2)` and synced with `fsync`.
 */

#include "qrlabel/storage/journal.hpp"

#include "qrlabel/infra/errors.hpp"
#include "qrlabel/infra/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace qrlabel::storage {

Journal::Journal(std::string path, std::string header)
    : path_(std::move(path)), header_(std::move(header))
{
}

/**
 * @brief Bootstraps the journal file.
 *
 * Creates missing parent directories, then creates the file with its header
 * line. An existing file is never truncated; an existing but empty file only
 * receives the header.
 */
void Journal::init()
{
    fs::path parent = fs::path(path_).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw infra::IoError(parent.string(), ec.message());
        }
    }

    std::error_code ec;
    bool exists = fs::exists(path_, ec);
    auto size = exists ? fs::file_size(path_, ec) : 0;
    if (ec) {
        throw infra::IoError(path_, ec.message());
    }

    if (!exists || size == 0) {
        infra::Logger::log(infra::LogLevel::DEBUG, "Store: Creating journal " + path_);
        write_all(header_.empty() ? std::string() : header_ + "\n");
    }
}

std::vector<JournalLine> Journal::read_lines() const
{
    std::vector<JournalLine> lines;

    if (!fs::exists(path_)) {
        return lines;
    }

    std::ifstream file(path_, std::ios::binary);
    if (!file.is_open()) {
        throw infra::IoError(path_, "cannot open for reading");
    }

    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (file.bad()) {
        throw infra::IoError(path_, "read failed");
    }

    std::size_t begin = 0;
    std::size_t number = 1;
    while (begin < content.size()) {
        auto pos = content.find('\n', begin);
        JournalLine line;
        line.number = number++;

        if (pos == std::string::npos) {
            line.text = content.substr(begin);
            line.terminated = false;
            begin = content.size();
        } else {
            line.text = content.substr(begin, pos - begin);
            begin = pos + 1;
        }

        if (!line.text.empty() && line.text.back() == '\r') {
            line.text.pop_back();
        }
        lines.push_back(std::move(line));
    }
    return lines;
}

void Journal::append(const std::string& line)
{
    if (line.find('\n') != std::string::npos) {
        throw infra::Error("Journal lines must not contain a newline");
    }

    std::string data;
    if (has_torn_tail()) {
        infra::Logger::log(infra::LogLevel::WARN,
                           "Store: Journal " + path_ + " ends with a partial line. Isolating it.");
        data.push_back('\n');
    }
    data += line;
    data.push_back('\n');

    write_all(data);
}

bool Journal::has_torn_tail() const
{
    std::ifstream file(path_, std::ios::binary | std::ios::ate);
    if (!file.is_open()) {
        return false;
    }

    auto end = file.tellg();
    if (end <= 0) {
        return false;
    }

    file.seekg(-1, std::ios::end);
    char last = 0;
    file.get(last);
    return last != '\n';
}

/**
 * @brief Hands `data` to the kernel and forces it to stable storage.
 *
 * `O_APPEND` positions every write at the current end of file, and the
 * descriptor is opened with `O_CREAT` but never `O_TRUNC`. A short write is
 * continued until the whole buffer is out.
 */
void Journal::write_all(const std::string& data)
{
    int fd = ::open(path_.c_str(), O_WRONLY | O_APPEND | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw infra::IoError(path_, std::strerror(errno));
    }

    const char* cursor = data.data();
    std::size_t remaining = data.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, cursor, remaining);
        if (written < 0) {
            if (errno == EINTR) {
                continue;
            }
            std::string reason = std::strerror(errno);
            ::close(fd);
            throw infra::IoError(path_, reason);
        }
        cursor += written;
        remaining -= static_cast<std::size_t>(written);
    }

    if (::fsync(fd) != 0) {
        std::string reason = std::strerror(errno);
        ::close(fd);
        throw infra::IoError(path_, reason);
    }

    if (::close(fd) != 0) {
        throw infra::IoError(path_, std::strerror(errno));
    }
}

} // namespace qrlabel::storage
