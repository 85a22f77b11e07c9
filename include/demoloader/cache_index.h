/*
 * cache_index.h - SQLite record of which cached files are complete
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <optional>
#include <mutex>
#include "demoloader/common.h"

struct sqlite3;

namespace demoloader {

// Last known outcome for one cached destination path
struct CacheEntry {
    std::string path;
    std::string category;
    std::string title;
    TransferStatus status = TransferStatus::QUEUED;
    int64_t file_size = 0;
};

class CacheIndex {
public:
    explicit CacheIndex(const std::string& db_path);
    ~CacheIndex();

    // Non-copyable
    CacheIndex(const CacheIndex&) = delete;
    CacheIndex& operator=(const CacheIndex&) = delete;

    // Initialize schema
    bool initialize();

    // Insert or replace the entry for entry.path
    bool record(const CacheEntry& entry);
    std::optional<CacheEntry> lookup(const std::string& path);
    bool remove(const std::string& path);
    int clear();
    int64_t count();

    std::string get_last_error() const;

private:
    bool execute(const std::string& sql);
    void close();
    static std::string normalize(const std::string& path);

    sqlite3* db_ = nullptr;
    std::string db_path_;
    std::string last_error_;
    mutable std::mutex mutex_;
};

} // namespace demoloader
