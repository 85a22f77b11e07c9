/*
 * src/cache_index.cpp - SQLite-backed cache index
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/cache_index.h"
#include <sqlite3.h>
#include <filesystem>
#include <stdexcept>

namespace fs = std::filesystem;

namespace demoloader {

namespace {

// Owns one prepared statement for the duration of a query
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        ok_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) == SQLITE_OK;
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ok() const { return ok_; }
    sqlite3_stmt* get() const { return stmt_; }

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int index, int64_t value) {
        sqlite3_bind_int64(stmt_, index, value);
    }

    int step() { return sqlite3_step(stmt_); }

    std::string text(int column) const {
        const unsigned char* value = sqlite3_column_text(stmt_, column);
        return value ? reinterpret_cast<const char*>(value) : "";
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    bool ok_ = false;
};

constexpr const char* SCHEMA = R"(
    CREATE TABLE IF NOT EXISTS cache_entries (
        path TEXT PRIMARY KEY,
        category TEXT NOT NULL DEFAULT '',
        title TEXT NOT NULL DEFAULT '',
        status TEXT NOT NULL,
        file_size INTEGER NOT NULL DEFAULT 0,
        updated_at TEXT NOT NULL DEFAULT (datetime('now'))
    );
)";

} // anonymous namespace

CacheIndex::CacheIndex(const std::string& db_path) : db_path_(db_path) {
    fs::path parent = fs::path(db_path).parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error("Failed to create cache index directory " +
                                     parent.string() + ": " + ec.message());
        }
    }

    if (sqlite3_open(db_path.c_str(), &db_) != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        close();
        throw std::runtime_error("Failed to open cache index " + db_path + ": " + error);
    }

    // Removable drives are often FAT; a rollback journal works everywhere
    if (!execute("PRAGMA synchronous=NORMAL")) {
        std::string error = last_error_;
        close();
        throw std::runtime_error("Failed to configure cache index: " + error);
    }
}

CacheIndex::~CacheIndex() {
    close();
}

void CacheIndex::close() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

std::string CacheIndex::normalize(const std::string& path) {
    return fs::path(path).lexically_normal().string();
}

bool CacheIndex::execute(const std::string& sql) {
    char* error_msg = nullptr;
    if (sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &error_msg) != SQLITE_OK) {
        last_error_ = error_msg ? error_msg : sqlite3_errmsg(db_);
        sqlite3_free(error_msg);
        return false;
    }
    return true;
}

bool CacheIndex::initialize() {
    std::lock_guard<std::mutex> lock(mutex_);
    return execute(SCHEMA);
}

bool CacheIndex::record(const CacheEntry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, R"(
        INSERT INTO cache_entries (path, category, title, status, file_size)
        VALUES (?1, ?2, ?3, ?4, ?5)
        ON CONFLICT(path) DO UPDATE SET
            category = ?2, title = ?3, status = ?4, file_size = ?5,
            updated_at = datetime('now')
    )");
    if (!stmt.ok()) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }

    stmt.bind(1, normalize(entry.path));
    stmt.bind(2, entry.category);
    stmt.bind(3, entry.title);
    stmt.bind(4, std::string(status_to_string(entry.status)));
    stmt.bind(5, entry.file_size);

    if (stmt.step() != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    return true;
}

std::optional<CacheEntry> CacheIndex::lookup(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT path, category, title, status, file_size "
                        "FROM cache_entries WHERE path = ?1");
    if (!stmt.ok()) {
        last_error_ = sqlite3_errmsg(db_);
        return std::nullopt;
    }
    stmt.bind(1, normalize(path));

    int rc = stmt.step();
    if (rc != SQLITE_ROW) {
        if (rc != SQLITE_DONE) {
            last_error_ = sqlite3_errmsg(db_);
        }
        return std::nullopt;
    }

    CacheEntry entry;
    entry.path = stmt.text(0);
    entry.category = stmt.text(1);
    entry.title = stmt.text(2);
    entry.status = string_to_status(stmt.text(3));
    entry.file_size = sqlite3_column_int64(stmt.get(), 4);
    return entry;
}

bool CacheIndex::remove(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "DELETE FROM cache_entries WHERE path = ?1");
    if (!stmt.ok()) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    stmt.bind(1, normalize(path));

    if (stmt.step() != SQLITE_DONE) {
        last_error_ = sqlite3_errmsg(db_);
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

int CacheIndex::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!execute("DELETE FROM cache_entries")) {
        return -1;
    }
    return sqlite3_changes(db_);
}

int64_t CacheIndex::count() {
    std::lock_guard<std::mutex> lock(mutex_);

    Statement stmt(db_, "SELECT COUNT(*) FROM cache_entries");
    if (!stmt.ok() || stmt.step() != SQLITE_ROW) {
        last_error_ = sqlite3_errmsg(db_);
        return 0;
    }
    return sqlite3_column_int64(stmt.get(), 0);
}

std::string CacheIndex::get_last_error() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

} // namespace demoloader
