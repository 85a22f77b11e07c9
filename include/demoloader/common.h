/*
 * common.h - Shared types and constants for the transfer engine
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <cstdint>
#include <optional>
#include <stdexcept>

namespace demoloader {

// A single selected item to be copied from the CDN to local storage.
// Immutable once built by the task builder.
struct TransferTask {
    uint64_t id = 0;
    std::string source_url;         // Full URL (CDN base + catalog path)
    std::string destination_path;   // <cache_root>/<category>/<title>.<ext>
    std::string display_name;       // Catalog title
    std::string category;           // Catalog category (e.g. "Movies")
    std::optional<int64_t> expected_size_bytes;  // Known only from response headers
    int64_t estimated_size_bytes = 0;            // Catalog estimate, used for capacity checks
};

// Per-task state machine:
// QUEUED -> ASSIGNED -> TRANSFERRING -> {COMPLETED | FAILED | CANCELLED}
// SKIPPED is the terminal state of a cache hit.
enum class TransferStatus {
    QUEUED,
    ASSIGNED,
    TRANSFERRING,
    COMPLETED,
    SKIPPED,
    FAILED,
    CANCELLED
};

enum class ErrorKind {
    NETWORK,        // Connect/timeout/HTTP failure
    IO,             // Cannot create or write the destination
    CONFIG,         // Invalid concurrency, empty task set, not enough space
    SIZE_MISMATCH,  // Declared length disagrees with bytes received
    CANCELLED,
    INTERNAL
};

struct ErrorInfo {
    ErrorKind kind;
    std::string message;
};

// Thrown at API boundaries for invalid run configuration
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& what) : std::runtime_error(what) {}
};

// Constants
constexpr int MIN_CONCURRENCY = 1;
constexpr int MAX_CONCURRENCY = 15;
constexpr int DEFAULT_CONCURRENCY = 3;
constexpr int MAX_RETRY_ATTEMPTS = 10;
constexpr size_t TRANSFER_CHUNK_SIZE = 4096;
constexpr int CONNECT_TIMEOUT_SECONDS = 30;
constexpr int LOW_SPEED_TIME_SECONDS = 60;
constexpr int CATALOG_TIMEOUT_SECONDS = 60;
constexpr int64_t BYTES_PER_MB = 1024 * 1024;
constexpr int64_t BYTES_PER_GB = 1024 * 1024 * 1024;
constexpr const char* DEFAULT_CDN_BASE = "https://cdn.skyy.cc";
constexpr const char* DEFAULT_CATALOG_URL =
    "https://raw.githubusercontent.com/Paneedah/StoreDemoDownloader/refs/heads/master/data.json";
constexpr const char* DEFAULT_CACHE_DIR = "cache";
constexpr const char* DEFAULT_CACHE_INDEX = "cache.db";
constexpr const char* USER_AGENT = "demoloader/1.0";

inline bool is_terminal(TransferStatus status) {
    return status == TransferStatus::COMPLETED || status == TransferStatus::SKIPPED ||
           status == TransferStatus::FAILED || status == TransferStatus::CANCELLED;
}

// Helper to convert TransferStatus to string
inline const char* status_to_string(TransferStatus status) {
    switch (status) {
        case TransferStatus::QUEUED: return "QUEUED";
        case TransferStatus::ASSIGNED: return "ASSIGNED";
        case TransferStatus::TRANSFERRING: return "TRANSFERRING";
        case TransferStatus::COMPLETED: return "COMPLETED";
        case TransferStatus::SKIPPED: return "SKIPPED";
        case TransferStatus::FAILED: return "FAILED";
        case TransferStatus::CANCELLED: return "CANCELLED";
        default: return "UNKNOWN";
    }
}

inline TransferStatus string_to_status(const std::string& str) {
    if (str == "ASSIGNED") return TransferStatus::ASSIGNED;
    if (str == "TRANSFERRING") return TransferStatus::TRANSFERRING;
    if (str == "COMPLETED") return TransferStatus::COMPLETED;
    if (str == "SKIPPED") return TransferStatus::SKIPPED;
    if (str == "FAILED") return TransferStatus::FAILED;
    if (str == "CANCELLED") return TransferStatus::CANCELLED;
    return TransferStatus::QUEUED;
}

} // namespace demoloader
