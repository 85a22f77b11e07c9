/*
 * src/cache_gate.cpp - Cache short-circuit for already materialized files
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/cache_gate.h"
#include "demoloader/cache_index.h"
#include "demoloader/task_builder.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace demoloader {

CacheGate::CacheGate(std::string cache_root, bool enabled, CacheIndex* index)
    : cache_root_(std::move(cache_root)), enabled_(enabled), index_(index) {
}

std::string CacheGate::cache_key(const TransferTask& task) const {
    std::string extension = fs::path(task.destination_path).extension().string();
    fs::path key = fs::path(cache_root_) / safe_file_name(task.category) /
                   (safe_file_name(task.display_name) + extension);
    return key.lexically_normal().string();
}

bool CacheGate::should_skip(const TransferTask& task) const {
    if (!enabled_) {
        return false;
    }

    std::string key = cache_key(task);
    std::error_code ec;
    if (!fs::is_regular_file(key, ec)) {
        return false;
    }

    if (index_) {
        auto entry = index_->lookup(key);
        if (entry) {
            if (entry->status != TransferStatus::COMPLETED) {
                return false;
            }
            auto size = fs::file_size(key, ec);
            if (ec || static_cast<int64_t>(size) != entry->file_size) {
                return false;
            }
        }
    }
    return true;
}

int64_t CacheGate::bytes_to_transfer(const std::vector<TransferTask>& tasks) const {
    int64_t total = 0;
    for (const auto& task : tasks) {
        if (!should_skip(task)) {
            total += task.estimated_size_bytes;
        }
    }
    return total;
}

bool CacheGate::record(const TransferTask& task, const TransferResult& result) {
    if (!index_) {
        return true;
    }

    CacheEntry entry;
    entry.path = cache_key(task);
    entry.category = task.category;
    entry.title = task.display_name;
    entry.status = result.status;
    entry.file_size = result.bytes_transferred;
    return index_->record(entry);
}

} // namespace demoloader
