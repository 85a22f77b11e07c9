/*
 * src/task_builder.cpp - Task list construction from a catalog selection
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/task_builder.h"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>

namespace fs = std::filesystem;

namespace demoloader {

std::string safe_file_name(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (unsigned char c : name) {
        if (c <= 31 || c == '/' || c == '\\' || c == ':') continue;
        out.push_back(static_cast<char>(c));
    }
    if (out.empty() || out == "." || out == "..") out = "untitled";
    return out;
}

std::string join_url(const std::string& base, const std::string& path) {
    std::string left = base;
    while (!left.empty() && left.back() == '/') {
        left.pop_back();
    }
    size_t start = path.find_first_not_of('/');
    std::string right = start == std::string::npos ? "" : path.substr(start);
    return left + "/" + right;
}

std::string file_extension_for(const CatalogItem& item) {
    if (item.filetype.empty()) {
        return "mp4";
    }
    std::string ext = item.filetype;
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (!ext.empty() && ext.front() == '.') {
        ext.erase(0, 1);
    }
    return ext;
}

int64_t gb_to_bytes(double size_gb) {
    if (size_gb <= 0.0) {
        return 0;
    }
    return static_cast<int64_t>(std::llround(size_gb * static_cast<double>(BYTES_PER_GB)));
}

std::vector<TransferTask> build_tasks(const std::vector<CatalogItem>& items,
                                      const std::string& cdn_base,
                                      const std::string& cache_root) {
    std::vector<TransferTask> tasks;
    tasks.reserve(items.size());

    uint64_t next_id = 1;
    for (const auto& item : items) {
        TransferTask task;
        task.id = next_id++;
        task.source_url = join_url(cdn_base, item.url);
        task.display_name = item.title;
        task.category = item.category;
        task.destination_path = (fs::path(cache_root) / safe_file_name(item.category) /
                                 (safe_file_name(item.title) + "." + file_extension_for(item)))
                                    .lexically_normal().string();
        task.estimated_size_bytes = gb_to_bytes(item.size_gb);
        tasks.push_back(std::move(task));
    }
    return tasks;
}

int64_t required_bytes(const std::vector<TransferTask>& tasks) {
    int64_t total = 0;
    for (const auto& task : tasks) {
        total += task.estimated_size_bytes;
    }
    return total;
}

} // namespace demoloader
