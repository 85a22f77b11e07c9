/*
 * storage.h - Destination drives, free space and cache directory layout
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>

namespace demoloader {

struct RemovableDrive {
    std::string name;          // Mount basename, or "Unnamed USB"
    std::string mount_point;
    uint64_t free_bytes = 0;
    uint64_t total_bytes = 0;
};

struct SpaceInfo {
    uint64_t free_bytes = 0;
    uint64_t total_bytes = 0;
};

// Mounted block devices flagged removable in /sys/block
std::vector<RemovableDrive> list_removable_drives();

// statvfs() on path; nullopt if the path cannot be queried
std::optional<SpaceInfo> query_free_space(const std::string& path);

// "<name> (<mount>) - <free> GB Free / <total> GB Total"
std::string format_drive_label(const RemovableDrive& drive);

bool check_capacity(int64_t required_bytes, uint64_t free_bytes);

// "Total Required Space: <req> GB / <free> GB Free"
std::string format_capacity_summary(int64_t required_bytes, uint64_t free_bytes);

// Fixed text shown when check_capacity() fails
const char* capacity_warning();

// Create <root>/<category> for each category. With clear set, the root is
// removed first. Returns false and fills error on failure.
bool prepare_cache_root(const std::string& root,
                        const std::vector<std::string>& categories,
                        bool clear,
                        std::string& error);

} // namespace demoloader
