/*
 * src/storage.cpp - Removable drive discovery and cache root preparation
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/storage.h"
#include "demoloader/common.h"
#include "demoloader/task_builder.h"
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <iomanip>
#include <set>
#include <sys/statvfs.h>

namespace fs = std::filesystem;

namespace demoloader {

namespace {

// /proc/mounts escapes spaces and friends as octal (\040)
std::string unescape_mount_field(const std::string& field) {
    std::string out;
    for (size_t i = 0; i < field.size(); ++i) {
        if (field[i] == '\\' && i + 3 < field.size() &&
            std::isdigit(static_cast<unsigned char>(field[i + 1])) &&
            std::isdigit(static_cast<unsigned char>(field[i + 2])) &&
            std::isdigit(static_cast<unsigned char>(field[i + 3]))) {
            int value = (field[i + 1] - '0') * 64 + (field[i + 2] - '0') * 8 + (field[i + 3] - '0');
            out.push_back(static_cast<char>(value));
            i += 3;
        } else {
            out.push_back(field[i]);
        }
    }
    return out;
}

// sdb1 -> sdb, mmcblk0p1 -> mmcblk0, nvme0n1p2 -> nvme0n1
std::string parent_disk(const std::string& partition) {
    fs::path sys_class = fs::path("/sys/class/block") / partition;
    std::error_code ec;
    if (fs::exists(sys_class / "partition", ec)) {
        fs::path resolved = fs::canonical(sys_class, ec);
        if (!ec) {
            return resolved.parent_path().filename().string();
        }
    }
    return partition;
}

bool is_removable(const std::string& disk) {
    std::ifstream in("/sys/block/" + disk + "/removable");
    int flag = 0;
    return in && (in >> flag) && flag == 1;
}

std::string format_gb(uint64_t bytes) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(2)
       << static_cast<double>(bytes) / static_cast<double>(BYTES_PER_GB);
    return ss.str();
}

} // anonymous namespace

std::vector<RemovableDrive> list_removable_drives() {
    std::vector<RemovableDrive> drives;
    std::ifstream mounts("/proc/mounts");
    if (!mounts) {
        return drives;
    }

    std::set<std::string> seen_mounts;
    std::string line;
    while (std::getline(mounts, line)) {
        std::istringstream fields(line);
        std::string device, mount_point;
        if (!(fields >> device >> mount_point)) continue;
        if (device.rfind("/dev/", 0) != 0) continue;

        mount_point = unescape_mount_field(mount_point);
        if (!seen_mounts.insert(mount_point).second) continue;

        std::string partition = fs::path(device).filename().string();
        if (!is_removable(parent_disk(partition))) continue;

        auto space = query_free_space(mount_point);
        if (!space) continue;

        RemovableDrive drive;
        drive.mount_point = mount_point;
        drive.name = fs::path(mount_point).filename().string();
        if (drive.name.empty()) drive.name = "Unnamed USB";
        drive.free_bytes = space->free_bytes;
        drive.total_bytes = space->total_bytes;
        drives.push_back(std::move(drive));
    }
    return drives;
}

std::optional<SpaceInfo> query_free_space(const std::string& path) {
    struct statvfs st;
    if (statvfs(path.c_str(), &st) != 0) {
        return std::nullopt;
    }
    SpaceInfo info;
    info.free_bytes = static_cast<uint64_t>(st.f_bavail) * st.f_frsize;
    info.total_bytes = static_cast<uint64_t>(st.f_blocks) * st.f_frsize;
    return info;
}

std::string format_drive_label(const RemovableDrive& drive) {
    return drive.name + " (" + drive.mount_point + ") - " + format_gb(drive.free_bytes) +
           " GB Free / " + format_gb(drive.total_bytes) + " GB Total";
}

bool check_capacity(int64_t required_bytes, uint64_t free_bytes) {
    if (required_bytes <= 0) return true;
    return static_cast<uint64_t>(required_bytes) <= free_bytes;
}

std::string format_capacity_summary(int64_t required_bytes, uint64_t free_bytes) {
    uint64_t required = required_bytes > 0 ? static_cast<uint64_t>(required_bytes) : 0;
    return "Total Required Space: " + format_gb(required) + " GB / " +
           format_gb(free_bytes) + " GB Free";
}

const char* capacity_warning() {
    return "Warning: Not enough space on the selected USB drive!";
}

bool prepare_cache_root(const std::string& root,
                        const std::vector<std::string>& categories,
                        bool clear,
                        std::string& error) {
    std::error_code ec;
    fs::path root_path(root);

    if (clear && fs::exists(root_path, ec)) {
        fs::remove_all(root_path, ec);
        if (ec) {
            error = "Failed to clear " + root + ": " + ec.message();
            return false;
        }
    }

    fs::create_directories(root_path, ec);
    if (ec) {
        error = "Failed to create " + root + ": " + ec.message();
        return false;
    }

    for (const auto& category : categories) {
        fs::path dir = root_path / safe_file_name(category);
        fs::create_directories(dir, ec);
        if (ec) {
            error = "Failed to create " + dir.string() + ": " + ec.message();
            return false;
        }
    }
    return true;
}

} // namespace demoloader
