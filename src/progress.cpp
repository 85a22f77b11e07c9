/*
 * src/progress.cpp - Progress percentage and label rendering
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/progress.h"
#include "demoloader/common.h"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace demoloader {

double compute_percent_exact(int64_t transferred, int64_t total) {
    if (total <= 0) {
        return 100.0;
    }
    double percent = static_cast<double>(std::max<int64_t>(transferred, 0)) /
                     static_cast<double>(total) * 100.0;
    return std::min(percent, 100.0);
}

// Integer arithmetic so 29/100 floors to 29, not 28.999...
int compute_percent(int64_t transferred, int64_t total) {
    if (total <= 0) {
        return 100;
    }
    int64_t clamped = std::min(std::max<int64_t>(transferred, 0), total);
    return static_cast<int>(clamped * 100 / total);
}

std::string format_progress_label(const std::string& display_name,
                                  int64_t transferred, int64_t total) {
    double done_mb = static_cast<double>(transferred) / BYTES_PER_MB;
    double total_mb = static_cast<double>(std::max<int64_t>(total, 0)) / BYTES_PER_MB;

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2)
        << display_name << ": " << done_mb << "MB / " << total_mb << "MB ("
        << compute_percent_exact(transferred, total) << "%)";
    return oss.str();
}

std::string format_bytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;
    double value = static_cast<double>(bytes);

    while (value >= 1024.0 && unit_index < 4) {
        value /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit_index];
    return oss.str();
}

} // namespace demoloader
