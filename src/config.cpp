/*
 * src/config.cpp - Run configuration validation
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/config.h"
#include <filesystem>

namespace fs = std::filesystem;

namespace demoloader {

void validate_config(const TransferConfig& config) {
    if (config.concurrency < MIN_CONCURRENCY || config.concurrency > MAX_CONCURRENCY) {
        throw ConfigError("Concurrent transfers must be between " + std::to_string(MIN_CONCURRENCY) +
                          " and " + std::to_string(MAX_CONCURRENCY) + " (got " +
                          std::to_string(config.concurrency) + ")");
    }
    if (config.retry_attempts < 0 || config.retry_attempts > MAX_RETRY_ATTEMPTS) {
        throw ConfigError("Retry attempts must be between 0 and " + std::to_string(MAX_RETRY_ATTEMPTS));
    }
    if (config.connect_timeout_seconds <= 0 || config.low_speed_time_seconds <= 0) {
        throw ConfigError("Timeouts must be positive");
    }
    if (config.cdn_base.empty()) {
        throw ConfigError("CDN base URL is empty");
    }
    if (config.catalog_url.empty()) {
        throw ConfigError("Catalog URL is empty");
    }
    if (config.cache_dir.empty()) {
        throw ConfigError("Cache directory is empty");
    }
}

std::string cache_root(const TransferConfig& config) {
    fs::path dir(config.cache_dir);
    if (dir.is_absolute()) {
        return dir.string();
    }
    return (fs::path(config.destination_root) / dir).string();
}

std::string cache_index_path(const TransferConfig& config) {
    return (fs::path(cache_root(config)) / config.cache_index).string();
}

} // namespace demoloader
