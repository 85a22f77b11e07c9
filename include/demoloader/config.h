/*
 * config.h - Run configuration shared by the CLI and GUI front ends
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include "demoloader/common.h"

namespace demoloader {

struct TransferConfig {
    int concurrency = DEFAULT_CONCURRENCY;      // 1..15
    bool use_cache = true;                      // Skip items already materialized
    int retry_attempts = 0;                     // Extra attempts after a network failure
    int connect_timeout_seconds = CONNECT_TIMEOUT_SECONDS;
    long low_speed_limit_bps = 1;               // Abort if slower than this...
    int low_speed_time_seconds = LOW_SPEED_TIME_SECONDS;  // ...for this long
    std::string cdn_base = DEFAULT_CDN_BASE;
    std::string catalog_url = DEFAULT_CATALOG_URL;
    std::string user_agent = USER_AGENT;
    std::string destination_root = ".";
    std::string cache_dir = DEFAULT_CACHE_DIR;       // Relative to destination_root
    std::string cache_index = DEFAULT_CACHE_INDEX;   // Relative to the cache root
};

// Throws ConfigError describing the first invalid field
void validate_config(const TransferConfig& config);

// <destination_root>/<cache_dir>, or cache_dir itself when absolute
std::string cache_root(const TransferConfig& config);

// <cache_root>/<cache_index>
std::string cache_index_path(const TransferConfig& config);

} // namespace demoloader
