/*
 * cache_gate.h - Skips tasks whose destination was materialized by an earlier run
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <vector>
#include "demoloader/common.h"
#include "demoloader/transfer_worker.h"

namespace demoloader {

class CacheIndex;

class CacheGate {
public:
    // index is optional and not owned; without it any existing file counts
    CacheGate(std::string cache_root, bool enabled, CacheIndex* index = nullptr);

    // <cache_root>/<category>/<safe display name><extension of destination_path>
    std::string cache_key(const TransferTask& task) const;

    // True if caching is on and a file already sits at the cache key. A file
    // the index knows as a failed/cancelled partial, or whose size differs from
    // the recorded complete size, does not count.
    bool should_skip(const TransferTask& task) const;

    // Estimated bytes the run still has to write. Files that would be skipped
    // already occupy their space on the destination and are not counted.
    int64_t bytes_to_transfer(const std::vector<TransferTask>& tasks) const;

    // Remember a terminal outcome so later runs can trust (or distrust) the
    // file. Returns false if the index rejected the write.
    bool record(const TransferTask& task, const TransferResult& result);

private:
    std::string cache_root_;
    bool enabled_;
    CacheIndex* index_;
};

} // namespace demoloader
