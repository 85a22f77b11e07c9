/*
 * completion_tracker.h - Counts terminal events and signals batch completion once
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <cstdint>
#include <unordered_map>
#include <vector>
#include "demoloader/common.h"

namespace demoloader {

struct BatchSummary {
    int64_t total = 0;
    int64_t completed = 0;
    int64_t skipped = 0;
    int64_t failed = 0;
    int64_t cancelled = 0;
};

class CompletionTracker {
public:
    // The tracker is bound to the exact task ids of the run
    explicit CompletionTracker(const std::vector<uint64_t>& task_ids);

    // Record a terminal outcome. Returns true only for the event that makes
    // completed_count() reach total_count(). Unknown ids, repeated ids and
    // events after completion are ignored.
    bool on_terminal(uint64_t task_id, TransferStatus outcome);

    int64_t completed_count() const { return summary_.completed + summary_.skipped +
                                             summary_.failed + summary_.cancelled; }
    int64_t total_count() const { return summary_.total; }
    bool is_complete() const { return fired_; }
    const BatchSummary& summary() const { return summary_; }

private:
    std::unordered_map<uint64_t, bool> seen_;   // task id -> terminal already counted
    BatchSummary summary_;
    bool fired_ = false;
};

} // namespace demoloader
