/*
 * src/completion_tracker.cpp - Batch completion accounting
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/completion_tracker.h"

namespace demoloader {

CompletionTracker::CompletionTracker(const std::vector<uint64_t>& task_ids) {
    for (uint64_t id : task_ids) {
        seen_.emplace(id, false);
    }
    summary_.total = static_cast<int64_t>(seen_.size());
}

bool CompletionTracker::on_terminal(uint64_t task_id, TransferStatus outcome) {
    if (fired_) {
        return false;
    }

    auto it = seen_.find(task_id);
    if (it == seen_.end() || it->second) {
        return false;
    }
    it->second = true;

    switch (outcome) {
        case TransferStatus::COMPLETED: summary_.completed++; break;
        case TransferStatus::SKIPPED: summary_.skipped++; break;
        case TransferStatus::CANCELLED: summary_.cancelled++; break;
        default: summary_.failed++; break;
    }

    if (completed_count() == summary_.total) {
        fired_ = true;
        return true;
    }
    return false;
}

} // namespace demoloader
