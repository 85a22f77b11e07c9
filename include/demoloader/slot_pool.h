/*
 * slot_pool.h - Fixed set of execution slots, one active transfer each
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "demoloader/common.h"

namespace demoloader {

struct Slot {
    size_t index = 0;                   // Stable for the lifetime of a run
    std::optional<TransferTask> task;   // Owned while occupied
    int64_t bytes_transferred = 0;
    int64_t total_bytes = -1;           // -1 until the worker reports a total
    bool retired = false;               // Beyond the current limit; removed once idle

    bool occupied() const { return task.has_value(); }
};

// Slot bookkeeping for the scheduler. Not thread-safe: it is owned by the
// coordinator thread like the rest of the run state.
class SlotPool {
public:
    explicit SlotPool(size_t limit);

    size_t limit() const { return limit_; }
    size_t size() const { return slots_.size(); }

    // Lowest-indexed idle slot within the limit. None while occupied_count()
    // is at the limit, which after a shrink includes retired slots still busy.
    std::optional<size_t> acquire_free() const;

    bool has_capacity() const { return occupied_count() < limit_; }

    // Throws std::logic_error if the slot is occupied, retired or out of range,
    // or if the pool is already running limit() transfers
    void bind(size_t index, const TransferTask& task);

    // Frees the slot. Returns false if it was retired (and has been removed
    // or is waiting to be trimmed), true if it can take another task.
    bool release(size_t index);

    void update_progress(size_t index, int64_t transferred, int64_t total);

    // Grow: append idle slots now. Shrink: slots at index >= limit are retired
    // and go away as their transfers finish; running transfers are untouched.
    void set_limit(size_t limit);

    const Slot& at(size_t index) const { return slots_.at(index); }
    size_t occupied_count() const;

private:
    void trim_retired();

    std::vector<Slot> slots_;
    size_t limit_;
};

} // namespace demoloader
