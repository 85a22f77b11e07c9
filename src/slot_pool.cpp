/*
 * src/slot_pool.cpp - Slot bookkeeping
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/slot_pool.h"
#include <stdexcept>
#include <string>

namespace demoloader {

SlotPool::SlotPool(size_t limit) : limit_(0) {
    set_limit(limit);
}

std::optional<size_t> SlotPool::acquire_free() const {
    if (!has_capacity()) {
        return std::nullopt;
    }
    for (const auto& slot : slots_) {
        if (!slot.retired && !slot.occupied()) {
            return slot.index;
        }
    }
    return std::nullopt;
}

void SlotPool::bind(size_t index, const TransferTask& task) {
    if (index >= slots_.size()) {
        throw std::logic_error("Slot " + std::to_string(index) + " does not exist");
    }
    Slot& slot = slots_[index];
    if (slot.retired) {
        throw std::logic_error("Slot " + std::to_string(index) + " is retired");
    }
    if (slot.occupied()) {
        throw std::logic_error("Slot " + std::to_string(index) + " is already running task " +
                               std::to_string(slot.task->id));
    }
    if (!has_capacity()) {
        throw std::logic_error("Already running " + std::to_string(limit_) + " transfers");
    }
    slot.task = task;
    slot.bytes_transferred = 0;
    slot.total_bytes = task.expected_size_bytes.value_or(-1);
}

bool SlotPool::release(size_t index) {
    if (index >= slots_.size()) {
        return false;
    }
    Slot& slot = slots_[index];
    slot.task.reset();
    slot.bytes_transferred = 0;
    slot.total_bytes = -1;

    if (slot.retired) {
        trim_retired();
        return false;
    }
    return true;
}

void SlotPool::update_progress(size_t index, int64_t transferred, int64_t total) {
    if (index >= slots_.size() || !slots_[index].occupied()) {
        return;
    }
    slots_[index].bytes_transferred = transferred;
    slots_[index].total_bytes = total;
}

void SlotPool::set_limit(size_t limit) {
    limit_ = limit;

    for (auto& slot : slots_) {
        slot.retired = slot.index >= limit_;
    }
    while (slots_.size() < limit_) {
        Slot slot;
        slot.index = slots_.size();
        slots_.push_back(std::move(slot));
    }
    trim_retired();
}

size_t SlotPool::occupied_count() const {
    size_t count = 0;
    for (const auto& slot : slots_) {
        if (slot.occupied()) count++;
    }
    return count;
}

void SlotPool::trim_retired() {
    while (!slots_.empty() && slots_.back().retired && !slots_.back().occupied()) {
        slots_.pop_back();
    }
}

} // namespace demoloader
