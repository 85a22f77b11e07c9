/*
 * src/event_channel.cpp - Worker to coordinator event handoff
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/event_channel.h"

namespace demoloader {

bool EventChannel::post(TransferEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        events_.push_back(std::move(event));
    }
    condition_.notify_one();
    return true;
}

std::optional<TransferEvent> EventChannel::wait_pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    condition_.wait(lock, [this] { return closed_ || !events_.empty(); });
    if (events_.empty()) {
        return std::nullopt;
    }
    TransferEvent event = std::move(events_.front());
    events_.pop_front();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    condition_.notify_all();
}

} // namespace demoloader
