/*
 * event_channel.h - Worker to coordinator event handoff
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include "demoloader/transfer_worker.h"

namespace demoloader {

enum class EventType {
    STARTED,    // Worker picked the task up (Assigned -> Transferring)
    PROGRESS,   // bytes/total for the task in slot_index
    TERMINAL,   // result holds the outcome; frees the slot
    LOG,        // message from a worker thread
    RESIZE,     // value = new concurrency limit
    CANCEL
};

struct TransferEvent {
    EventType type = EventType::LOG;
    size_t slot_index = 0;
    uint64_t task_id = 0;
    int64_t bytes = 0;
    int64_t total = -1;
    int value = 0;
    TransferResult result;
    std::string message;
};

// Multi-producer, single-consumer queue. Workers post, the coordinator pops.
class EventChannel {
public:
    EventChannel() = default;

    EventChannel(const EventChannel&) = delete;
    EventChannel& operator=(const EventChannel&) = delete;

    // Returns false once the channel is closed
    bool post(TransferEvent event);

    // Blocks until an event arrives. nullopt when closed and drained.
    std::optional<TransferEvent> wait_pop();

    // Wakes the consumer; later posts are dropped
    void close();

private:
    std::deque<TransferEvent> events_;
    std::mutex mutex_;
    std::condition_variable condition_;
    bool closed_ = false;
};

} // namespace demoloader
