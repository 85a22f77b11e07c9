/*
 * scheduler.h - Bounded FIFO scheduling of transfers onto worker slots
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <chrono>
#include <condition_variable>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <vector>
#include "demoloader/common.h"
#include "demoloader/cache_gate.h"
#include "demoloader/completion_tracker.h"
#include "demoloader/event_channel.h"
#include "demoloader/slot_pool.h"
#include "demoloader/thread_pool.h"
#include "demoloader/transfer_worker.h"

namespace demoloader {

// Callbacks for front ends. All of them except on_log_message are invoked
// from the coordinator thread, in event order. They must not call wait().
struct SchedulerCallbacks {
    std::function<void(uint64_t task_id, size_t slot_index)> on_task_started;
    std::function<void(uint64_t task_id, int64_t transferred, int64_t total,
                       const std::string& display_name)> on_progress;
    std::function<void(uint64_t task_id, TransferStatus outcome,
                       const std::string& message)> on_task_terminal;
    std::function<void(const BatchSummary& summary)> on_batch_complete;
    std::function<void(const std::string& message)> on_log_message;
};

struct SchedulerStats {
    int64_t total_tasks = 0;
    int64_t pending = 0;
    int64_t active = 0;
    int64_t completed = 0;
    int64_t skipped = 0;
    int64_t failed = 0;
    int64_t cancelled = 0;
    int concurrency = 0;
    int64_t bytes_transferred = 0;
    double elapsed_seconds = 0.0;
};

class Scheduler {
public:
    // gate is optional and not owned. retry_attempts re-runs a task whose
    // transfer failed with a network or size error, inside the same slot.
    explicit Scheduler(WorkerFactory factory, CacheGate* gate = nullptr, int retry_attempts = 0);
    ~Scheduler();

    // Non-copyable
    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void set_callbacks(const SchedulerCallbacks& callbacks);

    // Begin a run. Throws ConfigError if concurrency is outside 1..15, tasks
    // is empty or holds a duplicate id, free_space_bytes is known and too
    // small for the tasks the gate will not skip, or a run is already in
    // progress.
    void start(const std::vector<TransferTask>& tasks, int concurrency,
               std::optional<uint64_t> free_space_bytes = std::nullopt);

    // Change the slot limit of the current run. Running transfers keep their
    // slots; retired slots go away as they free. Throws ConfigError on range.
    void set_concurrency(int concurrency);

    // Pending tasks become CANCELLED; in-flight transfers stop at the next
    // chunk and remove their partial file.
    void cancel();

    // Block until the batch completes
    void wait();

    bool is_running() const;
    SchedulerStats get_stats() const;
    std::optional<TransferStatus> task_status(uint64_t task_id) const;

private:
    // Coordinator thread
    void coordinator_loop();
    void dispatch(const TransferEvent& event);
    void fill_free_slots();
    void on_slot_freed(size_t slot_index);
    bool assign_next(size_t slot_index);
    void launch(size_t slot_index, const TransferTask& task);
    void finish_task(const TransferTask& task, TransferStatus outcome, const std::string& message);
    void cancel_pending();
    void apply_resize(int concurrency);
    bool stopping() const;

    // Worker threads
    void run_slot(size_t slot_index, const TransferTask& task,
                  std::shared_ptr<CancellationToken> token,
                  std::shared_ptr<EventChannel> channel);

    void set_status(uint64_t task_id, TransferStatus status);
    void log(const std::string& message);

    WorkerFactory factory_;
    CacheGate* gate_;
    int retry_attempts_;

    // Run state, owned by the coordinator thread
    std::deque<TransferTask> pending_;
    std::unique_ptr<SlotPool> slots_;
    std::unique_ptr<CompletionTracker> tracker_;
    bool cancel_requested_ = false;

    // Shared with workers
    std::unique_ptr<ThreadPool> pool_;
    std::shared_ptr<EventChannel> events_;
    std::shared_ptr<CancellationToken> cancel_token_;

    // Run control
    mutable std::mutex control_mutex_;
    std::condition_variable done_cv_;
    bool running_ = false;
    std::thread coordinator_;

    // Statistics
    mutable std::mutex stats_mutex_;
    SchedulerStats stats_;
    std::unordered_map<uint64_t, TransferStatus> statuses_;
    std::chrono::steady_clock::time_point start_time_;
    bool timing_ = false;

    // Callbacks
    SchedulerCallbacks callbacks_;
    mutable std::mutex callback_mutex_;
};

} // namespace demoloader
