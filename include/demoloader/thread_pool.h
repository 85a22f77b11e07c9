/*
 * thread_pool.h - Worker threads that execute slot jobs
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <thread>
#include <vector>
#include <queue>
#include <functional>
#include <mutex>
#include <condition_variable>
#include <atomic>
#include <exception>

namespace demoloader {

// One thread per slot. The pool only grows: a run that lowers its
// concurrency keeps the extra threads idle until shutdown.
class ThreadPool {
public:
    // Receives the slot of a job that let an exception escape
    using ErrorHandler = std::function<void(size_t slot_index, std::exception_ptr error)>;

    ThreadPool(size_t num_threads, ErrorHandler on_error);
    ~ThreadPool();

    // Non-copyable, non-movable
    ThreadPool(const ThreadPool&) = delete;
    ThreadPool& operator=(const ThreadPool&) = delete;
    ThreadPool(ThreadPool&&) = delete;
    ThreadPool& operator=(ThreadPool&&) = delete;

    // Queue the job for a slot. Returns false once the pool is shut down.
    bool submit(size_t slot_index, std::function<void()> job);

    void grow(size_t num_threads);

    // Stop accepting jobs, run the queued ones and join
    void shutdown();

private:
    struct SlotJob {
        size_t slot_index;
        std::function<void()> run;
    };

    void worker_thread();

    std::vector<std::thread> workers_;
    std::queue<SlotJob> jobs_;
    ErrorHandler on_error_;

    std::mutex queue_mutex_;
    std::condition_variable condition_;
    std::atomic<bool> stop_{false};
};

} // namespace demoloader
