/*
 * thread_pool.cpp - Worker threads that execute slot jobs
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/thread_pool.h"
#include <stdexcept>

namespace demoloader {

ThreadPool::ThreadPool(size_t num_threads, ErrorHandler on_error)
    : on_error_(std::move(on_error)) {
    if (!on_error_) {
        throw std::invalid_argument("ThreadPool requires an error handler");
    }
    grow(num_threads);
}

ThreadPool::~ThreadPool() {
    shutdown();
}

void ThreadPool::grow(size_t num_threads) {
    std::lock_guard<std::mutex> lock(queue_mutex_);
    if (stop_) return;
    while (workers_.size() < num_threads) {
        workers_.emplace_back(&ThreadPool::worker_thread, this);
    }
}

void ThreadPool::worker_thread() {
    for (;;) {
        SlotJob job;
        {
            std::unique_lock<std::mutex> lock(queue_mutex_);
            condition_.wait(lock, [this] { return stop_ || !jobs_.empty(); });

            // Queued jobs still run after shutdown so every slot reports back
            if (jobs_.empty()) {
                return;
            }
            job = std::move(jobs_.front());
            jobs_.pop();
        }

        try {
            job.run();
        } catch (...) {
            on_error_(job.slot_index, std::current_exception());
        }
    }
}

bool ThreadPool::submit(size_t slot_index, std::function<void()> job) {
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) {
            return false;
        }
        jobs_.push(SlotJob{slot_index, std::move(job)});
    }
    condition_.notify_one();
    return true;
}

void ThreadPool::shutdown() {
    std::vector<std::thread> workers;
    {
        std::lock_guard<std::mutex> lock(queue_mutex_);
        if (stop_) return;
        stop_ = true;
        workers.swap(workers_);
    }

    condition_.notify_all();

    for (auto& worker : workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
}

} // namespace demoloader
