/*
 * src/scheduler.cpp - Bounded FIFO scheduling of transfers onto worker slots
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/scheduler.h"
#include "demoloader/progress.h"
#include "demoloader/task_builder.h"
#include <unordered_set>

namespace demoloader {

namespace {

TransferResult internal_failure(const TransferTask& task, const std::string& detail) {
    TransferResult result;
    result.success = false;
    result.status = TransferStatus::FAILED;
    result.error = ErrorInfo{ErrorKind::INTERNAL, detail};
    result.message = "Error downloading " + task.display_name + ": " + detail;
    return result;
}

bool is_retryable(const TransferResult& result) {
    if (!result.error) return false;
    return result.error->kind == ErrorKind::NETWORK ||
           result.error->kind == ErrorKind::SIZE_MISMATCH;
}

} // anonymous namespace

Scheduler::Scheduler(WorkerFactory factory, CacheGate* gate, int retry_attempts)
    : factory_(std::move(factory)), gate_(gate), retry_attempts_(retry_attempts) {
    if (!factory_) {
        throw ConfigError("Scheduler needs a worker factory");
    }
    if (retry_attempts_ < 0 || retry_attempts_ > MAX_RETRY_ATTEMPTS) {
        throw ConfigError("Retry attempts must be between 0 and " +
                          std::to_string(MAX_RETRY_ATTEMPTS));
    }
}

Scheduler::~Scheduler() {
    cancel();
    wait();
    if (coordinator_.joinable()) {
        coordinator_.join();
    }
    if (pool_) {
        pool_->shutdown();
    }
}

void Scheduler::set_callbacks(const SchedulerCallbacks& callbacks) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    callbacks_ = callbacks;
}

void Scheduler::start(const std::vector<TransferTask>& tasks, int concurrency,
                      std::optional<uint64_t> free_space_bytes) {
    if (concurrency < MIN_CONCURRENCY || concurrency > MAX_CONCURRENCY) {
        throw ConfigError("Concurrency must be between " + std::to_string(MIN_CONCURRENCY) +
                          " and " + std::to_string(MAX_CONCURRENCY) + ", got " +
                          std::to_string(concurrency));
    }
    if (tasks.empty()) {
        throw ConfigError("No tasks selected");
    }

    std::unordered_set<uint64_t> seen;
    std::vector<uint64_t> ids;
    ids.reserve(tasks.size());
    for (const auto& task : tasks) {
        if (!seen.insert(task.id).second) {
            throw ConfigError("Duplicate task id " + std::to_string(task.id));
        }
        ids.push_back(task.id);
    }

    if (free_space_bytes) {
        int64_t required = gate_ ? gate_->bytes_to_transfer(tasks) : required_bytes(tasks);
        if (required > 0 && static_cast<uint64_t>(required) > *free_space_bytes) {
            throw ConfigError("Not enough free space: " + format_bytes(required) +
                              " required, " +
                              format_bytes(static_cast<int64_t>(*free_space_bytes)) + " free");
        }
    }

    std::lock_guard<std::mutex> lock(control_mutex_);
    if (running_) {
        throw ConfigError("A transfer run is already in progress");
    }

    // The previous run's coordinator has already cleared running_
    if (coordinator_.joinable()) {
        coordinator_.join();
    }
    if (pool_) {
        pool_->shutdown();
    }

    pending_.assign(tasks.begin(), tasks.end());
    slots_ = std::make_unique<SlotPool>(static_cast<size_t>(concurrency));
    tracker_ = std::make_unique<CompletionTracker>(ids);
    cancel_requested_ = false;

    events_ = std::make_shared<EventChannel>();
    cancel_token_ = std::make_shared<CancellationToken>();
    pool_ = std::make_unique<ThreadPool>(static_cast<size_t>(concurrency),
                                         [this](size_t slot_index, std::exception_ptr error) {
        std::string slot = "Worker in slot " + std::to_string(slot_index);
        try {
            std::rethrow_exception(error);
        } catch (const std::exception& e) {
            log(slot + " failed: " + e.what());
        } catch (...) {
            log(slot + " failed with an unknown exception");
        }
    });

    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_ = SchedulerStats{};
        stats_.total_tasks = static_cast<int64_t>(tasks.size());
        stats_.pending = stats_.total_tasks;
        stats_.concurrency = concurrency;
        statuses_.clear();
        for (uint64_t id : ids) {
            statuses_[id] = TransferStatus::QUEUED;
        }
        start_time_ = std::chrono::steady_clock::now();
        timing_ = true;
    }

    running_ = true;
    coordinator_ = std::thread(&Scheduler::coordinator_loop, this);
}

void Scheduler::set_concurrency(int concurrency) {
    if (concurrency < MIN_CONCURRENCY || concurrency > MAX_CONCURRENCY) {
        throw ConfigError("Concurrency must be between " + std::to_string(MIN_CONCURRENCY) +
                          " and " + std::to_string(MAX_CONCURRENCY) + ", got " +
                          std::to_string(concurrency));
    }

    std::shared_ptr<EventChannel> channel;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (!running_) return;
        channel = events_;
    }

    TransferEvent event;
    event.type = EventType::RESIZE;
    event.value = concurrency;
    channel->post(std::move(event));
}

void Scheduler::cancel() {
    std::shared_ptr<CancellationToken> token;
    std::shared_ptr<EventChannel> channel;
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        if (!running_) return;
        token = cancel_token_;
        channel = events_;
    }

    token->cancel();
    TransferEvent event;
    event.type = EventType::CANCEL;
    channel->post(std::move(event));
}

void Scheduler::wait() {
    std::unique_lock<std::mutex> lock(control_mutex_);
    done_cv_.wait(lock, [this] { return !running_; });
}

bool Scheduler::is_running() const {
    std::lock_guard<std::mutex> lock(control_mutex_);
    return running_;
}

SchedulerStats Scheduler::get_stats() const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    SchedulerStats stats = stats_;
    if (timing_) {
        stats.elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time_).count();
    }
    return stats;
}

std::optional<TransferStatus> Scheduler::task_status(uint64_t task_id) const {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    auto it = statuses_.find(task_id);
    if (it == statuses_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void Scheduler::coordinator_loop() {
    log("Starting " + std::to_string(tracker_->total_count()) + " transfers with " +
        std::to_string(slots_->limit()) + " slots");

    if (!stopping()) {
        fill_free_slots();
    }

    while (!tracker_->is_complete()) {
        auto event = events_->wait_pop();
        if (!event) {
            break;
        }
        dispatch(*event);
    }

    events_->close();
    {
        std::lock_guard<std::mutex> stats_lock(stats_mutex_);
        stats_.elapsed_seconds = std::chrono::duration<double>(
            std::chrono::steady_clock::now() - start_time_).count();
        timing_ = false;
    }
    {
        std::lock_guard<std::mutex> lock(control_mutex_);
        running_ = false;
    }
    done_cv_.notify_all();
}

void Scheduler::dispatch(const TransferEvent& event) {
    switch (event.type) {
        case EventType::STARTED:
            set_status(event.task_id, TransferStatus::TRANSFERRING);
            break;

        case EventType::PROGRESS: {
            if (event.slot_index >= slots_->size()) break;
            const Slot& slot = slots_->at(event.slot_index);
            if (!slot.occupied() || slot.task->id != event.task_id) break;

            int64_t delta = event.bytes - slot.bytes_transferred;
            if (delta > 0) {
                std::lock_guard<std::mutex> lock(stats_mutex_);
                stats_.bytes_transferred += delta;
            }
            slots_->update_progress(event.slot_index, event.bytes, event.total);

            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callbacks_.on_progress) {
                callbacks_.on_progress(event.task_id, event.bytes, event.total,
                                       slot.task->display_name);
            }
            break;
        }

        case EventType::TERMINAL: {
            if (event.slot_index >= slots_->size() ||
                !slots_->at(event.slot_index).occupied() ||
                slots_->at(event.slot_index).task->id != event.task_id) {
                log("Ignoring result for task " + std::to_string(event.task_id) +
                    " not bound to slot " + std::to_string(event.slot_index));
                break;
            }
            TransferTask task = *slots_->at(event.slot_index).task;

            if (gate_ && !gate_->record(task, event.result)) {
                log("Failed to record cache state for " + task.destination_path);
            }

            TransferStatus outcome = event.result.success ? TransferStatus::COMPLETED
                                                          : event.result.status;
            if (!is_terminal(outcome) || outcome == TransferStatus::SKIPPED) {
                outcome = TransferStatus::FAILED;
            }
            finish_task(task, outcome, event.result.message);
            on_slot_freed(event.slot_index);
            break;
        }

        case EventType::LOG:
            log(event.message);
            break;

        case EventType::RESIZE:
            apply_resize(event.value);
            break;

        case EventType::CANCEL:
            cancel_pending();
            break;
    }
}

void Scheduler::fill_free_slots() {
    while (!pending_.empty()) {
        auto index = slots_->acquire_free();
        if (!index) break;
        if (!assign_next(*index)) break;
    }
}

void Scheduler::on_slot_freed(size_t slot_index) {
    bool reusable = slots_->release(slot_index);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.active = static_cast<int64_t>(slots_->occupied_count());
    }

    if (stopping()) {
        return;
    }
    // Retired slots still running count against a lowered limit
    if (reusable && slots_->has_capacity()) {
        assign_next(slot_index);
    }
    fill_free_slots();
}

// Pops tasks in FIFO order until one needs a transfer; cache hits are
// resolved here without a worker
bool Scheduler::assign_next(size_t slot_index) {
    while (!pending_.empty()) {
        TransferTask task = std::move(pending_.front());
        pending_.pop_front();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.pending = static_cast<int64_t>(pending_.size());
        }

        if (gate_ && gate_->should_skip(task)) {
            finish_task(task, TransferStatus::SKIPPED,
                        "Skipping " + task.display_name + ": already cached");
            continue;
        }

        launch(slot_index, task);
        return true;
    }
    return false;
}

void Scheduler::launch(size_t slot_index, const TransferTask& task) {
    slots_->bind(slot_index, task);
    set_status(task.id, TransferStatus::ASSIGNED);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.active = static_cast<int64_t>(slots_->occupied_count());
    }
    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callbacks_.on_task_started) {
            callbacks_.on_task_started(task.id, slot_index);
        }
    }

    auto token = cancel_token_;
    auto channel = events_;
    bool queued = pool_->submit(slot_index, [this, slot_index, task, token, channel]() {
        run_slot(slot_index, task, token, channel);
    });

    if (!queued) {
        TransferEvent event;
        event.type = EventType::TERMINAL;
        event.slot_index = slot_index;
        event.task_id = task.id;
        event.result = internal_failure(task, "worker pool is not running");
        channel->post(std::move(event));
    }
}

void Scheduler::finish_task(const TransferTask& task, TransferStatus outcome,
                            const std::string& message) {
    set_status(task.id, outcome);
    bool batch_done = tracker_->on_terminal(task.id, outcome);

    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        const BatchSummary& summary = tracker_->summary();
        stats_.completed = summary.completed;
        stats_.skipped = summary.skipped;
        stats_.failed = summary.failed;
        stats_.cancelled = summary.cancelled;
    }

    {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callbacks_.on_task_terminal) {
            callbacks_.on_task_terminal(task.id, outcome, message);
        }
    }

    if (batch_done) {
        const BatchSummary& summary = tracker_->summary();
        log("Batch finished: " + std::to_string(summary.completed) + " completed, " +
            std::to_string(summary.skipped) + " skipped, " +
            std::to_string(summary.failed) + " failed, " +
            std::to_string(summary.cancelled) + " cancelled");

        std::lock_guard<std::mutex> lock(callback_mutex_);
        if (callbacks_.on_batch_complete) {
            callbacks_.on_batch_complete(summary);
        }
    }
}

void Scheduler::cancel_pending() {
    if (cancel_requested_) return;
    cancel_requested_ = true;

    size_t dropped = pending_.size();
    while (!pending_.empty()) {
        TransferTask task = std::move(pending_.front());
        pending_.pop_front();
        {
            std::lock_guard<std::mutex> lock(stats_mutex_);
            stats_.pending = static_cast<int64_t>(pending_.size());
        }
        finish_task(task, TransferStatus::CANCELLED, "Cancelled " + task.display_name);
    }
    log("Cancellation requested, " + std::to_string(dropped) + " queued transfers dropped");
}

void Scheduler::apply_resize(int concurrency) {
    size_t limit = static_cast<size_t>(concurrency);
    if (limit == slots_->limit()) return;

    slots_->set_limit(limit);
    pool_->grow(limit);
    {
        std::lock_guard<std::mutex> lock(stats_mutex_);
        stats_.concurrency = concurrency;
    }
    log("Concurrency set to " + std::to_string(concurrency));

    if (!stopping()) {
        fill_free_slots();
    }
}

void Scheduler::run_slot(size_t slot_index, const TransferTask& task,
                         std::shared_ptr<CancellationToken> token,
                         std::shared_ptr<EventChannel> channel) {
    TransferEvent started;
    started.type = EventType::STARTED;
    started.slot_index = slot_index;
    started.task_id = task.id;
    channel->post(std::move(started));

    // A retry restarts from zero; hold progress at the highest value seen
    int64_t high_water = -1;
    ProgressCallback progress = [&](int64_t transferred, int64_t total) {
        if (transferred < high_water) return;
        high_water = transferred;

        TransferEvent event;
        event.type = EventType::PROGRESS;
        event.slot_index = slot_index;
        event.task_id = task.id;
        event.bytes = transferred;
        event.total = total;
        channel->post(std::move(event));
    };

    TransferResult result;
    std::unique_ptr<TransferWorker> worker;
    for (int attempt = 0;; ++attempt) {
        try {
            if (!worker) {
                worker = factory_();
            }
            if (!worker) {
                result = internal_failure(task, "no transfer worker available");
                break;
            }
            result = worker->run(task, *token, progress);
        } catch (const std::exception& e) {
            result = internal_failure(task, e.what());
        } catch (...) {
            result = internal_failure(task, "unknown exception");
        }

        if (result.success || token->is_cancelled() || attempt >= retry_attempts_ ||
            !is_retryable(result)) {
            break;
        }

        TransferEvent note;
        note.type = EventType::LOG;
        note.task_id = task.id;
        note.message = "Retrying " + task.display_name + " (attempt " +
                       std::to_string(attempt + 2) + " of " +
                       std::to_string(retry_attempts_ + 1) + "): " + result.message;
        channel->post(std::move(note));
    }

    TransferEvent done;
    done.type = EventType::TERMINAL;
    done.slot_index = slot_index;
    done.task_id = task.id;
    done.result = std::move(result);
    channel->post(std::move(done));
}

// The token flips before the CANCEL event arrives; a slot freed in between
// must not pick up queued work
bool Scheduler::stopping() const {
    return cancel_requested_ || cancel_token_->is_cancelled();
}

void Scheduler::set_status(uint64_t task_id, TransferStatus status) {
    std::lock_guard<std::mutex> lock(stats_mutex_);
    statuses_[task_id] = status;
}

void Scheduler::log(const std::string& message) {
    std::lock_guard<std::mutex> lock(callback_mutex_);
    if (callbacks_.on_log_message) {
        callbacks_.on_log_message(message);
    }
}

} // namespace demoloader
