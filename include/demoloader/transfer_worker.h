/*
 * transfer_worker.h - Interface for a single streamed source-to-disk copy
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include "demoloader/common.h"

namespace demoloader {

// Outcome of one transfer. Workers report failures here instead of throwing.
struct TransferResult {
    bool success = false;
    TransferStatus status = TransferStatus::FAILED;   // COMPLETED, FAILED or CANCELLED
    int http_code = 0;
    std::optional<ErrorInfo> error;
    int64_t bytes_transferred = 0;
    int64_t expected_length = -1;    // Content-Length from the server (-1 if not declared)
    std::string message;             // Human-readable terminal message
    int64_t transfer_time_ms = 0;
};

// Cooperative cancellation flag shared by the scheduler and its workers.
// Workers check it between chunks.
class CancellationToken {
public:
    void cancel() { cancelled_.store(true); }
    bool is_cancelled() const { return cancelled_.load(); }

private:
    std::atomic<bool> cancelled_{false};
};

// Progress callback signature: (bytes transferred so far, total bytes)
using ProgressCallback = std::function<void(int64_t transferred, int64_t total)>;

class TransferWorker {
public:
    virtual ~TransferWorker() = default;

    // Copy task.source_url to task.destination_path.
    // Must not throw: every failure becomes a non-success TransferResult.
    virtual TransferResult run(const TransferTask& task,
                               const CancellationToken& cancel,
                               const ProgressCallback& progress_cb) = 0;
};

using WorkerFactory = std::function<std::unique_ptr<TransferWorker>()>;

} // namespace demoloader
