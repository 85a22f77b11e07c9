/*
 * downloader.h - libcurl implementation of TransferWorker
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include "demoloader/common.h"
#include "demoloader/config.h"
#include "demoloader/transfer_worker.h"

typedef void CURL;

namespace demoloader {

// Result of an in-memory fetch (catalog download)
struct FetchResult {
    bool success;
    int http_code;
    std::string error_message;
    std::vector<char> data;
};

class Downloader : public TransferWorker {
public:
    Downloader();
    explicit Downloader(const TransferConfig& config);
    ~Downloader() override;

    // Non-copyable
    Downloader(const Downloader&) = delete;
    Downloader& operator=(const Downloader&) = delete;

    // Stream the task body to disk.
    // With a declared Content-Length the body is written in TRANSFER_CHUNK_SIZE
    // pieces with a progress callback after each one. Without it the body is
    // buffered and written once, followed by a single progress callback.
    TransferResult run(const TransferTask& task,
                       const CancellationToken& cancel,
                       const ProgressCallback& progress_cb) override;

    // Download to memory
    FetchResult fetch(const std::string& url, int timeout_seconds = CATALOG_TIMEOUT_SECONDS);

private:
    void init_curl();
    void cleanup_curl();
    void setup_common_options(CURL* curl, const std::string& url, const CancellationToken* cancel);

    CURL* curl_ = nullptr;
    TransferConfig config_;
    mutable std::mutex mutex_;
};

// RAII wrapper for CURL global init
class CurlGlobalInit {
public:
    CurlGlobalInit();
    ~CurlGlobalInit();
    static CurlGlobalInit& instance();
private:
    static std::once_flag init_flag_;
    static std::unique_ptr<CurlGlobalInit> instance_;
};

// Worker factory producing libcurl workers that share one configuration
WorkerFactory make_downloader_factory(const TransferConfig& config);

} // namespace demoloader
