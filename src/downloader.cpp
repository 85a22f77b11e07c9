/*
 * src/downloader.cpp - libcurl transfer worker
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/downloader.h"
#include <curl/curl.h>
#include <algorithm>
#include <cctype>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace demoloader {

// Static members for global init
std::once_flag CurlGlobalInit::init_flag_;
std::unique_ptr<CurlGlobalInit> CurlGlobalInit::instance_;

CurlGlobalInit::CurlGlobalInit() {
    if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
        throw std::runtime_error("Failed to initialize libcurl");
    }
}

CurlGlobalInit::~CurlGlobalInit() {
    curl_global_cleanup();
}

CurlGlobalInit& CurlGlobalInit::instance() {
    std::call_once(init_flag_, []() {
        instance_ = std::unique_ptr<CurlGlobalInit>(new CurlGlobalInit());
    });
    return *instance_;
}

namespace {

// Write callback for memory downloads
size_t memory_write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t real_size = size * nmemb;
    auto* buffer = static_cast<std::vector<char>*>(userp);
    buffer->insert(buffer->end(),
                   static_cast<char*>(contents),
                   static_cast<char*>(contents) + real_size);
    return real_size;
}

struct HeaderData {
    int64_t content_length = -1;
};

bool starts_with_nocase(const std::string& s, const char* prefix) {
    size_t n = std::char_traits<char>::length(prefix);
    if (s.size() < n) return false;
    for (size_t i = 0; i < n; ++i) {
        if (std::tolower(static_cast<unsigned char>(s[i])) !=
            std::tolower(static_cast<unsigned char>(prefix[i]))) {
            return false;
        }
    }
    return true;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    size_t real_size = size * nitems;
    auto* header_data = static_cast<HeaderData*>(userdata);

    std::string header(buffer, real_size);

    // Every redirect hop starts with a new status line
    if (starts_with_nocase(header, "HTTP/")) {
        header_data->content_length = -1;
        return real_size;
    }

    if (starts_with_nocase(header, "Content-Length:")) {
        std::string value = header.substr(header.find(':') + 1);
        size_t start = value.find_first_not_of(" \t\r\n");
        size_t end = value.find_last_not_of(" \t\r\n");
        if (start != std::string::npos && end != std::string::npos) {
            try {
                header_data->content_length = std::stoll(value.substr(start, end - start + 1));
            } catch (const std::exception&) {
                header_data->content_length = -1;
            }
        }
    }

    return real_size;
}

// State shared with the streaming write callback
struct StreamState {
    std::ofstream* file;
    const CancellationToken* cancel;
    const ProgressCallback* progress_cb;
    HeaderData headers;
    bool decided = false;       // Streaming mode chosen on the first body bytes
    bool streaming = false;
    int64_t declared = -1;
    int64_t downloaded = 0;
    std::vector<char> buffer;   // Body when no Content-Length was declared
    bool io_error = false;
    bool size_mismatch = false;
};

size_t stream_write_callback(void* contents, size_t size, size_t nmemb, void* userp) {
    size_t real_size = size * nmemb;
    auto* state = static_cast<StreamState*>(userp);

    if (state->cancel->is_cancelled()) {
        return 0;  // Abort transfer
    }

    if (!state->decided) {
        state->decided = true;
        state->declared = state->headers.content_length;
        state->streaming = state->declared >= 0;
    }

    const char* data = static_cast<const char*>(contents);

    if (!state->streaming) {
        state->buffer.insert(state->buffer.end(), data, data + real_size);
        return real_size;
    }

    size_t offset = 0;
    while (offset < real_size) {
        if (state->cancel->is_cancelled()) {
            return 0;
        }

        size_t chunk = std::min(TRANSFER_CHUNK_SIZE, real_size - offset);
        if (state->downloaded + static_cast<int64_t>(chunk) > state->declared) {
            state->size_mismatch = true;
            return 0;
        }

        state->file->write(data + offset, static_cast<std::streamsize>(chunk));
        if (!state->file->good()) {
            state->io_error = true;
            return 0;  // Write error
        }

        state->downloaded += static_cast<int64_t>(chunk);
        offset += chunk;

        if (*state->progress_cb) {
            (*state->progress_cb)(state->downloaded, state->declared);
        }
    }

    return real_size;
}

// Progress callback for cancellation
int xferinfo_callback(void* clientp, curl_off_t /*dltotal*/, curl_off_t /*dlnow*/,
                      curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* cancel = static_cast<const CancellationToken*>(clientp);
    return (cancel && cancel->is_cancelled()) ? 1 : 0;  // Return non-zero to abort
}

bool is_http_url(const std::string& url) {
    return starts_with_nocase(url, "http://") || starts_with_nocase(url, "https://");
}

TransferResult make_failure(const TransferTask& task, ErrorKind kind, const std::string& detail) {
    TransferResult result;
    result.success = false;
    result.status = kind == ErrorKind::CANCELLED ? TransferStatus::CANCELLED : TransferStatus::FAILED;
    result.error = ErrorInfo{kind, detail};
    result.message = kind == ErrorKind::CANCELLED
        ? "Cancelled downloading " + task.display_name
        : "Error downloading " + task.display_name + ": " + detail;
    return result;
}

} // namespace

Downloader::Downloader() : Downloader(TransferConfig{}) {
}

Downloader::Downloader(const TransferConfig& config) : config_(config) {
    CurlGlobalInit::instance();  // Ensure global init
    init_curl();
}

Downloader::~Downloader() {
    cleanup_curl();
}

void Downloader::init_curl() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!curl_) {
        curl_ = curl_easy_init();
        if (!curl_) {
            throw std::runtime_error("Failed to initialize CURL handle");
        }
    }
}

void Downloader::cleanup_curl() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (curl_) {
        curl_easy_cleanup(static_cast<CURL*>(curl_));
        curl_ = nullptr;
    }
}

void Downloader::setup_common_options(CURL* curl, const std::string& url,
                                      const CancellationToken* cancel) {
    curl_easy_reset(curl);

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());

    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);

    // SSL options
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYPEER, 1L);
    curl_easy_setopt(curl, CURLOPT_SSL_VERIFYHOST, 2L);

    // Stall detection instead of a whole-transfer timeout
    curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT, static_cast<long>(config_.connect_timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, config_.low_speed_limit_bps);
    curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(config_.low_speed_time_seconds));

    // Progress/cancellation support
    curl_easy_setopt(curl, CURLOPT_NOPROGRESS, 0L);
    curl_easy_setopt(curl, CURLOPT_XFERINFOFUNCTION, xferinfo_callback);
    curl_easy_setopt(curl, CURLOPT_XFERINFODATA, cancel);

    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

    // Enable TCP keepalive
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPALIVE, 1L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPIDLE, 120L);
    curl_easy_setopt(curl, CURLOPT_TCP_KEEPINTVL, 60L);
}

TransferResult Downloader::run(const TransferTask& task,
                               const CancellationToken& cancel,
                               const ProgressCallback& progress_cb) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto started = std::chrono::steady_clock::now();

    if (!curl_) {
        return make_failure(task, ErrorKind::INTERNAL, "CURL not initialized");
    }
    if (cancel.is_cancelled()) {
        return make_failure(task, ErrorKind::CANCELLED, "Download cancelled");
    }

    fs::path filepath(task.destination_path);
    std::error_code ec;
    if (filepath.has_parent_path()) {
        fs::create_directories(filepath.parent_path(), ec);
        if (ec) {
            return make_failure(task, ErrorKind::IO, "Failed to create directory " +
                                filepath.parent_path().string() + ": " + ec.message());
        }
    }

    std::ofstream file(filepath, std::ios::binary | std::ios::trunc);
    if (!file) {
        return make_failure(task, ErrorKind::IO, "Failed to open file for writing: " + filepath.string());
    }

    StreamState state{};
    state.file = &file;
    state.cancel = &cancel;
    state.progress_cb = &progress_cb;

    CURL* curl = static_cast<CURL*>(curl_);
    setup_common_options(curl, task.source_url, &cancel);

    curl_easy_setopt(curl, CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl, CURLOPT_BUFFERSIZE, static_cast<long>(TRANSFER_CHUNK_SIZE));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &state);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &state.headers);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);

    if (!state.decided) {
        // Empty body: the headers alone decide the mode
        state.declared = state.headers.content_length;
        state.streaming = state.declared >= 0;
    }

    // Content-length fallback: one write, one progress jump to 100%
    if (res == CURLE_OK && !state.streaming) {
        file.write(state.buffer.data(), static_cast<std::streamsize>(state.buffer.size()));
        if (!file.good()) {
            state.io_error = true;
        } else {
            state.downloaded = static_cast<int64_t>(state.buffer.size());
            if (progress_cb) {
                progress_cb(state.downloaded, state.downloaded);
            }
        }
    } else if (res == CURLE_OK && state.declared == 0 && progress_cb) {
        progress_cb(0, 0);
    }

    file.close();
    if (file.fail()) {
        state.io_error = true;
    }

    TransferResult result;
    if (cancel.is_cancelled() && res != CURLE_OK) {
        result = make_failure(task, ErrorKind::CANCELLED, "Download cancelled");
        fs::remove(filepath, ec);
    } else if (state.io_error) {
        result = make_failure(task, ErrorKind::IO, "Failed to write " + filepath.string());
    } else if (state.size_mismatch || res == CURLE_PARTIAL_FILE) {
        result = make_failure(task, ErrorKind::SIZE_MISMATCH,
                              "Expected " + std::to_string(state.declared) + " bytes, received " +
                              std::to_string(state.downloaded));
    } else if (res == CURLE_HTTP_RETURNED_ERROR) {
        result = make_failure(task, ErrorKind::NETWORK, "HTTP error: " + std::to_string(http_code));
    } else if (res != CURLE_OK) {
        result = make_failure(task, ErrorKind::NETWORK, curl_easy_strerror(res));
    } else if (is_http_url(task.source_url) && (http_code < 200 || http_code >= 300)) {
        result = make_failure(task, ErrorKind::NETWORK, "HTTP error: " + std::to_string(http_code));
    } else if (state.declared >= 0 && state.downloaded != state.declared) {
        result = make_failure(task, ErrorKind::SIZE_MISMATCH,
                              "Expected " + std::to_string(state.declared) + " bytes, received " +
                              std::to_string(state.downloaded));
    } else {
        result.success = true;
        result.status = TransferStatus::COMPLETED;
        result.message = "Finished downloading " + task.display_name;
    }

    result.http_code = static_cast<int>(http_code);
    result.bytes_transferred = state.downloaded;
    result.expected_length = state.declared;
    result.transfer_time_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    return result;
}

FetchResult Downloader::fetch(const std::string& url, int timeout_seconds) {
    std::lock_guard<std::mutex> lock(mutex_);

    FetchResult result{};
    result.success = false;

    if (!curl_) {
        result.error_message = "CURL not initialized";
        return result;
    }

    CURL* curl = static_cast<CURL*>(curl_);
    setup_common_options(curl, url, nullptr);

    curl_easy_setopt(curl, CURLOPT_TIMEOUT, static_cast<long>(timeout_seconds));
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, memory_write_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &result.data);

    CURLcode res = curl_easy_perform(curl);

    long http_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &http_code);
    result.http_code = static_cast<int>(http_code);

    if (res != CURLE_OK) {
        result.error_message = curl_easy_strerror(res);
    } else if (is_http_url(url)) {
        result.success = (http_code >= 200 && http_code < 300);
        if (!result.success) {
            result.error_message = "HTTP error: " + std::to_string(http_code);
        }
    } else {
        result.success = true;
    }

    return result;
}

WorkerFactory make_downloader_factory(const TransferConfig& config) {
    return [config]() -> std::unique_ptr<TransferWorker> {
        return std::make_unique<Downloader>(config);
    };
}

} // namespace demoloader
