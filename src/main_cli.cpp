/*
 * src/main_cli.cpp - Main entry point for the CLI application
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include <iostream>
#include <string>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iomanip>
#include <mutex>
#include <memory>
#include <sstream>
#include <unordered_map>
#include <getopt.h>

#include "demoloader/common.h"
#include "demoloader/cache_gate.h"
#include "demoloader/cache_index.h"
#include "demoloader/catalog.h"
#include "demoloader/config.h"
#include "demoloader/downloader.h"
#include "demoloader/progress.h"
#include "demoloader/scheduler.h"
#include "demoloader/storage.h"
#include "demoloader/task_builder.h"

using namespace demoloader;

static std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_interrupted = true;
    }
}

void print_usage(const char* program) {
    std::cout << "Usage: " << program << " [OPTIONS]\n\n";
    std::cout << "Options:\n";
    std::cout << "  -o, --output DIR       Destination root, e.g. a USB mount (default: .)\n";
    std::cout << "  -c, --concurrent N     Simultaneous transfers, 1-15 (default: 3)\n";
    std::cout << "  -n, --no-cache         Re-download everything; clears the cache directory\n";
    std::cout << "  -r, --retries N        Extra attempts after a network failure, 0-10 (default: 0)\n";
    std::cout << "  -u, --catalog URL      Catalog JSON location\n";
    std::cout << "  -b, --cdn URL          CDN base for item paths (default: " << DEFAULT_CDN_BASE << ")\n";
    std::cout << "  -C, --categories LIST  Comma-separated categories to download (default: all)\n";
    std::cout << "  -l, --list             Print the catalog and exit\n";
    std::cout << "  -L, --list-drives      Print removable drives and exit\n";
    std::cout << "  -y, --yes              Do not ask for confirmation\n";
    std::cout << "  -h, --help             Show this help message\n";
    std::cout << "\nExamples:\n";
    std::cout << "  " << program << " -L\n";
    std::cout << "  " << program << " -o /media/usb -C movies,trailers -c 5\n";
}

static bool parse_int(const char* text, int& out) {
    try {
        size_t used = 0;
        out = std::stoi(text, &used);
        return used == std::string(text).size();
    } catch (const std::exception&) {
        return false;
    }
}

static std::vector<std::string> split_list(const std::string& text) {
    std::vector<std::string> parts;
    std::stringstream ss(text);
    std::string part;
    while (std::getline(ss, part, ',')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

static void print_catalog(const Catalog& catalog) {
    for (const auto& category : catalog.categories()) {
        std::cout << category << ":\n";
        for (const auto& item : catalog.items_for(category)) {
            std::cout << "  " << std::left << std::setw(48) << item.title
                      << std::setw(10) << item.duration
                      << std::setw(6) << item.filetype
                      << item.size << "\n";
        }
    }
}

// Null when the index cannot be opened; the run goes on without it
static std::unique_ptr<CacheIndex> open_cache_index(const TransferConfig& config) {
    try {
        auto index = std::make_unique<CacheIndex>(cache_index_path(config));
        if (index->initialize()) {
            return index;
        }
        std::cerr << "[!] Cache index unavailable: " << index->get_last_error() << "\n";
    } catch (const std::runtime_error& e) {
        std::cerr << "[!] Cache index unavailable: " << e.what() << "\n";
    }
    return nullptr;
}

int main(int argc, char** argv) {
    TransferConfig config;
    std::string categories_arg;
    bool list_catalog = false;
    bool list_drives = false;
    bool assume_yes = false;

    static struct option long_options[] = {
        {"output", required_argument, nullptr, 'o'},
        {"concurrent", required_argument, nullptr, 'c'},
        {"no-cache", no_argument, nullptr, 'n'},
        {"retries", required_argument, nullptr, 'r'},
        {"catalog", required_argument, nullptr, 'u'},
        {"cdn", required_argument, nullptr, 'b'},
        {"categories", required_argument, nullptr, 'C'},
        {"list", no_argument, nullptr, 'l'},
        {"list-drives", no_argument, nullptr, 'L'},
        {"yes", no_argument, nullptr, 'y'},
        {"help", no_argument, nullptr, 'h'},
        {nullptr, 0, nullptr, 0}
    };

    int opt;
    while ((opt = getopt_long(argc, argv, "o:c:nr:u:b:C:lLyh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 'o':
                config.destination_root = optarg;
                break;
            case 'c':
                if (!parse_int(optarg, config.concurrency)) {
                    std::cerr << "Error: --concurrent expects a number\n";
                    return 1;
                }
                break;
            case 'n':
                config.use_cache = false;
                break;
            case 'r':
                if (!parse_int(optarg, config.retry_attempts)) {
                    std::cerr << "Error: --retries expects a number\n";
                    return 1;
                }
                break;
            case 'u':
                config.catalog_url = optarg;
                break;
            case 'b':
                config.cdn_base = optarg;
                break;
            case 'C':
                categories_arg = optarg;
                break;
            case 'l':
                list_catalog = true;
                break;
            case 'L':
                list_drives = true;
                break;
            case 'y':
                assume_yes = true;
                break;
            case 'h':
                print_usage(argv[0]);
                return 0;
            default:
                print_usage(argv[0]);
                return 1;
        }
    }

    if (list_drives) {
        auto drives = list_removable_drives();
        if (drives.empty()) {
            std::cout << "No removable drives found\n";
        }
        for (const auto& drive : drives) {
            std::cout << format_drive_label(drive) << "\n";
        }
        return 0;
    }

    try {
        validate_config(config);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cout << "=== Demo Loader ===\n";
    std::cout << "Catalog: " << config.catalog_url << "\n";
    std::cout << "Output: " << config.destination_root << "\n";
    std::cout << "Concurrent: " << config.concurrency << "\n";
    std::cout << "Cache: " << (config.use_cache ? "on" : "off") << "\n\n";

    std::cout << "[*] Fetching catalog...\n";
    CatalogResult catalog = fetch_catalog(config.catalog_url, config.user_agent);
    if (!catalog.success) {
        std::cerr << "[!] " << catalog.error_message << "\n";
        return 1;
    }
    std::cout << "[+] " << catalog.catalog.item_count() << " items in "
              << catalog.catalog.categories().size() << " categories\n";

    if (list_catalog) {
        print_catalog(catalog.catalog);
        return 0;
    }

    // Category selection
    std::vector<std::string> selected;
    if (categories_arg.empty()) {
        selected = catalog.catalog.categories();
    } else {
        for (const auto& name : split_list(categories_arg)) {
            std::string category = capitalize_category(name);
            if (catalog.catalog.items_for(category).empty()) {
                std::cerr << "[!] Unknown or empty category: " << name << "\n";
                return 1;
            }
            selected.push_back(category);
        }
    }

    std::vector<CatalogItem> items;
    for (const auto& category : selected) {
        const auto& category_items = catalog.catalog.items_for(category);
        items.insert(items.end(), category_items.begin(), category_items.end());
    }
    if (items.empty()) {
        std::cerr << "[!] Nothing selected\n";
        return 1;
    }

    std::string root = cache_root(config);
    std::vector<TransferTask> tasks = build_tasks(items, config.cdn_base, root);

    // The index lives under the cache root, which is wiped when caching is
    // off, so it is opened up front only when it can decide skips
    std::unique_ptr<CacheIndex> index;
    if (config.use_cache) {
        index = open_cache_index(config);
    }
    CacheGate gate(root, config.use_cache, index.get());

    // Capacity check; cached items already take their space
    auto space = query_free_space(config.destination_root);
    if (!space) {
        std::cerr << "[!] Cannot query free space on " << config.destination_root << "\n";
        return 1;
    }
    int64_t required = gate.bytes_to_transfer(tasks);
    std::cout << format_capacity_summary(required, space->free_bytes) << "\n";
    if (!check_capacity(required, space->free_bytes)) {
        std::cerr << "[!] " << capacity_warning() << "\n";
        return 1;
    }

    if (!assume_yes) {
        std::cout << "Download " << tasks.size() << " items? [y/N] " << std::flush;
        std::string answer;
        if (!std::getline(std::cin, answer) || (answer != "y" && answer != "Y")) {
            std::cout << "Aborted\n";
            return 0;
        }
    }

    std::string error;
    if (!prepare_cache_root(root, selected, !config.use_cache, error)) {
        std::cerr << "[!] " << error << "\n";
        return 1;
    }
    if (!config.use_cache) {
        index = open_cache_index(config);
        gate = CacheGate(root, config.use_cache, index.get());
    }

    // Set up signal handling
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    Scheduler scheduler(make_downloader_factory(config), &gate, config.retry_attempts);

    std::mutex output_mutex;
    std::unordered_map<uint64_t, std::chrono::steady_clock::time_point> last_progress;

    SchedulerCallbacks callbacks;
    callbacks.on_task_started = [&output_mutex](uint64_t task_id, size_t slot_index) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "[*] Slot " << slot_index + 1 << ": task " << task_id << "\n";
    };

    // Print each transfer at most once a second, plus its final chunk
    callbacks.on_progress = [&output_mutex, &last_progress](uint64_t task_id, int64_t transferred,
                                                            int64_t total, const std::string& name) {
        auto now = std::chrono::steady_clock::now();
        std::lock_guard<std::mutex> lock(output_mutex);
        auto it = last_progress.find(task_id);
        bool finished = total >= 0 && transferred >= total;
        if (!finished && it != last_progress.end() && now - it->second < std::chrono::seconds(1)) {
            return;
        }
        last_progress[task_id] = now;
        std::cout << "    " << format_progress_label(name, transferred, total) << "\n";
    };

    callbacks.on_task_terminal = [&output_mutex](uint64_t, TransferStatus outcome,
                                                 const std::string& message) {
        std::lock_guard<std::mutex> lock(output_mutex);
        if (outcome == TransferStatus::FAILED) {
            std::cerr << "[!] " << message << "\n";
        } else {
            std::cout << "[+] " << message << "\n";
        }
    };

    callbacks.on_batch_complete = [&output_mutex](const BatchSummary&) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "\n[+] All downloads finished!\n";
    };

    callbacks.on_log_message = [&output_mutex](const std::string& message) {
        std::lock_guard<std::mutex> lock(output_mutex);
        std::cout << "[*] " << message << "\n";
    };

    scheduler.set_callbacks(callbacks);

    try {
        scheduler.start(tasks, config.concurrency, space->free_bytes);
    } catch (const ConfigError& e) {
        std::cerr << "[!] " << e.what() << "\n";
        return 1;
    }

    // Main loop - watch for interrupts and print stats periodically
    bool cancel_sent = false;
    auto last_print = std::chrono::steady_clock::now();

    while (scheduler.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));

        if (g_interrupted && !cancel_sent) {
            {
                std::lock_guard<std::mutex> lock(output_mutex);
                std::cout << "\n[!] Interrupt received, cancelling transfers...\n";
            }
            scheduler.cancel();
            cancel_sent = true;
        }

        auto now = std::chrono::steady_clock::now();
        if (std::chrono::duration_cast<std::chrono::seconds>(now - last_print).count() >= 5) {
            SchedulerStats stats = scheduler.get_stats();
            int64_t done = stats.completed + stats.skipped + stats.failed + stats.cancelled;

            std::lock_guard<std::mutex> lock(output_mutex);
            std::cout << "[Stats] "
                      << "Done: " << done << "/" << stats.total_tasks << " | "
                      << "Active: " << stats.active << " | "
                      << "Pending: " << stats.pending << " | "
                      << "Failed: " << stats.failed << " | "
                      << "Downloaded: " << format_bytes(stats.bytes_transferred) << "\n";
            last_print = now;
        }
    }
    scheduler.wait();

    // Final stats
    SchedulerStats final_stats = scheduler.get_stats();
    std::cout << "\n=== Final Statistics ===\n";
    std::cout << "Completed: " << final_stats.completed << "\n";
    std::cout << "Skipped (cached): " << final_stats.skipped << "\n";
    std::cout << "Failed: " << final_stats.failed << "\n";
    std::cout << "Cancelled: " << final_stats.cancelled << "\n";
    std::cout << "Total downloaded: " << format_bytes(final_stats.bytes_transferred) << "\n";
    std::cout << "Elapsed: " << std::fixed << std::setprecision(1)
              << final_stats.elapsed_seconds << " s\n";

    return (final_stats.failed > 0 || final_stats.cancelled > 0) ? 1 : 0;
}
