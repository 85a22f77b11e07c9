/*
 * task_builder.h - Turns selected catalog items into transfer tasks
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <vector>
#include "demoloader/catalog.h"
#include "demoloader/common.h"

namespace demoloader {

// Ids start at 1 and follow selection order.
// source_url       = <cdn_base>/<item.url>
// destination_path = <cache_root>/<category>/<title>.<ext>
std::vector<TransferTask> build_tasks(const std::vector<CatalogItem>& items,
                                      const std::string& cdn_base,
                                      const std::string& cache_root);

// Joins base and relative path with exactly one '/'
std::string join_url(const std::string& base, const std::string& path);

// Lower-cased file type, "mp4" when the catalog has none
std::string file_extension_for(const CatalogItem& item);

// Strip control characters and path separators
std::string safe_file_name(const std::string& name);

// Sum of catalog size estimates
int64_t required_bytes(const std::vector<TransferTask>& tasks);

// size_gb expressed in bytes (GB = 2^30)
int64_t gb_to_bytes(double size_gb);

} // namespace demoloader
