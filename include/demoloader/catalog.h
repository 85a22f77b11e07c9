/*
 * catalog.h - Remote content catalog (category -> selectable items)
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include "demoloader/common.h"

namespace demoloader {

struct CatalogItem {
    std::string category;   // Capitalized category key, e.g. "Movies"
    std::string title;
    std::string duration;
    std::string filetype;   // Upper-cased, e.g. "MP4"
    std::string size;       // Display label, e.g. "1.5GB"
    double size_gb = 0.0;
    std::string url;        // Path relative to the CDN base
};

class Catalog {
public:
    void add_item(const CatalogItem& item);

    // Category names in the order they first appeared
    const std::vector<std::string>& categories() const { return categories_; }
    const std::vector<CatalogItem>& items_for(const std::string& category) const;
    size_t item_count() const;
    bool empty() const { return categories_.empty(); }

private:
    std::vector<std::string> categories_;
    std::map<std::string, std::vector<CatalogItem>> items_;
};

struct CatalogResult {
    bool success;
    std::string error_message;
    Catalog catalog;
};

// Parse the catalog JSON document:
// { "<category>": [ { "title", "duration", "filetype", "size_gb", "url" }, ... ], ... }
CatalogResult parse_catalog(const std::string& json_text);

// Download and parse. Callers must not schedule anything when this fails.
CatalogResult fetch_catalog(const std::string& url, const std::string& user_agent = USER_AGENT);

// "Movies" from "movies"
std::string capitalize_category(const std::string& key);

// size_gb followed by "GB": "1.5GB", "2.0GB", or "2GB" when the catalog
// stored an integer
std::string format_size_label(double size_gb, bool integral = false);

} // namespace demoloader
