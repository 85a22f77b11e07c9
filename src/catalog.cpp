/*
 * src/catalog.cpp - Catalog download and parsing
 * Copyright (c) 2026 Kirn Gill II
 * SPDX-License-Identifier: MIT
 * See LICENSE file for full license text.
 */

#include "demoloader/catalog.h"
#include "demoloader/downloader.h"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cctype>
#include <sstream>

// Category order in the document is the display order
using json = nlohmann::ordered_json;

namespace demoloader {

namespace {

std::string string_field(const json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_string()) {
        return "";
    }
    return it->get<std::string>();
}

double number_field(const json& item, const char* key) {
    auto it = item.find(key);
    if (it == item.end() || !it->is_number()) {
        return 0.0;
    }
    return it->get<double>();
}

std::string to_upper(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return value;
}

} // namespace

void Catalog::add_item(const CatalogItem& item) {
    auto it = items_.find(item.category);
    if (it == items_.end()) {
        categories_.push_back(item.category);
        it = items_.emplace(item.category, std::vector<CatalogItem>{}).first;
    }
    it->second.push_back(item);
}

const std::vector<CatalogItem>& Catalog::items_for(const std::string& category) const {
    static const std::vector<CatalogItem> empty;
    auto it = items_.find(category);
    return it == items_.end() ? empty : it->second;
}

size_t Catalog::item_count() const {
    size_t count = 0;
    for (const auto& entry : items_) {
        count += entry.second.size();
    }
    return count;
}

std::string capitalize_category(const std::string& key) {
    std::string name = key;
    for (size_t i = 0; i < name.size(); ++i) {
        unsigned char c = static_cast<unsigned char>(name[i]);
        name[i] = static_cast<char>(i == 0 ? std::toupper(c) : std::tolower(c));
    }
    return name;
}

std::string format_size_label(double size_gb, bool integral) {
    std::ostringstream oss;
    oss.precision(12);
    oss << size_gb;
    std::string value = oss.str();
    if (!integral && value.find_first_of(".e") == std::string::npos) {
        value += ".0";
    }
    return value + "GB";
}

CatalogResult parse_catalog(const std::string& json_text) {
    CatalogResult result{};
    result.success = false;

    json document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        result.error_message = "Catalog is not valid JSON";
        return result;
    }
    if (!document.is_object()) {
        result.error_message = "Catalog root must be an object of categories";
        return result;
    }

    for (auto it = document.begin(); it != document.end(); ++it) {
        if (!it.value().is_array()) {
            result.error_message = "Category '" + it.key() + "' is not a list";
            return result;
        }

        std::string category = capitalize_category(it.key());
        for (const auto& entry : it.value()) {
            if (!entry.is_object()) {
                continue;
            }
            CatalogItem item;
            item.category = category;
            item.title = string_field(entry, "title");
            item.duration = string_field(entry, "duration");
            item.filetype = to_upper(string_field(entry, "filetype"));
            item.size_gb = number_field(entry, "size_gb");
            auto size_it = entry.find("size_gb");
            bool integral = size_it == entry.end() || size_it->is_number_integer();
            item.size = format_size_label(item.size_gb, integral);
            item.url = string_field(entry, "url");
            result.catalog.add_item(item);
        }
    }

    result.success = true;
    return result;
}

CatalogResult fetch_catalog(const std::string& url, const std::string& user_agent) {
    TransferConfig config;
    config.user_agent = user_agent;

    Downloader downloader(config);
    FetchResult fetched = downloader.fetch(url);
    if (!fetched.success) {
        CatalogResult result{};
        result.success = false;
        result.error_message = "Error fetching catalog: " + fetched.error_message;
        return result;
    }

    return parse_catalog(std::string(fetched.data.begin(), fetched.data.end()));
}

} // namespace demoloader
