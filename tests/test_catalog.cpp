#include "demoloader/catalog.h"
#include "demoloader/config.h"
#include "demoloader/storage.h"
#include "demoloader/task_builder.h"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace demoloader;
namespace fs = std::filesystem;

static const char* SAMPLE_CATALOG = R"({
    "trailers": [
        {"title": "Sintel", "duration": "0:52", "filetype": "mp4", "size_gb": 0.25, "url": "trailers/sintel.mp4"}
    ],
    "movies": [
        {"title": "Big Buck Bunny", "duration": "9:56", "filetype": "mkv", "size_gb": 1.5, "url": "/movies/bbb.mkv"},
        {"title": "Tears of Steel", "duration": "12:14", "filetype": "", "size_gb": 2, "url": "movies/tos"},
        {"title": "Elephants Dream", "duration": "10:54", "filetype": "MP4", "size_gb": 2.0, "url": "movies/ed.mp4"}
    ]
})";

void test_parse_catalog() {
    CatalogResult result = parse_catalog(SAMPLE_CATALOG);
    assert(result.success);
    assert(result.error_message.empty());

    const Catalog& catalog = result.catalog;
    // Document order, capitalized
    assert(catalog.categories().size() == 2);
    assert(catalog.categories()[0] == "Trailers");
    assert(catalog.categories()[1] == "Movies");
    assert(catalog.item_count() == 4);

    const auto& movies = catalog.items_for("Movies");
    assert(movies.size() == 3);
    assert(movies[0].title == "Big Buck Bunny");
    assert(movies[0].category == "Movies");
    assert(movies[0].duration == "9:56");
    assert(movies[0].filetype == "MKV");
    assert(movies[0].size == "1.5GB");
    assert(movies[1].size == "2GB");
    assert(movies[2].size == "2.0GB");

    assert(catalog.items_for("Music").empty());

    std::cout << "test_parse_catalog passed!" << std::endl;
}

void test_parse_catalog_errors() {
    CatalogResult bad = parse_catalog("{ not json");
    assert(!bad.success);
    assert(!bad.error_message.empty());
    assert(bad.catalog.empty());

    CatalogResult array_root = parse_catalog("[1, 2, 3]");
    assert(!array_root.success);

    CatalogResult bad_category = parse_catalog(R"({"movies": {"title": "x"}})");
    assert(!bad_category.success);

    // Missing fields fall back to defaults
    CatalogResult sparse = parse_catalog(R"({"MUSIC": [{"title": "Song"}]})");
    assert(sparse.success);
    const auto& music = sparse.catalog.items_for("Music");
    assert(music.size() == 1);
    assert(music[0].duration.empty());
    assert(music[0].filetype.empty());
    assert(music[0].size_gb == 0.0);
    assert(music[0].size == "0GB");

    std::cout << "test_parse_catalog_errors passed!" << std::endl;
}

void test_build_tasks() {
    CatalogResult result = parse_catalog(SAMPLE_CATALOG);
    assert(result.success);

    std::vector<CatalogItem> items = result.catalog.items_for("Movies");
    items.push_back(result.catalog.items_for("Trailers")[0]);

    std::vector<TransferTask> tasks = build_tasks(items, "https://cdn.example/", "/media/usb/cache");
    assert(tasks.size() == 4);

    // Sequential ids in selection order
    for (size_t i = 0; i < tasks.size(); ++i) {
        assert(tasks[i].id == i + 1);
        assert(!tasks[i].expected_size_bytes.has_value());
    }

    assert(tasks[0].source_url == "https://cdn.example/movies/bbb.mkv");
    assert(tasks[0].destination_path == "/media/usb/cache/Movies/Big Buck Bunny.mkv");
    assert(tasks[0].display_name == "Big Buck Bunny");
    assert(tasks[0].category == "Movies");
    assert(tasks[0].estimated_size_bytes == BYTES_PER_GB + BYTES_PER_GB / 2);

    // No file type: mp4
    assert(tasks[1].destination_path == "/media/usb/cache/Movies/Tears of Steel.mp4");
    assert(tasks[2].destination_path == "/media/usb/cache/Movies/Elephants Dream.mp4");
    assert(tasks[3].destination_path == "/media/usb/cache/Trailers/Sintel.mp4");
    assert(tasks[3].source_url == "https://cdn.example/trailers/sintel.mp4");

    assert(required_bytes(tasks) == gb_to_bytes(1.5) + gb_to_bytes(2) + gb_to_bytes(2.0) +
                                    gb_to_bytes(0.25));

    std::cout << "test_build_tasks passed!" << std::endl;
}

void test_url_and_names() {
    assert(join_url("https://cdn.skyy.cc", "a/b.mp4") == "https://cdn.skyy.cc/a/b.mp4");
    assert(join_url("https://cdn.skyy.cc/", "/a/b.mp4") == "https://cdn.skyy.cc/a/b.mp4");

    assert(safe_file_name("Movie: Part 1/2") == "Movie Part 12");
    assert(safe_file_name("tab\there") == "tabhere");
    assert(safe_file_name("..") == "untitled");

    std::cout << "test_url_and_names passed!" << std::endl;
}

void test_capacity_strings() {
    assert(check_capacity(BYTES_PER_GB, 2ULL * BYTES_PER_GB));
    assert(check_capacity(BYTES_PER_GB, static_cast<uint64_t>(BYTES_PER_GB)));
    assert(!check_capacity(3 * BYTES_PER_GB, 2ULL * BYTES_PER_GB));

    assert(format_capacity_summary(BYTES_PER_GB + BYTES_PER_GB / 2, 16ULL * BYTES_PER_GB) ==
           "Total Required Space: 1.50 GB / 16.00 GB Free");
    assert(std::string(capacity_warning()) == "Warning: Not enough space on the selected USB drive!");

    RemovableDrive drive;
    drive.name = "KINGSTON";
    drive.mount_point = "/media/user/KINGSTON";
    drive.free_bytes = 7ULL * BYTES_PER_GB;
    drive.total_bytes = 15ULL * BYTES_PER_GB;
    assert(format_drive_label(drive) ==
           "KINGSTON (/media/user/KINGSTON) - 7.00 GB Free / 15.00 GB Total");

    std::cout << "test_capacity_strings passed!" << std::endl;
}

void test_prepare_cache_root() {
    fs::path root = fs::temp_directory_path() / ("demoloader_prepare_" + std::to_string(getpid()));
    fs::remove_all(root);

    std::string error;
    assert(prepare_cache_root(root.string(), {"Movies", "Trailers"}, false, error));
    assert(fs::is_directory(root / "Movies"));
    assert(fs::is_directory(root / "Trailers"));

    {
        std::ofstream out(root / "Movies" / "old.mp4");
        out << "data";
    }

    // Keeping the cache leaves files alone
    assert(prepare_cache_root(root.string(), {"Movies"}, false, error));
    assert(fs::exists(root / "Movies" / "old.mp4"));

    // Clearing wipes the root first
    assert(prepare_cache_root(root.string(), {"Movies"}, true, error));
    assert(!fs::exists(root / "Movies" / "old.mp4"));
    assert(!fs::exists(root / "Trailers"));
    assert(fs::is_directory(root / "Movies"));

    auto space = query_free_space(root.string());
    assert(space.has_value());
    assert(space->total_bytes >= space->free_bytes);
    assert(!query_free_space((root / "missing" / "dir").string()).has_value());

    fs::remove_all(root);
    std::cout << "test_prepare_cache_root passed!" << std::endl;
}

void test_config_validation() {
    TransferConfig config;
    validate_config(config);

    config.destination_root = "/media/usb";
    assert(cache_root(config) == "/media/usb/cache");
    assert(cache_index_path(config) == "/media/usb/cache/cache.db");

    config.cache_dir = "/var/tmp/demo";
    assert(cache_root(config) == "/var/tmp/demo");

    bool threw = false;
    config.concurrency = 16;
    try {
        validate_config(config);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    config.concurrency = 3;
    config.retry_attempts = -1;
    try {
        validate_config(config);
    } catch (const ConfigError&) {
        threw = true;
    }
    assert(threw);

    std::cout << "test_config_validation passed!" << std::endl;
}

int main() {
    try {
        test_parse_catalog();
        test_parse_catalog_errors();
        test_build_tasks();
        test_url_and_names();
        test_capacity_strings();
        test_prepare_cache_root();
        test_config_validation();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
