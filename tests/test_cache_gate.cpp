#include "demoloader/cache_gate.h"
#include "demoloader/cache_index.h"
#include "demoloader/task_builder.h"
#include <iostream>
#include <cassert>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

using namespace demoloader;
namespace fs = std::filesystem;

static fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("demoloader_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static void write_file(const fs::path& path, size_t size) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << std::string(size, 'x');
}

static TransferTask make_task(const fs::path& root, const std::string& category,
                              const std::string& title) {
    TransferTask task;
    task.id = 1;
    task.category = category;
    task.display_name = title;
    task.source_url = "https://cdn.example/" + title + ".mp4";
    task.destination_path = (root / category / (title + ".mp4")).string();
    return task;
}

void test_cache_key() {
    fs::path root = "/media/usb/cache";
    CacheGate gate(root.string(), true);

    TransferTask task = make_task(root, "Movies", "Big Buck Bunny");
    assert(gate.cache_key(task) == "/media/usb/cache/Movies/Big Buck Bunny.mp4");

    // Same (category, title) always maps to the same key
    TransferTask other = task;
    other.id = 42;
    other.source_url = "https://mirror.example/elsewhere.mp4";
    assert(gate.cache_key(other) == gate.cache_key(task));

    // Separators in titles cannot escape the category directory
    TransferTask sneaky = make_task(root, "Movies", "a/b:c");
    assert(gate.cache_key(sneaky) == "/media/usb/cache/Movies/abc.mp4");

    std::cout << "test_cache_key passed!" << std::endl;
}

void test_skip_existing_file() {
    fs::path root = make_temp_dir("gate_plain");
    TransferTask task = make_task(root, "Trailers", "Sintel");

    CacheGate enabled(root.string(), true);
    CacheGate disabled(root.string(), false);

    assert(!enabled.should_skip(task));

    write_file(task.destination_path, 128);
    assert(enabled.should_skip(task));
    assert(!disabled.should_skip(task));

    // A directory at the key is not a materialized file
    TransferTask dir_task = make_task(root, "Trailers", "Folder");
    fs::create_directories(enabled.cache_key(dir_task));
    assert(!enabled.should_skip(dir_task));

    fs::remove_all(root);
    std::cout << "test_skip_existing_file passed!" << std::endl;
}

void test_index_distrusts_partials() {
    fs::path root = make_temp_dir("gate_index");
    CacheIndex index((root / "cache.db").string());
    assert(index.initialize());

    CacheGate gate(root.string(), true, &index);
    TransferTask task = make_task(root, "Movies", "Tears of Steel");
    write_file(task.destination_path, 100);

    // No record: an existing file counts
    assert(gate.should_skip(task));

    // A failed transfer left this file behind
    TransferResult failed;
    failed.success = false;
    failed.status = TransferStatus::FAILED;
    failed.bytes_transferred = 100;
    assert(gate.record(task, failed));
    assert(!gate.should_skip(task));

    // Completed with the same size on disk
    TransferResult done;
    done.success = true;
    done.status = TransferStatus::COMPLETED;
    done.bytes_transferred = 100;
    assert(gate.record(task, done));
    assert(gate.should_skip(task));

    auto entry = index.lookup(gate.cache_key(task));
    assert(entry.has_value());
    assert(entry->status == TransferStatus::COMPLETED);
    assert(entry->file_size == 100);
    assert(entry->title == "Tears of Steel");
    assert(index.count() == 1);

    // File truncated since it was recorded
    write_file(task.destination_path, 40);
    assert(!gate.should_skip(task));

    fs::remove_all(root);
    std::cout << "test_index_distrusts_partials passed!" << std::endl;
}

void test_index_persists() {
    fs::path root = make_temp_dir("gate_persist");
    std::string db_path = (root / "cache.db").string();

    {
        CacheIndex index(db_path);
        assert(index.initialize());
        CacheEntry entry;
        entry.path = (root / "Movies" / "x.mp4").string();
        entry.category = "Movies";
        entry.title = "x";
        entry.status = TransferStatus::CANCELLED;
        assert(index.record(entry));
    }

    CacheIndex reopened(db_path);
    assert(reopened.initialize());
    auto entry = reopened.lookup((root / "Movies" / "." / "x.mp4").string());
    assert(entry.has_value());
    assert(entry->status == TransferStatus::CANCELLED);

    assert(reopened.remove((root / "Movies" / "x.mp4").string()));
    assert(!reopened.lookup((root / "Movies" / "x.mp4").string()).has_value());
    assert(!reopened.remove((root / "Movies" / "x.mp4").string()));
    assert(reopened.clear() == 0);

    fs::remove_all(root);
    std::cout << "test_index_persists passed!" << std::endl;
}

int main() {
    try {
        test_cache_key();
        test_skip_existing_file();
        test_index_distrusts_partials();
        test_index_persists();
        std::cout << "All tests passed!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
