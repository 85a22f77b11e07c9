#include "demoloader/downloader.h"
#include "demoloader/catalog.h"
#include <iostream>
#include <cassert>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>
#include <cstdlib>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using namespace demoloader;
namespace fs = std::filesystem;

// Minimal HTTP/1.0 server on 127.0.0.1 serving a fixed set of routes,
// one connection at a time.
class LoopbackServer {
public:
    LoopbackServer() {
        listen_fd_ = socket(AF_INET, SOCK_STREAM, 0);
        assert(listen_fd_ >= 0);

        int yes = 1;
        setsockopt(listen_fd_, SOL_SOCKET, SO_REUSEADDR, &yes, sizeof(yes));

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        int rc = bind(listen_fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        assert(rc == 0);
        rc = listen(listen_fd_, 8);
        assert(rc == 0);

        socklen_t len = sizeof(addr);
        rc = getsockname(listen_fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        assert(rc == 0);
        port_ = ntohs(addr.sin_port);
        (void)rc;

        thread_ = std::thread([this]() { serve(); });
    }

    ~LoopbackServer() {
        stop_ = true;
        shutdown(listen_fd_, SHUT_RDWR);
        close(listen_fd_);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

    std::string url(const std::string& path) const {
        return "http://127.0.0.1:" + std::to_string(port_) + path;
    }

private:
    void serve() {
        while (!stop_) {
            int fd = accept(listen_fd_, nullptr, nullptr);
            if (fd < 0) {
                return;
            }
            handle(fd);
            close(fd);
        }
    }

    static bool send_all(int fd, const std::string& data) {
        size_t sent = 0;
        while (sent < data.size()) {
            ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }

    static std::string read_request_path(int fd) {
        std::string request;
        char buf[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            ssize_t n = recv(fd, buf, sizeof(buf), 0);
            if (n <= 0) {
                break;
            }
            request.append(buf, static_cast<size_t>(n));
        }
        size_t start = request.find(' ');
        size_t end = request.find(' ', start + 1);
        if (start == std::string::npos || end == std::string::npos) {
            return "";
        }
        return request.substr(start + 1, end - start - 1);
    }

    static std::string body_of(size_t size) {
        std::string body(size, '\0');
        for (size_t i = 0; i < size; ++i) {
            body[i] = static_cast<char>('a' + (i % 26));
        }
        return body;
    }

    void handle(int fd) {
        std::string path = read_request_path(fd);

        if (path == "/sized") {
            send_all(fd, "HTTP/1.0 200 OK\r\nContent-Length: 10000\r\n\r\n" + body_of(10000));
        } else if (path == "/unsized") {
            // Body ends when the connection closes
            send_all(fd, "HTTP/1.0 200 OK\r\n\r\n" + body_of(5000));
        } else if (path == "/empty") {
            send_all(fd, "HTTP/1.0 200 OK\r\nContent-Length: 0\r\n\r\n");
        } else if (path == "/short") {
            send_all(fd, "HTTP/1.0 200 OK\r\nContent-Length: 10000\r\n\r\n" + body_of(3000));
        } else if (path == "/slow") {
            if (!send_all(fd, "HTTP/1.0 200 OK\r\nContent-Length: 4096000\r\n\r\n")) {
                return;
            }
            std::string chunk = body_of(4096);
            for (int i = 0; i < 1000 && !stop_; ++i) {
                if (!send_all(fd, chunk)) {
                    return;
                }
                std::this_thread::sleep_for(std::chrono::milliseconds(20));
            }
        } else if (path == "/catalog.json") {
            std::string json = R"({"trailers": [{"title": "Sintel", "duration": "0:52", )"
                               R"("filetype": "mp4", "size_gb": 0.25, "url": "trailers/sintel.mp4"}]})";
            send_all(fd, "HTTP/1.0 200 OK\r\nContent-Type: application/json\r\nContent-Length: " +
                     std::to_string(json.size()) + "\r\n\r\n" + json);
        } else {
            std::string body = "not found";
            send_all(fd, "HTTP/1.0 404 Not Found\r\nContent-Length: " +
                     std::to_string(body.size()) + "\r\n\r\n" + body);
        }
    }

    int listen_fd_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};

struct ProgressLog {
    std::vector<std::pair<int64_t, int64_t>> events;

    ProgressCallback callback() {
        return [this](int64_t transferred, int64_t total) {
            events.emplace_back(transferred, total);
        };
    }
};

static fs::path make_temp_dir(const std::string& name) {
    fs::path dir = fs::temp_directory_path() /
                   ("demoloader_" + name + "_" + std::to_string(getpid()));
    fs::remove_all(dir);
    fs::create_directories(dir);
    return dir;
}

static TransferTask make_task(const std::string& url, const fs::path& dest) {
    TransferTask task;
    task.id = 1;
    task.source_url = url;
    task.destination_path = dest.string();
    task.display_name = dest.stem().string();
    task.category = "Movies";
    return task;
}

void test_streams_with_content_length(LoopbackServer& server, const fs::path& dir) {
    Downloader downloader;
    CancellationToken cancel;
    ProgressLog progress;

    fs::path dest = dir / "Movies" / "Sized.mp4";
    TransferResult result = downloader.run(make_task(server.url("/sized"), dest),
                                           cancel, progress.callback());

    assert(result.success);
    assert(result.status == TransferStatus::COMPLETED);
    assert(result.http_code == 200);
    assert(result.bytes_transferred == 10000);
    assert(result.expected_length == 10000);
    assert(result.message == "Finished downloading Sized");
    assert(fs::file_size(dest) == 10000);

    // 10000 bytes in pieces of at most 4096
    assert(progress.events.size() >= 3);
    int64_t previous = 0;
    for (const auto& event : progress.events) {
        assert(event.second == 10000);
        assert(event.first > previous);
        assert(event.first - previous <= static_cast<int64_t>(TRANSFER_CHUNK_SIZE));
        previous = event.first;
    }
    assert(progress.events.back().first == 10000);

    std::cout << "test_streams_with_content_length passed!" << std::endl;
}

void test_body_without_content_length(LoopbackServer& server, const fs::path& dir) {
    Downloader downloader;
    CancellationToken cancel;
    ProgressLog progress;

    fs::path dest = dir / "Movies" / "Unsized.mp4";
    TransferResult result = downloader.run(make_task(server.url("/unsized"), dest),
                                           cancel, progress.callback());

    assert(result.success);
    assert(result.expected_length == -1);
    assert(result.bytes_transferred == 5000);
    assert(fs::file_size(dest) == 5000);

    // Single jump straight to 100%
    assert(progress.events.size() == 1);
    assert(progress.events[0].first == 5000);
    assert(progress.events[0].second == 5000);

    std::cout << "test_body_without_content_length passed!" << std::endl;
}

void test_empty_body(LoopbackServer& server, const fs::path& dir) {
    Downloader downloader;
    CancellationToken cancel;
    ProgressLog progress;

    fs::path dest = dir / "Movies" / "Empty.mp4";
    TransferResult result = downloader.run(make_task(server.url("/empty"), dest),
                                           cancel, progress.callback());

    assert(result.success);
    assert(result.bytes_transferred == 0);
    assert(fs::exists(dest));
    assert(fs::file_size(dest) == 0);
    assert(progress.events.size() == 1);
    assert(progress.events[0].first == 0);
    assert(progress.events[0].second == 0);

    std::cout << "test_empty_body passed!" << std::endl;
}

void test_http_error(LoopbackServer& server, const fs::path& dir) {
    Downloader downloader;
    CancellationToken cancel;
    ProgressLog progress;

    fs::path dest = dir / "Movies" / "Missing.mp4";
    TransferResult result = downloader.run(make_task(server.url("/missing"), dest),
                                           cancel, progress.callback());

    assert(!result.success);
    assert(result.status == TransferStatus::FAILED);
    assert(result.error.has_value());
    assert(result.error->kind == ErrorKind::NETWORK);
    assert(result.http_code == 404);
    assert(result.message.find("Error downloading Missing") == 0);
    assert(progress.events.empty());

    // Failed transfers leave whatever was written in place
    assert(fs::exists(dest));

    std::cout << "test_http_error passed!" << std::endl;
}

void test_short_body(LoopbackServer& server, const fs::path& dir) {
    Downloader downloader;
    CancellationToken cancel;
    ProgressLog progress;

    fs::path dest = dir / "Movies" / "Short.mp4";
    TransferResult result = downloader.run(make_task(server.url("/short"), dest),
                                           cancel, progress.callback());

    assert(!result.success);
    assert(result.status == TransferStatus::FAILED);
    assert(result.error->kind == ErrorKind::SIZE_MISMATCH);
    assert(result.bytes_transferred == 3000);
    assert(!progress.events.empty());
    assert(progress.events.back().first == 3000);

    std::cout << "test_short_body passed!" << std::endl;
}

void test_unwritable_destination(LoopbackServer& server, const fs::path& dir) {
    Downloader downloader;
    CancellationToken cancel;
    ProgressLog progress;

    // A regular file where the category directory should be
    fs::path blocker = dir / "blocker";
    std::ofstream(blocker) << "x";

    fs::path dest = blocker / "Nowhere.mp4";
    TransferResult result = downloader.run(make_task(server.url("/sized"), dest),
                                           cancel, progress.callback());

    assert(!result.success);
    assert(result.error->kind == ErrorKind::IO);
    assert(progress.events.empty());

    std::cout << "test_unwritable_destination passed!" << std::endl;
}

void test_cancel_mid_transfer(LoopbackServer& server, const fs::path& dir) {
    Downloader downloader;
    CancellationToken cancel;
    std::vector<int64_t> seen;

    fs::path dest = dir / "Movies" / "Slow.mp4";
    ProgressCallback on_progress = [&](int64_t transferred, int64_t total) {
        assert(total == 4096000);
        seen.push_back(transferred);
        if (seen.size() == 2) {
            cancel.cancel();
        }
    };

    TransferResult result = downloader.run(make_task(server.url("/slow"), dest),
                                           cancel, on_progress);

    assert(!result.success);
    assert(result.status == TransferStatus::CANCELLED);
    assert(result.error->kind == ErrorKind::CANCELLED);
    assert(result.message == "Cancelled downloading Slow");
    assert(result.bytes_transferred < 4096000);
    assert(!fs::exists(dest));

    // Already-cancelled token never touches the network
    ProgressLog progress;
    TransferResult again = downloader.run(make_task(server.url("/sized"), dest),
                                          cancel, progress.callback());
    assert(again.status == TransferStatus::CANCELLED);
    assert(progress.events.empty());

    std::cout << "test_cancel_mid_transfer passed!" << std::endl;
}

void test_fetch_catalog(LoopbackServer& server) {
    CatalogResult result = fetch_catalog(server.url("/catalog.json"));
    assert(result.success);
    assert(result.catalog.categories().size() == 1);
    assert(result.catalog.categories()[0] == "Trailers");
    assert(result.catalog.items_for("Trailers")[0].title == "Sintel");

    CatalogResult missing = fetch_catalog(server.url("/nothing.json"));
    assert(!missing.success);
    assert(missing.error_message.find("Error fetching catalog") == 0);

    Downloader downloader;
    FetchResult fetched = downloader.fetch(server.url("/nothing.json"));
    assert(!fetched.success);
    assert(fetched.http_code == 404);
    assert(fetched.error_message == "HTTP error: 404");

    std::cout << "test_fetch_catalog passed!" << std::endl;
}

void test_factory() {
    WorkerFactory factory = make_downloader_factory(TransferConfig{});
    std::unique_ptr<TransferWorker> first = factory();
    std::unique_ptr<TransferWorker> second = factory();
    assert(first != nullptr);
    assert(second != nullptr);
    assert(first.get() != second.get());

    std::cout << "test_factory passed!" << std::endl;
}

int main() {
    std::cout << "Running downloader tests..." << std::endl;

    // Loopback traffic must not go through a proxy
    unsetenv("http_proxy");
    unsetenv("HTTP_PROXY");
    unsetenv("all_proxy");
    unsetenv("ALL_PROXY");

    try {
        LoopbackServer server;
        fs::path dir = make_temp_dir("downloader");

        test_streams_with_content_length(server, dir);
        test_body_without_content_length(server, dir);
        test_empty_body(server, dir);
        test_http_error(server, dir);
        test_short_body(server, dir);
        test_unwritable_destination(server, dir);
        test_cancel_mid_transfer(server, dir);
        test_fetch_catalog(server);
        test_factory();

        fs::remove_all(dir);
        std::cout << "\nAll tests passed!" << std::endl;
        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with exception: " << e.what() << std::endl;
        return 1;
    }
}
