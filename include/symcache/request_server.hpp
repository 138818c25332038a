#pragma once

#include <atomic>
#include <filesystem>
#include <memory>
#include <string>
#include <thread>

namespace meridian {
class ThreadPool;
}  // namespace meridian

namespace symcache {

class MetricsExporter;
class SymbolCache;

/// Maximum entries returned by one LIST request.
constexpr size_t MAX_LIST_LIMIT = 1000;
constexpr size_t DEFAULT_LIST_LIMIT = 100;

/// Line-based front end on a Unix stream socket, one request per connection.
///
///   GET <name> <identifier> <filename> [gzip]
///       -> "OK gzip" | "OK identity", then the artifact bytes until close
///       -> "NOTFOUND" while missing or being fetched
///       -> "BADREQUEST <msg>" for malformed keys
///       -> "ERROR <msg>" for internal failures
///   LIST [skip] [limit]   -> one JSON array line of ledger entries
///   HEALTH                -> {"status":"ok"}
class RequestServer {
public:
    RequestServer(SymbolCache& cache, std::filesystem::path socket_path, size_t threads = 16);
    ~RequestServer();

    RequestServer(const RequestServer&) = delete;
    RequestServer& operator=(const RequestServer&) = delete;

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    /// Bind the socket and start accepting.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Close the socket and wait for in-progress requests.
    void stop();

    const std::filesystem::path& socket_path() const { return socket_path_; }

private:
    void accept_loop();
    void handle_client(int client_fd);

    void handle_get(int client_fd, const std::string& line);
    std::string handle_list(const std::string& line);

    SymbolCache& cache_;
    std::filesystem::path socket_path_;
    size_t threads_;
    MetricsExporter* metrics_ = nullptr;

    std::unique_ptr<meridian::ThreadPool> pool_;
    std::thread accept_thread_;
    std::atomic<bool> running_{false};
    int sock_fd_ = -1;
};

}  // namespace symcache
