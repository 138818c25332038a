#include "symcache/request_server.hpp"
#include "symcache/log.hpp"
#include "symcache/metrics.hpp"
#include "symcache/symbol_cache.hpp"
#include "meridian/core/thread_pool.hpp"

#include <cerrno>
#include <cstring>
#include <nlohmann/json.hpp>
#include <optional>
#include <sstream>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>
#include <vector>

namespace symcache {

namespace {

constexpr size_t MAX_REQUEST_LINE = 4096;

std::string read_request_line(int fd) {
    std::string line;
    char buf[512];
    while (line.size() < MAX_REQUEST_LINE) {
        ssize_t n = read(fd, buf, sizeof(buf));
        if (n < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (n == 0) break;
        line.append(buf, static_cast<size_t>(n));
        if (line.find('\n') != std::string::npos) break;
    }

    auto nl = line.find('\n');
    if (nl != std::string::npos) line.resize(nl);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

bool write_all(int fd, const void* data, size_t size) {
    const auto* p = static_cast<const char*>(data);
    while (size > 0) {
        ssize_t n = send(fd, p, size, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            return false;
        }
        p += n;
        size -= static_cast<size_t>(n);
    }
    return true;
}

bool write_line(int fd, const std::string& line) {
    std::string out = line + "\n";
    return write_all(fd, out.data(), out.size());
}

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string word;
    while (iss >> word) {
        words.push_back(word);
    }
    return words;
}

std::optional<long long> parse_int(const std::string& s) {
    try {
        size_t pos = 0;
        long long v = std::stoll(s, &pos);
        if (pos != s.size()) return std::nullopt;
        return v;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

RequestServer::RequestServer(SymbolCache& cache, std::filesystem::path socket_path,
                             size_t threads)
    : cache_(cache), socket_path_(std::move(socket_path)), threads_(threads) {}

RequestServer::~RequestServer() {
    stop();
}

std::string RequestServer::start() {
    if (running_.load()) return {};

    std::error_code ec;
    std::filesystem::create_directories(socket_path_.parent_path(), ec);

    // Remove stale socket
    unlink(socket_path_.c_str());

    sock_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (sock_fd_ < 0) {
        return std::string("Failed to create socket: ") + strerror(errno);
    }

    struct sockaddr_un addr;
    memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    if (socket_path_.string().size() >= sizeof(addr.sun_path)) {
        close(sock_fd_);
        sock_fd_ = -1;
        return "Socket path too long: " + socket_path_.string();
    }
    strncpy(addr.sun_path, socket_path_.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(sock_fd_, reinterpret_cast<struct sockaddr*>(&addr), sizeof(addr)) < 0) {
        std::string err = std::string("Failed to bind socket: ") + strerror(errno);
        close(sock_fd_);
        sock_fd_ = -1;
        return err;
    }

    if (listen(sock_fd_, 64) < 0) {
        std::string err = std::string("Failed to listen on socket: ") + strerror(errno);
        close(sock_fd_);
        sock_fd_ = -1;
        return err;
    }

    // Debuggers and symbol tools may run as other users
    chmod(socket_path_.c_str(), 0666);

    running_ = true;
    pool_ = std::make_unique<meridian::ThreadPool>(threads_);
    accept_thread_ = std::thread(&RequestServer::accept_loop, this);

    log_info("Request server listening on %s", socket_path_.c_str());
    return {};
}

void RequestServer::stop() {
    if (!running_.exchange(false)) return;

    // Unblock accept()
    if (sock_fd_ >= 0) {
        shutdown(sock_fd_, SHUT_RDWR);
    }
    if (accept_thread_.joinable()) accept_thread_.join();

    if (sock_fd_ >= 0) {
        close(sock_fd_);
        sock_fd_ = -1;
    }
    unlink(socket_path_.c_str());

    if (pool_) pool_->shutdown(true);
}

void RequestServer::accept_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        struct sockaddr_un client_addr;
        socklen_t client_len = sizeof(client_addr);
        int client_fd = accept(sock_fd_, reinterpret_cast<struct sockaddr*>(&client_addr),
                               &client_len);
        if (client_fd < 0) {
            if (errno == EINTR || errno == ECONNABORTED) continue;
            if (!running_.load()) break;
            log_error("Accept failed: %s", strerror(errno));
            continue;
        }

        // Set read timeout
        struct timeval tv;
        tv.tv_sec = 30;
        tv.tv_usec = 0;
        setsockopt(client_fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

        pool_->execute([this, client_fd]() {
            handle_client(client_fd);
            close(client_fd);
        });
    }
}

void RequestServer::handle_client(int client_fd) {
    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->request_duration());

    std::string line = read_request_line(client_fd);
    auto words = split_words(line);
    if (words.empty()) {
        write_line(client_fd, "ERROR empty request");
        return;
    }

    const std::string& command = words[0];
    if (command == "GET") {
        handle_get(client_fd, line);
    } else if (command == "LIST") {
        write_line(client_fd, handle_list(line));
    } else if (command == "HEALTH") {
        write_line(client_fd, nlohmann::json{{"status", "ok"}}.dump());
    } else {
        write_line(client_fd, "ERROR unknown command");
    }
}

void RequestServer::handle_get(int client_fd, const std::string& line) {
    auto words = split_words(line);
    if (words.size() < 4 || words.size() > 5 || (words.size() == 5 && words[4] != "gzip")) {
        write_line(client_fd, "BADREQUEST usage: GET <name> <identifier> <filename> [gzip]");
        return;
    }

    SymbolKey key{words[1], words[2], words[3]};
    bool accepts_gzip = words.size() == 5;

    auto result = cache_.resolve(key, accepts_gzip);
    switch (result.status) {
        case ResolveStatus::Scheduled:
        case ResolveStatus::InFlight:
            write_line(client_fd, "NOTFOUND");
            return;
        case ResolveStatus::Invalid:
            write_line(client_fd, "BADREQUEST " + result.error);
            return;
        case ResolveStatus::Error:
            write_line(client_fd, "ERROR " + result.error);
            return;
        case ResolveStatus::Hit:
            break;
    }

    if (!write_line(client_fd, result.compressed ? "OK gzip" : "OK identity")) {
        return;
    }

    std::vector<uint8_t> chunk;
    while (result.stream->next(chunk)) {
        if (!write_all(client_fd, chunk.data(), chunk.size())) {
            log_debug("Client went away while streaming %s", key.to_string().c_str());
            return;
        }
    }
    if (result.stream->failed()) {
        log_warn("Streaming %s ended early", key.to_string().c_str());
    }
}

std::string RequestServer::handle_list(const std::string& line) {
    auto words = split_words(line);
    if (words.size() > 3) {
        return "BADREQUEST usage: LIST [skip] [limit]";
    }

    long long skip = 0;
    long long limit = static_cast<long long>(DEFAULT_LIST_LIMIT);
    if (words.size() >= 2) {
        auto v = parse_int(words[1]);
        if (!v || *v < 0) return "BADREQUEST skip must be a non-negative integer";
        skip = *v;
    }
    if (words.size() == 3) {
        auto v = parse_int(words[2]);
        if (!v || *v < 1 || *v > static_cast<long long>(MAX_LIST_LIMIT)) {
            return "BADREQUEST limit must be between 1 and " + std::to_string(MAX_LIST_LIMIT);
        }
        limit = *v;
    }

    try {
        auto entries = cache_.list_entries(static_cast<size_t>(skip), static_cast<size_t>(limit));
        auto out = nlohmann::json::array();
        for (const auto& e : entries) {
            out.push_back({
                {"id", e.id},
                {"name", e.key.name},
                {"identifier", e.key.identifier},
                {"filename", e.key.filename},
                {"in_flight", e.in_flight},
                {"found", e.found},
            });
        }
        return out.dump();
    } catch (const LedgerError& e) {
        log_error("LIST failed: %s", e.what());
        return std::string("ERROR ") + e.what();
    }
}

}  // namespace symcache
