#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace symcache {

bool is_success_status(int status);

/// Rate limiting and transient server errors: 429, 500, 502, 503, 504.
bool is_retryable_status(int status);

/// Percent-encode everything except unreserved characters (RFC 3986).
std::string url_encode(const std::string& str);

/// Case-insensitive multi-valued header map.
class HttpHeaders {
public:
    using HeaderPair = std::pair<std::string, std::string>;

    void set(const std::string& name, const std::string& value);
    void add(const std::string& name, const std::string& value);
    void clear() { headers_.clear(); }

    std::optional<std::string> get(const std::string& name) const;
    bool has(const std::string& name) const;
    std::vector<HeaderPair> all() const;

    std::optional<uint64_t> content_length() const;

private:
    static std::string normalize_name(const std::string& name);

    std::map<std::string, std::vector<std::string>> headers_;
};

/// A GET request and its retry policy.
struct HttpRequest {
    std::string url;
    HttpHeaders headers;

    std::chrono::milliseconds connect_timeout{30000};
    // Abort when less than one byte per second arrives for this long.
    // Large downloads are not bounded by a total timeout.
    std::chrono::milliseconds stall_timeout{30000};

    // Total attempts, including the first. Requests that must not be
    // repeated are attempted once.
    bool idempotent = true;
    int max_attempts = 3;
    std::chrono::milliseconds initial_retry_delay{300};
    double retry_backoff_multiplier = 2.0;

    static HttpRequest get(const std::string& url);
};

struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string error;
    bool is_network_error = false;
    bool aborted = false;        // A handler callback stopped the transfer
    uint64_t bytes_received = 0;
    int attempts = 0;
};

/// Callbacks receiving a streamed response.
///
/// on_response runs once per attempt with the final status and headers,
/// before any body bytes. Returning false from either callback aborts the
/// transfer.
struct HttpStreamHandler {
    std::function<bool(int status, const HttpHeaders& headers)> on_response;
    std::function<bool(std::span<const uint8_t> data)> on_data;
};

/// One transfer attempt, feeding the given handler.
using HttpStreamAttempt = std::function<HttpResponse(const HttpStreamHandler&)>;

/// Run `attempt` with exponential backoff on retryable statuses and network
/// errors. Non-idempotent requests are attempted once. A network error is
/// only retried while no body bytes have reached `handler`, and retryable
/// responses are only passed to `handler` on the last attempt.
HttpResponse stream_with_retry(const HttpRequest& request,
                               const HttpStreamHandler& handler,
                               const HttpStreamAttempt& attempt);

struct HttpClientConfig {
    std::string user_agent = "symcache/1.0";
    size_t max_idle_handles = 16;
    bool verbose = false;
};

/// libcurl client with a pool of reusable easy handles. Thread-safe.
class HttpClient {
public:
    explicit HttpClient(const HttpClientConfig& config = {});
    ~HttpClient();

    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;

    /// GET with the body delivered through `handler`, under the request's
    /// retry policy.
    HttpResponse execute_stream_with_retry(const HttpRequest& request,
                                           const HttpStreamHandler& handler);

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace symcache
