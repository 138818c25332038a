#include "symcache/http.hpp"
#include "symcache/log.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <thread>

namespace symcache {

// ============================================================================
// Utility functions
// ============================================================================

bool is_success_status(int status) {
    return status >= 200 && status < 300;
}

bool is_retryable_status(int status) {
    // Rate limiting and transient server errors
    return status == 429 || status == 500 || status == 502 || status == 503 || status == 504;
}

std::string url_encode(const std::string& str) {
    std::ostringstream encoded;
    encoded << std::hex << std::uppercase;

    for (unsigned char c : str) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded << c;
        } else {
            encoded << '%' << std::setw(2) << std::setfill('0') << static_cast<int>(c);
        }
    }

    return encoded.str();
}

// ============================================================================
// HttpHeaders
// ============================================================================

std::string HttpHeaders::normalize_name(const std::string& name) {
    std::string result = name;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

void HttpHeaders::set(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)] = {value};
}

void HttpHeaders::add(const std::string& name, const std::string& value) {
    headers_[normalize_name(name)].push_back(value);
}

std::optional<std::string> HttpHeaders::get(const std::string& name) const {
    auto it = headers_.find(normalize_name(name));
    if (it != headers_.end() && !it->second.empty()) {
        return it->second[0];
    }
    return std::nullopt;
}

bool HttpHeaders::has(const std::string& name) const {
    return headers_.find(normalize_name(name)) != headers_.end();
}

std::vector<HttpHeaders::HeaderPair> HttpHeaders::all() const {
    std::vector<HeaderPair> result;
    for (const auto& [name, values] : headers_) {
        for (const auto& value : values) {
            result.emplace_back(name, value);
        }
    }
    return result;
}

std::optional<uint64_t> HttpHeaders::content_length() const {
    auto val = get("Content-Length");
    if (val) {
        try {
            return std::stoull(*val);
        } catch (const std::invalid_argument&) {
            // Invalid Content-Length header format
        } catch (const std::out_of_range&) {
            // Content-Length value out of range
        }
    }
    return std::nullopt;
}

HttpRequest HttpRequest::get(const std::string& url) {
    HttpRequest req;
    req.url = url;
    return req;
}

// ============================================================================
// Retry policy
// ============================================================================

HttpResponse stream_with_retry(const HttpRequest& request,
                               const HttpStreamHandler& handler,
                               const HttpStreamAttempt& attempt) {
    int max_attempts = request.idempotent ? std::max(1, request.max_attempts) : 1;
    auto delay = request.initial_retry_delay;

    for (int n = 1;; ++n) {
        bool last = n >= max_attempts;
        bool held_back = false;
        bool forwarded = false;

        HttpStreamHandler wrapped;
        wrapped.on_response = [&](int status, const HttpHeaders& headers) {
            if (!last && is_retryable_status(status)) {
                held_back = true;
                return false;
            }
            forwarded = true;
            return handler.on_response ? handler.on_response(status, headers) : true;
        };
        wrapped.on_data = [&](std::span<const uint8_t> data) {
            return handler.on_data ? handler.on_data(data) : true;
        };

        HttpResponse response = attempt(wrapped);
        response.attempts = n;

        // Once the handler has seen a response it owns the outcome.
        bool retry = held_back || (response.is_network_error && !forwarded);
        if (!retry || last) {
            return response;
        }

        if (held_back) {
            log_debug("GET %s: HTTP %d, retrying in %lld ms (attempt %d/%d)",
                      request.url.c_str(),
                      response.status_code, static_cast<long long>(delay.count()), n,
                      max_attempts);
        } else {
            log_debug("GET %s: %s, retrying in %lld ms (attempt %d/%d)",
                      request.url.c_str(),
                      response.error.c_str(), static_cast<long long>(delay.count()), n,
                      max_attempts);
        }

        std::this_thread::sleep_for(delay);

        // Exponential backoff
        delay = std::chrono::milliseconds(
            static_cast<long>(delay.count() * request.retry_backoff_multiplier));
    }
}

// ============================================================================
// CURL callback functions
// ============================================================================

namespace {

struct StreamContext {
    CURL* curl = nullptr;
    const HttpStreamHandler* handler = nullptr;
    HttpHeaders* headers = nullptr;
    long status = 0;
    uint64_t bytes = 0;
    bool dispatched = false;
    bool aborted = false;
};

// Hand status and headers to the handler exactly once per transfer.
bool dispatch_response(StreamContext* ctx) {
    ctx->dispatched = true;
    curl_easy_getinfo(ctx->curl, CURLINFO_RESPONSE_CODE, &ctx->status);
    if (ctx->handler->on_response &&
        !ctx->handler->on_response(static_cast<int>(ctx->status), *ctx->headers)) {
        ctx->aborted = true;
        return false;
    }
    return true;
}

size_t stream_write_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* ctx = static_cast<StreamContext*>(userdata);
    size_t bytes = size * nmemb;

    if (!ctx->dispatched && !dispatch_response(ctx)) {
        return 0;  // Abort transfer
    }

    if (ctx->handler->on_data &&
        !ctx->handler->on_data({reinterpret_cast<const uint8_t*>(ptr), bytes})) {
        ctx->aborted = true;
        return 0;
    }

    ctx->bytes += bytes;
    return bytes;
}

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* headers = static_cast<HttpHeaders*>(userdata);
    size_t bytes = size * nitems;

    std::string line(buffer, bytes);

    // Remove trailing CRLF
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
        line.pop_back();
    }

    if (line.empty()) {
        return bytes;
    }

    // A new status line starts a new header block (redirects, 100-continue)
    if (line.starts_with("HTTP/")) {
        headers->clear();
        return bytes;
    }

    size_t colon = line.find(':');
    if (colon != std::string::npos) {
        std::string name = line.substr(0, colon);
        std::string value = line.substr(colon + 1);

        size_t start = value.find_first_not_of(" \t");
        value = start != std::string::npos ? value.substr(start) : std::string();

        headers->add(name, value);
    }

    return bytes;
}

}  // namespace

// ============================================================================
// HttpClient Implementation
// ============================================================================

class HttpClient::Impl {
public:
    explicit Impl(const HttpClientConfig& config)
        : config_(config) {
        // Initialize CURL globally (thread-safe)
        static std::once_flag curl_init_flag;
        std::call_once(curl_init_flag, []() {
            curl_global_init(CURL_GLOBAL_ALL);
        });
    }

    ~Impl() {
        std::lock_guard<std::mutex> lock(pool_mutex_);
        for (CURL* handle : idle_handles_) {
            curl_easy_cleanup(handle);
        }
        idle_handles_.clear();
    }

    HttpResponse execute_stream(const HttpRequest& request, const HttpStreamHandler& handler) {
        HttpResponse response;

        CURL* curl = acquire_handle();
        if (!curl) {
            response.error = "Failed to create curl handle";
            response.is_network_error = true;
            return response;
        }

        curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
        curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);

        struct curl_slist* headers_list = nullptr;
        for (const auto& [name, value] : request.headers.all()) {
            std::string header = name + ": " + value;
            headers_list = curl_slist_append(headers_list, header.c_str());
        }
        if (headers_list) {
            curl_easy_setopt(curl, CURLOPT_HTTPHEADER, headers_list);
        }

        if (!config_.user_agent.empty()) {
            curl_easy_setopt(curl, CURLOPT_USERAGENT, config_.user_agent.c_str());
        }

        StreamContext ctx;
        ctx.curl = curl;
        ctx.handler = &handler;
        ctx.headers = &response.headers;

        curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, stream_write_callback);
        curl_easy_setopt(curl, CURLOPT_WRITEDATA, &ctx);
        curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
        curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);

        // Body bytes are stored as received; never ask curl to decode them.
        curl_easy_setopt(curl, CURLOPT_HTTP_CONTENT_DECODING, 0L);

        // Timeouts: connect, then abort only when the transfer stalls
        curl_easy_setopt(curl, CURLOPT_CONNECTTIMEOUT_MS,
                         static_cast<long>(request.connect_timeout.count()));
        auto stall_secs = std::chrono::duration_cast<std::chrono::seconds>(request.stall_timeout);
        if (stall_secs.count() > 0) {
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_LIMIT, 1L);
            curl_easy_setopt(curl, CURLOPT_LOW_SPEED_TIME, static_cast<long>(stall_secs.count()));
        }

        curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
        curl_easy_setopt(curl, CURLOPT_MAXREDIRS, 10L);
        curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);

        if (config_.verbose) {
            curl_easy_setopt(curl, CURLOPT_VERBOSE, 1L);
        }

        CURLcode res = curl_easy_perform(curl);

        if (res == CURLE_OK) {
            // Responses without a body never reached the write callback
            if (!ctx.dispatched) {
                dispatch_response(&ctx);
            }
            response.status_code = static_cast<int>(ctx.status);
            response.aborted = ctx.aborted;
        } else if (res == CURLE_WRITE_ERROR && ctx.aborted) {
            response.status_code = static_cast<int>(ctx.status);
            response.aborted = true;
        } else {
            response.status_code = static_cast<int>(ctx.status);
            response.error = curl_easy_strerror(res);
            response.is_network_error = true;
        }
        response.bytes_received = ctx.bytes;

        if (headers_list) {
            curl_slist_free_all(headers_list);
        }

        release_handle(curl);

        return response;
    }

private:
    CURL* acquire_handle() {
        {
            std::lock_guard<std::mutex> lock(pool_mutex_);
            if (!idle_handles_.empty()) {
                CURL* handle = idle_handles_.back();
                idle_handles_.pop_back();
                return handle;
            }
        }
        return curl_easy_init();
    }

    void release_handle(CURL* handle) {
        if (!handle) return;

        // Reset handle for reuse
        curl_easy_reset(handle);

        std::lock_guard<std::mutex> lock(pool_mutex_);
        if (idle_handles_.size() < config_.max_idle_handles) {
            idle_handles_.push_back(handle);
        } else {
            curl_easy_cleanup(handle);
        }
    }

    HttpClientConfig config_;
    std::mutex pool_mutex_;
    std::vector<CURL*> idle_handles_;
};

// ============================================================================
// HttpClient public interface
// ============================================================================

HttpClient::HttpClient(const HttpClientConfig& config)
    : impl_(std::make_unique<Impl>(config)) {}

HttpClient::~HttpClient() = default;

HttpResponse HttpClient::execute_stream_with_retry(const HttpRequest& request,
                                                   const HttpStreamHandler& handler) {
    return stream_with_retry(request, handler, [&](const HttpStreamHandler& attempt_handler) {
        return impl_->execute_stream(request, attempt_handler);
    });
}

}  // namespace symcache
