#pragma once

#include "symcache/http.hpp"

#include <chrono>
#include <string>

namespace symcache {

/// Source of symbol payloads. fetch() performs a streaming GET of `url`,
/// including any per-connection retries, and reports the final outcome.
class UpstreamFetcher {
public:
    virtual ~UpstreamFetcher() = default;

    virtual HttpResponse fetch(const std::string& url, const HttpStreamHandler& handler) = 0;
};

struct UpstreamOptions {
    std::chrono::milliseconds request_timeout{30000};
    int max_attempts = 3;
    std::chrono::milliseconds retry_backoff{300};
    bool verbose = false;
};

/// UpstreamFetcher backed by libcurl.
class HttpUpstreamFetcher : public UpstreamFetcher {
public:
    explicit HttpUpstreamFetcher(const UpstreamOptions& options);

    HttpResponse fetch(const std::string& url, const HttpStreamHandler& handler) override;

private:
    UpstreamOptions options_;
    HttpClient client_;
};

}  // namespace symcache
