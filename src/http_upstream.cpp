#include "symcache/upstream.hpp"

namespace symcache {

namespace {

HttpClientConfig client_config(const UpstreamOptions& options) {
    HttpClientConfig config;
    config.verbose = options.verbose;
    return config;
}

}  // namespace

HttpUpstreamFetcher::HttpUpstreamFetcher(const UpstreamOptions& options)
    : options_(options), client_(client_config(options)) {}

HttpResponse HttpUpstreamFetcher::fetch(const std::string& url,
                                        const HttpStreamHandler& handler) {
    HttpRequest request = HttpRequest::get(url);
    request.connect_timeout = options_.request_timeout;
    request.stall_timeout = options_.request_timeout;
    request.max_attempts = options_.max_attempts;
    request.initial_retry_delay = options_.retry_backoff;

    // Symbol servers serve the stored encoding; ask for gzip when they have it.
    request.headers.set("Accept-Encoding", "gzip");

    return client_.execute_stream_with_retry(request, handler);
}

}  // namespace symcache
