#include "symcache/source_orchestrator.hpp"
#include "symcache/log.hpp"
#include "symcache/metrics.hpp"

#include <memory>
#include <optional>

namespace symcache {

std::string build_upstream_url(const std::string& base, const SymbolKey& key) {
    std::string url = base;
    while (!url.empty() && url.back() == '/') {
        url.pop_back();
    }
    url += "/" + url_encode(key.name);
    url += "/" + url_encode(key.identifier);
    url += "/" + url_encode(key.filename);
    return url;
}

SourceOrchestrator::SourceOrchestrator(std::vector<std::string> upstreams,
                                       UpstreamFetcher& fetcher, TransferEngine& engine,
                                       Ledger& ledger)
    : upstreams_(std::move(upstreams)), fetcher_(fetcher), engine_(engine), ledger_(ledger) {}

AcquireResult SourceOrchestrator::acquire(CacheEntry& entry) {
    AcquireResult result;

    std::string err = validate_key(entry.key);
    if (!err.empty()) {
        log_warn("Refusing to fetch %s: %s", entry.key.to_string().c_str(), err.c_str());
        result.error = err;
        finalize(entry, false);
        return result;
    }

    std::optional<ScopedTimer> timer;
    if (metrics_) timer.emplace(metrics_->fetch_duration());

    for (const auto& base : upstreams_) {
        ++result.candidates_tried;
        try {
            if (try_candidate(entry, base, result)) {
                result.found = true;
                result.source = base;
                break;
            }
        } catch (const std::exception& e) {
            log_error("Fetch of %s from %s failed: %s", entry.key.to_string().c_str(),
                      base.c_str(), e.what());
        }
    }

    if (result.found) {
        log_info("Stored %s from %s (%llu bytes)", entry.key.to_string().c_str(),
                 result.source.c_str(), static_cast<unsigned long long>(result.bytes));
    } else {
        log_info("%s not found on any of %d upstream(s)", entry.key.to_string().c_str(),
                 result.candidates_tried);
    }

    if (metrics_) {
        if (result.found) {
            metrics_->fetches_success().Increment();
            metrics_->fetch_bytes_total().Increment(static_cast<double>(result.bytes));
        } else {
            metrics_->fetches_failure().Increment();
        }
    }

    finalize(entry, result.found);
    return result;
}

bool SourceOrchestrator::try_candidate(CacheEntry& entry, const std::string& base,
                                       AcquireResult& result) {
    std::string url = build_upstream_url(base, entry.key);
    log_debug("Requesting %s", url.c_str());

    std::unique_ptr<TransferSession> session;
    std::string begin_error;

    HttpStreamHandler handler;
    handler.on_response = [&](int status, const HttpHeaders& headers) {
        if (status != 200) {
            return false;
        }
        session = engine_.begin(entry, headers, begin_error);
        return session != nullptr;
    };
    handler.on_data = [&](std::span<const uint8_t> data) {
        return session && session->push(data);
    };

    HttpResponse response = fetcher_.fetch(url, handler);

    if (metrics_) {
        if (response.status_code == 200) {
            metrics_->upstream_ok().Increment();
        } else if (response.status_code == 404) {
            metrics_->upstream_not_found().Increment();
        } else {
            metrics_->upstream_error().Increment();
        }
    }

    if (!session) {
        if (response.status_code == 200) {
            log_warn("%s: %s", url.c_str(), begin_error.c_str());
        } else if (response.is_network_error) {
            log_warn("%s: %s after %d attempt(s)", url.c_str(), response.error.c_str(),
                     response.attempts);
        } else {
            log_info("%s: HTTP %d", url.c_str(), response.status_code);
        }
        return false;
    }

    if (response.is_network_error) {
        session->abort(response.error);
        return false;
    }

    if (!session->commit()) {
        return false;
    }

    result.bytes = session->received_bytes();
    return true;
}

void SourceOrchestrator::finalize(CacheEntry& entry, bool found) {
    entry.in_flight = false;
    entry.found = found;
    try {
        ledger_.update_entry(entry);
    } catch (const LedgerError& e) {
        log_error("Failed to finalize ledger entry for %s: %s", entry.key.to_string().c_str(),
                  e.what());
    }
}

}  // namespace symcache
