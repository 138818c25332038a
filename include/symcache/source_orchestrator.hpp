#pragma once

#include "symcache/ledger.hpp"
#include "symcache/transfer_engine.hpp"
#include "symcache/upstream.hpp"

#include <string>
#include <vector>

namespace symcache {

class MetricsExporter;

/// Outcome of one acquire() call, for logging and tests.
struct AcquireResult {
    bool found = false;
    std::string source;          // Upstream base that served the artifact
    int candidates_tried = 0;
    uint64_t bytes = 0;          // Payload bytes stored
    std::string error;           // Validation error, if rejected up front
};

/// "{base}/{name}/{identifier}/{filename}" with each key field escaped.
std::string build_upstream_url(const std::string& base, const SymbolKey& key);

/// Walks the configured upstreams in order until one yields the artifact.
///
/// acquire() is the single place a fetch is finalized: whatever happens the
/// entry ends with in_flight = false, and found = true only after a publish.
class SourceOrchestrator {
public:
    SourceOrchestrator(std::vector<std::string> upstreams, UpstreamFetcher& fetcher,
                       TransferEngine& engine, Ledger& ledger);

    AcquireResult acquire(CacheEntry& entry);

    void set_metrics(MetricsExporter* metrics) { metrics_ = metrics; }

    const std::vector<std::string>& upstreams() const { return upstreams_; }

private:
    /// One upstream. Returns true if the artifact was published.
    bool try_candidate(CacheEntry& entry, const std::string& base, AcquireResult& result);
    void finalize(CacheEntry& entry, bool found);

    std::vector<std::string> upstreams_;
    UpstreamFetcher& fetcher_;
    TransferEngine& engine_;
    Ledger& ledger_;
    MetricsExporter* metrics_ = nullptr;
};

}  // namespace symcache
