#pragma once

#include "symcache/artifact_store.hpp"
#include "symcache/byte_stream.hpp"
#include "symcache/cache_config.hpp"
#include "symcache/ledger.hpp"
#include "symcache/source_orchestrator.hpp"
#include "symcache/transfer_engine.hpp"
#include "symcache/upstream.hpp"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace meridian {
class ThreadPool;
}  // namespace meridian

namespace symcache {

class MetricsExporter;

enum class ResolveStatus {
    Hit,        // Artifact streamed back
    Scheduled,  // Miss; this call started the fetch
    InFlight,   // Miss; a fetch is already running
    Invalid,    // Malformed key
    Error,      // Ledger failure or shutting down
};

const char* resolve_status_name(ResolveStatus status);

struct ResolveResult {
    ResolveStatus status = ResolveStatus::Error;
    std::unique_ptr<ByteStream> stream;  // Set for Hit
    bool compressed = false;             // Stream carries the stored gzip bytes
    std::string error;                   // Set for Invalid and Error
};

/// Cache coordinator: serves hits, schedules one background fetch per
/// missing key and recovers fetches interrupted by a crash.
class SymbolCache {
public:
    explicit SymbolCache(const CacheConfig& config);

    /// Use the given ledger and upstream instead of SQLite and libcurl.
    SymbolCache(const CacheConfig& config, std::unique_ptr<Ledger> ledger,
                std::unique_ptr<UpstreamFetcher> fetcher);

    ~SymbolCache();

    SymbolCache(const SymbolCache&) = delete;
    SymbolCache& operator=(const SymbolCache&) = delete;

    /// Open the ledger, reconcile stale entries, start fetch workers.
    /// Returns error message on failure, empty string on success.
    std::string start();

    /// Graceful shutdown: drain queued fetches, stop workers.
    void stop();

    /// Block until stop() is called (for daemon mode).
    void wait();

    /// Look up a symbol. Never waits for a download.
    ResolveResult resolve(const SymbolKey& key, bool accepts_compressed);

    /// Reset every in-flight entry and delete its temp file.
    /// Returns the number of entries reset.
    size_t reconcile();

    /// Block until no fetch is queued or running.
    void wait_for_fetches();

    std::vector<CacheEntry> list_entries(size_t skip, size_t limit);
    std::optional<LedgerCounts> ledger_counts();
    size_t fetch_pending() const;

    void set_metrics(MetricsExporter* metrics);

    const CacheConfig& config() const { return config_; }
    ArtifactStore& store() { return *store_; }
    bool is_running() const { return running_.load(); }

    struct Stats {
        uint64_t hits = 0;
        uint64_t scheduled = 0;
        uint64_t in_flight = 0;
        uint64_t invalid = 0;
        uint64_t errors = 0;
        uint64_t fetches_completed = 0;
        uint64_t fetches_failed = 0;
        uint64_t bytes_fetched = 0;
        uint64_t reconciled = 0;
    };
    Stats get_stats() const;

private:
    bool schedule_fetch(const CacheEntry& entry);
    void run_fetch(CacheEntry entry);
    void record(ResolveStatus status);

    // Stats reporting
    void stats_reporter_loop();

    CacheConfig config_;

    std::unique_ptr<Ledger> ledger_;
    std::unique_ptr<UpstreamFetcher> fetcher_;
    std::unique_ptr<ArtifactStore> store_;
    std::unique_ptr<TransferEngine> engine_;
    std::unique_ptr<SourceOrchestrator> orchestrator_;
    MetricsExporter* metrics_ = nullptr;

    // Workers
    std::unique_ptr<meridian::ThreadPool> fetch_pool_;
    std::thread stats_thread_;

    // Synchronization
    std::atomic<bool> running_{false};
    std::condition_variable wait_cv_;
    std::mutex wait_mutex_;

    // Stats
    mutable std::mutex stats_mutex_;
    Stats stats_;
};

}  // namespace symcache
