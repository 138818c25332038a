#include "symcache/symbol_cache.hpp"
#include "symcache/log.hpp"
#include "symcache/metrics.hpp"
#include "symcache/sqlite_ledger.hpp"
#include "meridian/core/thread_pool.hpp"

#include <chrono>
#include <stdexcept>

namespace symcache {

using meridian::ThreadPool;

const char* resolve_status_name(ResolveStatus status) {
    switch (status) {
        case ResolveStatus::Hit: return "hit";
        case ResolveStatus::Scheduled: return "scheduled";
        case ResolveStatus::InFlight: return "in_flight";
        case ResolveStatus::Invalid: return "invalid";
        case ResolveStatus::Error: return "error";
    }
    return "error";
}

SymbolCache::SymbolCache(const CacheConfig& config) : config_(config) {}

SymbolCache::SymbolCache(const CacheConfig& config, std::unique_ptr<Ledger> ledger,
                         std::unique_ptr<UpstreamFetcher> fetcher)
    : config_(config), ledger_(std::move(ledger)), fetcher_(std::move(fetcher)) {}

SymbolCache::~SymbolCache() {
    stop();
}

std::string SymbolCache::start() {
    config_.apply_defaults();
    auto err = config_.validate();
    if (!err.empty()) return err;

    std::error_code ec;
    std::filesystem::create_directories(config_.symbol_path, ec);
    if (ec) return "Failed to create symbol_path: " + ec.message();
    std::filesystem::create_directories(config_.state_dir, ec);
    if (ec) return "Failed to create state_dir: " + ec.message();

    if (!ledger_) {
        try {
            ledger_ = std::make_unique<SqliteLedger>(config_.state_dir / "ledger.db");
        } catch (const LedgerError& e) {
            return std::string("Failed to open ledger: ") + e.what();
        }
    }

    if (!fetcher_) {
        UpstreamOptions options;
        options.request_timeout = config_.request_timeout;
        options.max_attempts = config_.max_attempts;
        options.retry_backoff = std::chrono::milliseconds(
            static_cast<long>(config_.retry_backoff_secs * 1000));
        fetcher_ = std::make_unique<HttpUpstreamFetcher>(options);
    }

    store_ = std::make_unique<ArtifactStore>(config_.symbol_path);

    TransferOptions transfer;
    transfer.chunk_size = config_.chunk_size;
    transfer.max_memory_bytes = config_.max_memory_bytes;
    engine_ = std::make_unique<TransferEngine>(*store_, *ledger_, std::move(transfer));

    orchestrator_ = std::make_unique<SourceOrchestrator>(config_.upstreams, *fetcher_, *engine_,
                                                         *ledger_);
    orchestrator_->set_metrics(metrics_);

    // Crash recovery, before any request is accepted
    try {
        reconcile();
    } catch (const LedgerError& e) {
        return std::string("Reconcile failed: ") + e.what();
    }

    log_info("Cache initialized: symbols in %s, %zu upstream(s)",
             config_.symbol_path.c_str(), config_.upstreams.size());

    running_ = true;

    fetch_pool_ = std::make_unique<ThreadPool>(config_.fetch_threads);

    if (config_.stats_interval_secs > 0) {
        stats_thread_ = std::thread(&SymbolCache::stats_reporter_loop, this);
    }

    return {};
}

void SymbolCache::stop() {
    if (!running_.exchange(false)) return;

    log_info("Shutting down cache...");

    if (stats_thread_.joinable()) stats_thread_.join();

    // Let queued fetches finish so no entry is left in flight
    if (fetch_pool_) fetch_pool_->shutdown(true);

    // Signal waiters
    {
        std::lock_guard lock(wait_mutex_);
    }
    wait_cv_.notify_all();

    log_info("Cache stopped");
}

void SymbolCache::wait() {
    std::unique_lock lock(wait_mutex_);
    wait_cv_.wait(lock, [this] { return !running_.load(); });
}

void SymbolCache::set_metrics(MetricsExporter* metrics) {
    metrics_ = metrics;
    if (orchestrator_) orchestrator_->set_metrics(metrics);
}

// --- Requests ---

ResolveResult SymbolCache::resolve(const SymbolKey& key, bool accepts_compressed) {
    ResolveResult result;

    if (!running_.load()) {
        result.status = ResolveStatus::Error;
        result.error = "cache is not running";
        record(result.status);
        return result;
    }

    auto err = validate_key(key);
    if (!err.empty()) {
        result.status = ResolveStatus::Invalid;
        result.error = err;
        record(result.status);
        return result;
    }

    try {
        if (store_->exists(key)) {
            // Read-repair: the ledger may have lost track of a published artifact
            auto entry = ledger_->find_entry(key.identifier, key.filename);
            if (!entry) {
                ledger_->create_entry(key.identifier, key.name, key.filename, true);
                log_info("Registered untracked artifact %s", key.to_string().c_str());
            } else if (!entry->found && !entry->in_flight) {
                entry->found = true;
                ledger_->update_entry(*entry);
            }

            if (accepts_compressed) {
                result.stream = store_->read_compressed(key, config_.chunk_size);
                result.compressed = true;
            } else {
                result.stream = store_->read_decompressed(key, config_.chunk_size,
                                                          config_.max_memory_bytes);
            }
            if (!result.stream) {
                result.status = ResolveStatus::Error;
                result.error = "cannot open artifact";
            } else {
                result.status = ResolveStatus::Hit;
            }
            record(result.status);
            return result;
        }

        auto entry = ledger_->find_entry(key.identifier, key.filename);
        if (!entry) {
            entry = ledger_->create_entry(key.identifier, key.name, key.filename, false);
        }
        // Fetch under the requested name so the artifact lands where it is looked up
        entry->key = key;

        if (entry->in_flight || !ledger_->try_mark_in_flight(*entry)) {
            result.status = ResolveStatus::InFlight;
            record(result.status);
            return result;
        }

        if (!schedule_fetch(*entry)) {
            entry->in_flight = false;
            ledger_->update_entry(*entry);
            result.status = ResolveStatus::Error;
            result.error = "fetch queue is shut down";
            record(result.status);
            return result;
        }

        log_debug("Scheduled fetch of %s", key.to_string().c_str());
        result.status = ResolveStatus::Scheduled;
    } catch (const LedgerError& e) {
        log_error("Ledger failure resolving %s: %s", key.to_string().c_str(), e.what());
        result.status = ResolveStatus::Error;
        result.error = e.what();
    }

    record(result.status);
    return result;
}

void SymbolCache::record(ResolveStatus status) {
    {
        std::lock_guard lock(stats_mutex_);
        switch (status) {
            case ResolveStatus::Hit: stats_.hits++; break;
            case ResolveStatus::Scheduled: stats_.scheduled++; break;
            case ResolveStatus::InFlight: stats_.in_flight++; break;
            case ResolveStatus::Invalid: stats_.invalid++; break;
            case ResolveStatus::Error: stats_.errors++; break;
        }
    }

    if (!metrics_) return;
    switch (status) {
        case ResolveStatus::Hit: metrics_->requests_hit().Increment(); break;
        case ResolveStatus::Scheduled: metrics_->requests_scheduled().Increment(); break;
        case ResolveStatus::InFlight: metrics_->requests_in_flight().Increment(); break;
        case ResolveStatus::Invalid: metrics_->requests_invalid().Increment(); break;
        case ResolveStatus::Error: metrics_->requests_error().Increment(); break;
    }
}

// --- Fetches ---

bool SymbolCache::schedule_fetch(const CacheEntry& entry) {
    if (!fetch_pool_ || !running_.load()) return false;

    try {
        // The returned future is not needed; run_fetch reports its own outcome
        fetch_pool_->submit([this, entry]() { run_fetch(entry); });
    } catch (const std::runtime_error& e) {
        log_warn("Cannot schedule fetch of %s: %s", entry.key.to_string().c_str(), e.what());
        return false;
    }
    return true;
}

void SymbolCache::run_fetch(CacheEntry entry) {
    bool ok = false;
    uint64_t bytes = 0;
    try {
        auto result = orchestrator_->acquire(entry);
        ok = result.found;
        bytes = result.bytes;
    } catch (const std::exception& e) {
        log_error("Fetch of %s failed: %s", entry.key.to_string().c_str(), e.what());
        entry.in_flight = false;
        try {
            ledger_->update_entry(entry);
        } catch (const LedgerError& le) {
            log_error("Failed to reset %s: %s", entry.key.to_string().c_str(), le.what());
        }
    }

    std::lock_guard lock(stats_mutex_);
    if (ok) {
        stats_.fetches_completed++;
        stats_.bytes_fetched += bytes;
    } else {
        stats_.fetches_failed++;
    }
}

void SymbolCache::wait_for_fetches() {
    if (fetch_pool_) fetch_pool_->wait_all();
}

size_t SymbolCache::fetch_pending() const {
    return fetch_pool_ ? fetch_pool_->pending() : 0;
}

// --- Recovery ---

size_t SymbolCache::reconcile() {
    auto stale = ledger_->list_in_flight_entries();

    for (auto& entry : stale) {
        auto err = validate_key(entry.key);
        if (!err.empty()) {
            // Never turn a bad row into a path; just clear the flag
            log_warn("Skipping cleanup of ledger entry %s: %s",
                     entry.key.to_string().c_str(), err.c_str());
            entry.found = false;
            entry.in_flight = false;
            ledger_->update_entry(entry);
            continue;
        }
        {
            std::lock_guard lock(store_->lock_for(entry.key));
            if (store_->discard_temp(entry.key)) {
                log_info("Removed partial download %s", store_->temp_path(entry.key).c_str());
            }
            entry.found = store_->exists(entry.key);
        }
        entry.in_flight = false;
        ledger_->update_entry(entry);
    }

    log_info("Crash recovery: reset %zu in-flight entries", stale.size());

    {
        std::lock_guard lock(stats_mutex_);
        stats_.reconciled += stale.size();
    }
    if (metrics_) metrics_->reconciled_total().Increment(static_cast<double>(stale.size()));

    return stale.size();
}

// --- Listing ---

std::vector<CacheEntry> SymbolCache::list_entries(size_t skip, size_t limit) {
    return ledger_->list_entries(skip, limit);
}

std::optional<LedgerCounts> SymbolCache::ledger_counts() {
    if (!ledger_) return std::nullopt;
    try {
        return ledger_->counts();
    } catch (const LedgerError& e) {
        log_warn("Cannot read ledger counts: %s", e.what());
        return std::nullopt;
    }
}

// --- Stats ---

SymbolCache::Stats SymbolCache::get_stats() const {
    std::lock_guard lock(stats_mutex_);
    return stats_;
}

void SymbolCache::stats_reporter_loop() {
    while (running_.load(std::memory_order_relaxed)) {
        for (size_t i = 0; i < config_.stats_interval_secs && running_.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }
        if (!running_.load()) break;

        auto counts = ledger_counts().value_or(LedgerCounts{});
        auto s = get_stats();

        using ull = unsigned long long;
        log_info("[stats] entries: %llu total, %llu found, %llu in flight | requests: %llu hit, "
                 "%llu scheduled, %llu in flight, %llu invalid, %llu error | fetches: %llu ok, "
                 "%llu fail, %llu bytes | queue: %zu",
                 static_cast<ull>(counts.total), static_cast<ull>(counts.found),
                 static_cast<ull>(counts.in_flight), static_cast<ull>(s.hits),
                 static_cast<ull>(s.scheduled), static_cast<ull>(s.in_flight),
                 static_cast<ull>(s.invalid), static_cast<ull>(s.errors),
                 static_cast<ull>(s.fetches_completed), static_cast<ull>(s.fetches_failed),
                 static_cast<ull>(s.bytes_fetched), fetch_pending());
    }
}

}  // namespace symcache
