#pragma once

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <thread>

#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>

namespace symcache {

class SymbolCache;

/// RAII timer that observes a histogram with elapsed duration on destruction.
class ScopedTimer {
public:
    explicit ScopedTimer(prometheus::Histogram& histogram)
        : histogram_(histogram)
        , start_(std::chrono::steady_clock::now()) {}

    ~ScopedTimer() {
        auto elapsed = std::chrono::steady_clock::now() - start_;
        double secs = std::chrono::duration<double>(elapsed).count();
        histogram_.Observe(secs);
    }

    ScopedTimer(const ScopedTimer&) = delete;
    ScopedTimer& operator=(const ScopedTimer&) = delete;

private:
    prometheus::Histogram& histogram_;
    std::chrono::steady_clock::time_point start_;
};

/// Exports symcache metrics to a Prometheus textfile for node_exporter pickup.
///
/// Owns a prometheus::Registry with all metric families. A background writer
/// thread periodically serializes the registry to a .prom file using atomic
/// temp+rename.
class MetricsExporter {
public:
    /// @param prom_file_path  Path to the .prom output file.
    /// @param write_interval  How often to write the file (default 15s).
    /// @param labels          Constant labels applied to all metrics.
    MetricsExporter(const std::filesystem::path& prom_file_path,
                    std::chrono::seconds write_interval,
                    const std::map<std::string, std::string>& labels);
    ~MetricsExporter();

    MetricsExporter(const MetricsExporter&) = delete;
    MetricsExporter& operator=(const MetricsExporter&) = delete;

    /// Set pointer for gauge snapshots.
    void set_cache(SymbolCache* cache) { cache_ = cache; }

    /// Start the background writer thread.
    void start();

    /// Stop the background writer thread (writes one final snapshot).
    void stop();

    // --- Counter accessors ---
    prometheus::Counter& requests_hit() { return *requests_hit_; }
    prometheus::Counter& requests_scheduled() { return *requests_scheduled_; }
    prometheus::Counter& requests_in_flight() { return *requests_in_flight_; }
    prometheus::Counter& requests_invalid() { return *requests_invalid_; }
    prometheus::Counter& requests_error() { return *requests_error_; }
    prometheus::Counter& fetches_success() { return *fetches_success_; }
    prometheus::Counter& fetches_failure() { return *fetches_failure_; }
    prometheus::Counter& upstream_ok() { return *upstream_ok_; }
    prometheus::Counter& upstream_not_found() { return *upstream_not_found_; }
    prometheus::Counter& upstream_error() { return *upstream_error_; }
    prometheus::Counter& fetch_bytes_total() { return *fetch_bytes_total_; }
    prometheus::Counter& reconciled_total() { return *reconciled_total_; }

    // --- Histogram accessors ---
    prometheus::Histogram& fetch_duration() { return *fetch_duration_; }
    prometheus::Histogram& request_duration() { return *request_duration_; }

private:
    void writer_loop();
    void update_gauges();
    void write_file();

    std::filesystem::path prom_file_path_;
    std::chrono::seconds write_interval_;

    std::shared_ptr<prometheus::Registry> registry_;

    // Pointer for gauge snapshots (not owned)
    SymbolCache* cache_ = nullptr;

    // --- Counters ---
    prometheus::Counter* requests_hit_;
    prometheus::Counter* requests_scheduled_;
    prometheus::Counter* requests_in_flight_;
    prometheus::Counter* requests_invalid_;
    prometheus::Counter* requests_error_;
    prometheus::Counter* fetches_success_;
    prometheus::Counter* fetches_failure_;
    prometheus::Counter* upstream_ok_;
    prometheus::Counter* upstream_not_found_;
    prometheus::Counter* upstream_error_;
    prometheus::Counter* fetch_bytes_total_;
    prometheus::Counter* reconciled_total_;

    // --- Gauges ---
    prometheus::Gauge* entries_total_;
    prometheus::Gauge* entries_found_;
    prometheus::Gauge* entries_in_flight_;
    prometheus::Gauge* fetch_queue_pending_;

    // --- Histograms ---
    prometheus::Histogram* fetch_duration_;
    prometheus::Histogram* request_duration_;

    // Writer thread
    std::thread writer_thread_;
    std::mutex cv_mutex_;
    std::condition_variable cv_;
    bool running_ = false;
};

}  // namespace symcache
