#include "symcache/metrics.hpp"
#include "symcache/log.hpp"
#include "symcache/symbol_cache.hpp"

#include <fstream>
#include <prometheus/text_serializer.h>

namespace symcache {

MetricsExporter::MetricsExporter(const std::filesystem::path& prom_file_path,
                                 std::chrono::seconds write_interval,
                                 const std::map<std::string, std::string>& labels)
    : prom_file_path_(prom_file_path)
    , write_interval_(write_interval)
    , registry_(std::make_shared<prometheus::Registry>()) {

    // --- Counters ---

    auto& requests_family = prometheus::BuildCounter()
        .Name("symcache_requests_total")
        .Help("Symbol requests by outcome")
        .Labels(labels)
        .Register(*registry_);
    requests_hit_ = &requests_family.Add({{"result", "hit"}});
    requests_scheduled_ = &requests_family.Add({{"result", "scheduled"}});
    requests_in_flight_ = &requests_family.Add({{"result", "in_flight"}});
    requests_invalid_ = &requests_family.Add({{"result", "invalid"}});
    requests_error_ = &requests_family.Add({{"result", "error"}});

    auto& fetches_family = prometheus::BuildCounter()
        .Name("symcache_fetches_total")
        .Help("Background fetches completed")
        .Labels(labels)
        .Register(*registry_);
    fetches_success_ = &fetches_family.Add({{"result", "success"}});
    fetches_failure_ = &fetches_family.Add({{"result", "failure"}});

    auto& upstream_family = prometheus::BuildCounter()
        .Name("symcache_upstream_responses_total")
        .Help("Final upstream responses per candidate")
        .Labels(labels)
        .Register(*registry_);
    upstream_ok_ = &upstream_family.Add({{"result", "ok"}});
    upstream_not_found_ = &upstream_family.Add({{"result", "not_found"}});
    upstream_error_ = &upstream_family.Add({{"result", "error"}});

    fetch_bytes_total_ = &prometheus::BuildCounter()
        .Name("symcache_fetch_bytes_total")
        .Help("Total payload bytes stored from upstreams")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    reconciled_total_ = &prometheus::BuildCounter()
        .Name("symcache_reconciled_total")
        .Help("Stale in-flight entries reset at startup")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Gauges ---

    auto& entries_family = prometheus::BuildGauge()
        .Name("symcache_entries")
        .Help("Ledger entries by state")
        .Labels(labels)
        .Register(*registry_);
    entries_total_ = &entries_family.Add({{"state", "total"}});
    entries_found_ = &entries_family.Add({{"state", "found"}});
    entries_in_flight_ = &entries_family.Add({{"state", "in_flight"}});

    fetch_queue_pending_ = &prometheus::BuildGauge()
        .Name("symcache_fetch_queue_pending")
        .Help("Fetches waiting for a worker")
        .Labels(labels)
        .Register(*registry_)
        .Add({});

    // --- Histograms ---

    fetch_duration_ = &prometheus::BuildHistogram()
        .Name("symcache_fetch_duration_seconds")
        .Help("Background fetch duration across all upstreams in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.1, 0.5, 1, 5, 10, 30, 60, 120, 300, 600});

    request_duration_ = &prometheus::BuildHistogram()
        .Name("symcache_request_duration_seconds")
        .Help("Socket request duration in seconds")
        .Labels(labels)
        .Register(*registry_)
        .Add({}, prometheus::Histogram::BucketBoundaries{
            0.001, 0.005, 0.01, 0.05, 0.1, 0.5, 1, 5, 10, 30});
}

MetricsExporter::~MetricsExporter() {
    stop();
}

void MetricsExporter::start() {
    {
        std::lock_guard lock(cv_mutex_);
        if (running_) return;
        running_ = true;
    }
    writer_thread_ = std::thread(&MetricsExporter::writer_loop, this);
}

void MetricsExporter::stop() {
    bool was_running = false;
    {
        std::lock_guard lock(cv_mutex_);
        was_running = running_;
        running_ = false;
    }
    if (was_running) {
        cv_.notify_all();
        if (writer_thread_.joinable()) {
            writer_thread_.join();
        }
    }
    // Always write a final snapshot
    update_gauges();
    write_file();
}

void MetricsExporter::writer_loop() {
    while (true) {
        {
            std::unique_lock lock(cv_mutex_);
            cv_.wait_for(lock, write_interval_, [this] { return !running_; });
            if (!running_) break;
        }
        update_gauges();
        write_file();
    }
}

void MetricsExporter::update_gauges() {
    if (!cache_) return;

    auto counts = cache_->ledger_counts();
    if (counts) {
        entries_total_->Set(static_cast<double>(counts->total));
        entries_found_->Set(static_cast<double>(counts->found));
        entries_in_flight_->Set(static_cast<double>(counts->in_flight));
    }
    fetch_queue_pending_->Set(static_cast<double>(cache_->fetch_pending()));
}

void MetricsExporter::write_file() {
    auto tmp_path = prom_file_path_;
    tmp_path += ".tmp";

    prometheus::TextSerializer serializer;
    auto metrics = registry_->Collect();

    std::ofstream ofs(tmp_path, std::ios::trunc);
    if (!ofs) {
        log_warn("Cannot write metrics to %s", tmp_path.c_str());
        return;
    }
    ofs << serializer.Serialize(metrics);
    ofs.close();
    if (!ofs.good()) return;

    std::error_code ec;
    std::filesystem::rename(tmp_path, prom_file_path_, ec);
}

}  // namespace symcache
