#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace symcache {

/// Public symbol servers consulted, in order, when none are configured.
std::vector<std::string> default_upstreams();

/// Configuration for the symbol cache daemon.
///
/// Layers, later wins: built-in defaults, SYMCACHE_* environment variables,
/// JSON file (--config), command-line flags.
struct CacheConfig {
    // Root of the artifact store
    std::filesystem::path symbol_path;

    // Ledger database and socket live here. Default: <symbol_path>/.symcache/
    std::filesystem::path state_dir;

    // Upstream symbol servers, tried in order
    std::vector<std::string> upstreams = default_upstreams();

    // Background fetch workers
    size_t fetch_threads = 8;

    // Transfer tuning
    size_t chunk_size = 2 * 1024 * 1024;                // 2 MiB
    uint64_t max_memory_bytes = 100ULL * 1024 * 1024;   // 100 MiB

    // Upstream retry policy (per candidate)
    int max_attempts = 3;
    double retry_backoff_secs = 0.3;
    std::chrono::seconds request_timeout{30};

    // Request socket. Default: <state_dir>/symcache.sock
    std::filesystem::path socket_path;

    size_t stats_interval_secs = 60;

    // Daemon
    bool daemonize = false;
    bool verbose = false;
    std::filesystem::path pid_file;
    std::filesystem::path log_file;

    // Prometheus metrics (textfile collector)
    std::filesystem::path metrics_file;    // e.g. /var/lib/node_exporter/textfile/symcache.prom
    size_t metrics_interval_secs = 15;

    /// Parse configuration from command line arguments.
    /// Returns empty optional on error (prints usage to stderr).
    static std::optional<CacheConfig> from_args(int argc, char* argv[]);

    /// Overlay SYMCACHE_* environment variables. Returns false on a malformed value.
    bool load_env();

    /// Load configuration from a JSON file, overlaying onto current values.
    bool load_json(const std::filesystem::path& path);

    /// Fill in defaults (state_dir, socket_path) based on symbol_path.
    void apply_defaults();

    /// Validate required fields. Returns error message or empty string.
    std::string validate() const;
};

}  // namespace symcache
