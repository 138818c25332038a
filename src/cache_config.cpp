#include "symcache/cache_config.hpp"

#include <cstdlib>
#include <cstring>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>

namespace symcache {

std::vector<std::string> default_upstreams() {
    return {
        "http://msdl.microsoft.com/download/symbols",
        "http://chromium-browser-symsrv.commondatastorage.googleapis.com",
        "http://symbols.mozilla.org",
        "http://symbols.mozilla.org/try",
    };
}

namespace {

void print_usage() {
    std::cerr <<
        "Usage: symcache --symbol-path <path> [options]\n"
        "\n"
        "Required:\n"
        "  --symbol-path <path>             Directory holding cached symbol artifacts\n"
        "\n"
        "Upstreams:\n"
        "  --upstream <url>                 Symbol server base URL, tried in order.\n"
        "                                   Repeatable; replaces the built-in list.\n"
        "  --max-retries <N>                Attempts per upstream (default: 3)\n"
        "  --retry-backoff <secs>           Initial retry delay, doubled per attempt (default: 0.3)\n"
        "  --request-timeout <secs>         Connect and stall timeout per upstream (default: 30)\n"
        "\n"
        "Cache options:\n"
        "  --config <path>                  JSON config file\n"
        "  --state-dir <path>               Ledger and socket directory (default: <symbol-path>/.symcache)\n"
        "  --socket-path <path>             Request socket (default: <state-dir>/symcache.sock)\n"
        "  --fetch-threads <N>              Background fetch workers (default: 8)\n"
        "  --chunk-size <bytes>             Transfer chunk size (default: 2097152)\n"
        "  --max-memory-mb <N>              Buffer ceiling in MB (default: 100)\n"
        "  --daemon                         Run as daemon\n"
        "  --verbose                        Verbose output\n"
        "  --pid-file <path>                PID file path\n"
        "  --log-file <path>                Log file path\n"
        "  --stats-interval <secs>          Stats reporting interval (default: 60)\n"
        "  --metrics-file <path>            Prometheus .prom file for node_exporter textfile collector\n"
        "  --metrics-interval <secs>        Metrics write interval (default: 15)\n"
        "  --help                           Show this help\n"
        "\n"
        "Environment:\n"
        "  SYMCACHE_CHUNK_SIZE, SYMCACHE_MAX_MEMORY_MB, SYMCACHE_MAX_RETRIES, SYMCACHE_RETRY_BACKOFF\n";
}

}  // namespace

std::optional<CacheConfig> CacheConfig::from_args(int argc, char* argv[]) {
    CacheConfig config;

    if (!config.load_env()) return std::nullopt;

    auto next_arg = [&](int& i, const char* name) -> const char* {
        if (i + 1 >= argc) {
            std::cerr << "Error: " << name << " requires an argument\n";
            return nullptr;
        }
        return argv[++i];
    };

    // The JSON file sits below the command line, wherever --config appears.
    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "--config") == 0) {
            auto* v = next_arg(i, "--config");
            if (!v) return std::nullopt;
            if (!config.load_json(v)) return std::nullopt;
        }
    }

    bool upstreams_from_cli = false;
    std::string arg;
    try {
        for (int i = 1; i < argc; ++i) {
            arg = argv[i];

            if (arg == "--config") {
                ++i;  // Already loaded
            } else if (arg == "--symbol-path") {
                auto* v = next_arg(i, "--symbol-path");
                if (!v) return std::nullopt;
                config.symbol_path = v;
            } else if (arg == "--state-dir") {
                auto* v = next_arg(i, "--state-dir");
                if (!v) return std::nullopt;
                config.state_dir = v;
            } else if (arg == "--upstream") {
                auto* v = next_arg(i, "--upstream");
                if (!v) return std::nullopt;
                if (!upstreams_from_cli) {
                    config.upstreams.clear();
                    upstreams_from_cli = true;
                }
                config.upstreams.push_back(v);
            } else if (arg == "--fetch-threads") {
                auto* v = next_arg(i, "--fetch-threads");
                if (!v) return std::nullopt;
                config.fetch_threads = std::stoull(v);
            } else if (arg == "--chunk-size") {
                auto* v = next_arg(i, "--chunk-size");
                if (!v) return std::nullopt;
                config.chunk_size = std::stoull(v);
            } else if (arg == "--max-memory-mb") {
                auto* v = next_arg(i, "--max-memory-mb");
                if (!v) return std::nullopt;
                config.max_memory_bytes = std::stoull(v) * 1024ULL * 1024;
            } else if (arg == "--max-retries") {
                auto* v = next_arg(i, "--max-retries");
                if (!v) return std::nullopt;
                config.max_attempts = std::stoi(v);
            } else if (arg == "--retry-backoff") {
                auto* v = next_arg(i, "--retry-backoff");
                if (!v) return std::nullopt;
                config.retry_backoff_secs = std::stod(v);
            } else if (arg == "--request-timeout") {
                auto* v = next_arg(i, "--request-timeout");
                if (!v) return std::nullopt;
                config.request_timeout = std::chrono::seconds(std::stoull(v));
            } else if (arg == "--socket-path") {
                auto* v = next_arg(i, "--socket-path");
                if (!v) return std::nullopt;
                config.socket_path = v;
            } else if (arg == "--daemon") {
                config.daemonize = true;
            } else if (arg == "--verbose") {
                config.verbose = true;
            } else if (arg == "--pid-file") {
                auto* v = next_arg(i, "--pid-file");
                if (!v) return std::nullopt;
                config.pid_file = v;
            } else if (arg == "--log-file") {
                auto* v = next_arg(i, "--log-file");
                if (!v) return std::nullopt;
                config.log_file = v;
            } else if (arg == "--stats-interval") {
                auto* v = next_arg(i, "--stats-interval");
                if (!v) return std::nullopt;
                config.stats_interval_secs = std::stoull(v);
            } else if (arg == "--metrics-file") {
                auto* v = next_arg(i, "--metrics-file");
                if (!v) return std::nullopt;
                config.metrics_file = v;
            } else if (arg == "--metrics-interval") {
                auto* v = next_arg(i, "--metrics-interval");
                if (!v) return std::nullopt;
                config.metrics_interval_secs = std::stoull(v);
            } else if (arg == "--help" || arg == "-h") {
                print_usage();
                return std::nullopt;
            } else {
                std::cerr << "Error: unknown option: " << arg << "\n";
                return std::nullopt;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Error: invalid value for " << arg << "\n";
        return std::nullopt;
    }

    config.apply_defaults();
    return config;
}

bool CacheConfig::load_env() {
    const char* name = nullptr;
    try {
        if (const char* v = std::getenv(name = "SYMCACHE_CHUNK_SIZE")) {
            chunk_size = std::stoull(v);
        }
        if (const char* v = std::getenv(name = "SYMCACHE_MAX_MEMORY_MB")) {
            max_memory_bytes = std::stoull(v) * 1024ULL * 1024;
        }
        if (const char* v = std::getenv(name = "SYMCACHE_MAX_RETRIES")) {
            max_attempts = std::stoi(v);
        }
        if (const char* v = std::getenv(name = "SYMCACHE_RETRY_BACKOFF")) {
            retry_backoff_secs = std::stod(v);
        }
    } catch (const std::exception&) {
        std::cerr << "Error: invalid value in " << name << "\n";
        return false;
    }
    return true;
}

bool CacheConfig::load_json(const std::filesystem::path& path) {
    try {
        std::ifstream ifs(path);
        if (!ifs) {
            std::cerr << "Error: cannot open config file: " << path << "\n";
            return false;
        }
        auto j = nlohmann::json::parse(ifs);

        if (j.contains("symbol_path")) symbol_path = j["symbol_path"].get<std::string>();
        if (j.contains("state_dir")) state_dir = j["state_dir"].get<std::string>();
        if (j.contains("upstreams")) {
            upstreams = j["upstreams"].get<std::vector<std::string>>();
        }
        if (j.contains("fetch_threads")) fetch_threads = j["fetch_threads"].get<size_t>();
        if (j.contains("chunk_size")) chunk_size = j["chunk_size"].get<size_t>();
        if (j.contains("max_memory_mb"))
            max_memory_bytes = j["max_memory_mb"].get<uint64_t>() * 1024ULL * 1024;
        if (j.contains("max_retries")) max_attempts = j["max_retries"].get<int>();
        if (j.contains("retry_backoff")) retry_backoff_secs = j["retry_backoff"].get<double>();
        if (j.contains("request_timeout"))
            request_timeout = std::chrono::seconds(j["request_timeout"].get<uint64_t>());
        if (j.contains("socket_path")) socket_path = j["socket_path"].get<std::string>();
        if (j.contains("verbose")) verbose = j["verbose"].get<bool>();
        if (j.contains("stats_interval")) stats_interval_secs = j["stats_interval"].get<size_t>();
        if (j.contains("metrics_file")) metrics_file = j["metrics_file"].get<std::string>();
        if (j.contains("metrics_interval")) metrics_interval_secs = j["metrics_interval"].get<size_t>();

        return true;
    } catch (const std::exception& e) {
        std::cerr << "Error parsing config: " << e.what() << "\n";
        return false;
    }
}

void CacheConfig::apply_defaults() {
    if (state_dir.empty() && !symbol_path.empty()) {
        state_dir = symbol_path / ".symcache";
    }
    if (socket_path.empty() && !state_dir.empty()) {
        socket_path = state_dir / "symcache.sock";
    }
}

std::string CacheConfig::validate() const {
    if (symbol_path.empty()) return "symbol_path is required (--symbol-path)";
    if (upstreams.empty()) return "at least one upstream is required (--upstream)";
    for (const auto& url : upstreams) {
        if (url.compare(0, 7, "http://") != 0 && url.compare(0, 8, "https://") != 0) {
            return "upstream must be an http:// or https:// URL: " + url;
        }
    }
    if (fetch_threads == 0) return "fetch_threads must be > 0";
    if (chunk_size == 0) return "chunk_size must be > 0";
    if (max_memory_bytes == 0) return "max_memory_mb must be > 0";
    if (max_attempts <= 0) return "max_retries must be > 0";
    if (retry_backoff_secs < 0) return "retry_backoff must be >= 0";
    return {};
}

}  // namespace symcache
