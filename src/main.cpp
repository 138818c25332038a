#include "symcache/cache_config.hpp"
#include "symcache/log.hpp"
#include "symcache/metrics.hpp"
#include "symcache/request_server.hpp"
#include "symcache/symbol_cache.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <iostream>
#include <memory>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>

namespace {
volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int sig) {
    (void)sig;
    g_shutdown_requested = 1;
}

bool daemonize() {
    pid_t pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);  // Parent exits

    if (setsid() < 0) return false;

    // Second fork to prevent acquiring a controlling terminal
    pid = fork();
    if (pid < 0) return false;
    if (pid > 0) _exit(0);

    // Redirect stdin to /dev/null; stdout/stderr will be redirected
    // to log file after this function returns.
    close(STDIN_FILENO);
    open("/dev/null", O_RDONLY);  // stdin = fd 0

    return true;
}

void write_pid_file(const std::filesystem::path& path) {
    std::ofstream ofs(path);
    if (ofs) {
        ofs << getpid() << "\n";
    }
}
}  // namespace

int main(int argc, char* argv[]) {
    auto config_opt = symcache::CacheConfig::from_args(argc, argv);
    if (!config_opt) {
        return 1;
    }
    auto config = std::move(*config_opt);

    auto err = config.validate();
    if (!err.empty()) {
        std::cerr << "Configuration error: " << err << "\n";
        return 1;
    }

    // Daemonize if requested (before log redirect so we fork first)
    if (config.daemonize) {
        if (!daemonize()) {
            std::cerr << "Failed to daemonize" << std::endl;
            return 1;
        }
    }

    // Redirect log output if log file specified (after daemonize)
    if (!config.log_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.log_file).parent_path(), ec);
        FILE* log = fopen(config.log_file.c_str(), "a");
        if (log) {
            dup2(fileno(log), STDOUT_FILENO);
            dup2(fileno(log), STDERR_FILENO);
            fclose(log);
        }
    }

    symcache::set_verbose(config.verbose);

    std::cout << "symcache starting..." << std::endl;
    std::cout << "  symbol-path: " << config.symbol_path << std::endl;
    std::cout << "  state-dir: " << config.state_dir << std::endl;
    std::cout << "  socket: " << config.socket_path << std::endl;
    for (size_t i = 0; i < config.upstreams.size(); ++i) {
        std::cout << "  upstream[" << i << "]: " << config.upstreams[i] << std::endl;
    }
    std::cout << "  fetch-threads: " << config.fetch_threads << std::endl;
    std::cout << "  chunk-size: " << config.chunk_size << " bytes" << std::endl;
    std::cout << "  max-memory: " << (config.max_memory_bytes / (1024 * 1024)) << " MB" << std::endl;
    std::cout << "  retries: " << config.max_attempts << " attempts, backoff "
              << config.retry_backoff_secs << " s" << std::endl;

    // Create state directory and write PID file
    if (!config.pid_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(
            std::filesystem::path(config.pid_file).parent_path(), ec);
        write_pid_file(config.pid_file);
    }

    // Install signal handlers
    struct sigaction sa;
    sa.sa_handler = signal_handler;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = 0;
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    symcache::SymbolCache cache(config);

    // Metrics exist before start() so reconcile results are counted
    std::unique_ptr<symcache::MetricsExporter> metrics;
    if (!config.metrics_file.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(config.metrics_file.parent_path(), ec);
        metrics = std::make_unique<symcache::MetricsExporter>(
            config.metrics_file, std::chrono::seconds(config.metrics_interval_secs),
            std::map<std::string, std::string>{{"symbol_path", config.symbol_path.string()}});
        metrics->set_cache(&cache);
        cache.set_metrics(metrics.get());
    }

    err = cache.start();
    if (!err.empty()) {
        std::cerr << "Failed to start cache: " << err << std::endl;
        return 1;
    }

    if (metrics) metrics->start();

    symcache::RequestServer server(cache, config.socket_path);
    server.set_metrics(metrics.get());
    err = server.start();
    if (!err.empty()) {
        std::cerr << "Failed to start request server: " << err << std::endl;
        cache.stop();
        if (metrics) metrics->stop();
        return 1;
    }

    std::cout << "symcache running (PID " << getpid() << ")" << std::endl;

    // Wait until shutdown signal, then stop outside signal context.
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    server.stop();
    cache.stop();
    cache.wait();

    if (metrics) metrics->stop();

    // Remove PID file
    if (!config.pid_file.empty()) {
        unlink(config.pid_file.c_str());
    }

    std::cout << "symcache exited cleanly" << std::endl;
    return 0;
}
