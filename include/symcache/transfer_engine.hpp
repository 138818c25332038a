#pragma once

#include "symcache/artifact_store.hpp"
#include "symcache/http.hpp"
#include "symcache/ledger.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace symcache {

constexpr size_t DEFAULT_CHUNK_SIZE = 2 * 1024 * 1024;
constexpr uint64_t DEFAULT_MAX_MEMORY_BYTES = 100ull * 1024 * 1024;

/// Progress is reported at every multiple of this many percent.
constexpr int PROGRESS_STEP_PERCENT = 5;

struct TransferOptions {
    size_t chunk_size = DEFAULT_CHUNK_SIZE;
    uint64_t max_memory_bytes = DEFAULT_MAX_MEMORY_BYTES;

    // Called with 0, 5, ..., 100 as boundaries are crossed
    std::function<void(const SymbolKey& key, int percent)> on_progress;
};

/// Declared payload size from Content-Length, falling back to
/// x-goog-stored-content-length.
std::optional<uint64_t> declared_size(const HttpHeaders& headers);

/// True if Content-Encoding names gzip.
bool is_gzip_encoded(const HttpHeaders& headers);

class TransferEngine;

/// Streams one 200 response body into the artifact store.
///
/// Holds the per-key lock from creation until commit() or abort(). Bytes
/// past the declared size are ignored. Destroying an unfinished session
/// aborts it.
class TransferSession {
public:
    TransferSession(TransferEngine& engine, CacheEntry& entry,
                    std::unique_lock<std::mutex> key_lock,
                    std::unique_ptr<ArtifactWriter> writer,
                    uint64_t expected_bytes, bool precompressed);
    ~TransferSession();

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    /// Append response bytes. Returns false once the session has failed.
    bool push(std::span<const uint8_t> data);

    /// Publish the artifact. Fails (and aborts) if fewer bytes than
    /// declared were received or the rename fails.
    bool commit();

    /// Finalize the entry as not in flight and delete the temp file.
    void abort(const std::string& reason);

    bool finished() const { return finished_; }
    bool precompressed() const { return precompressed_; }
    uint64_t expected_bytes() const { return expected_bytes_; }
    uint64_t received_bytes() const { return received_bytes_; }
    const std::string& error() const { return error_; }

private:
    bool write_pending();
    void report_progress();

    TransferEngine& engine_;
    CacheEntry& entry_;
    std::unique_lock<std::mutex> key_lock_;
    std::unique_ptr<ArtifactWriter> writer_;

    uint64_t expected_bytes_;
    uint64_t received_bytes_ = 0;
    uint64_t unflushed_bytes_ = 0;
    bool precompressed_;
    std::vector<uint8_t> pending_;
    int last_bucket_ = -1;

    bool finished_ = false;
    std::string error_;
};

/// Bounded-memory writer of upstream responses into the artifact store.
class TransferEngine {
public:
    TransferEngine(ArtifactStore& store, Ledger& ledger, TransferOptions options = {});

    /// Start storing a 200 response for `entry`.
    ///
    /// Returns nullptr and sets `error` when the response declares no size
    /// or the temp file cannot be created; the entry is then finalized as
    /// not in flight and no temp file is left behind.
    std::unique_ptr<TransferSession> begin(CacheEntry& entry, const HttpHeaders& headers,
                                           std::string& error);

    /// Persist in_flight = false for `entry`, logging ledger failures.
    void finalize_not_in_flight(CacheEntry& entry);

    const TransferOptions& options() const { return options_; }
    ArtifactStore& store() { return store_; }

private:
    ArtifactStore& store_;
    Ledger& ledger_;
    TransferOptions options_;
};

}  // namespace symcache
