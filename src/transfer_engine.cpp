#include "symcache/transfer_engine.hpp"
#include "symcache/log.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace symcache {

std::optional<uint64_t> declared_size(const HttpHeaders& headers) {
    if (auto length = headers.content_length()) {
        return length;
    }
    if (auto stored = headers.get("x-goog-stored-content-length")) {
        try {
            return std::stoull(*stored);
        } catch (const std::exception&) {
            log_warn("Ignoring malformed x-goog-stored-content-length: %s", stored->c_str());
        }
    }
    return std::nullopt;
}

bool is_gzip_encoded(const HttpHeaders& headers) {
    auto encoding = headers.get("Content-Encoding");
    if (!encoding) return false;

    std::string lower = *encoding;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return lower.find("gzip") != std::string::npos;
}

// ============================================================================
// TransferSession
// ============================================================================

TransferSession::TransferSession(TransferEngine& engine, CacheEntry& entry,
                                 std::unique_lock<std::mutex> key_lock,
                                 std::unique_ptr<ArtifactWriter> writer,
                                 uint64_t expected_bytes, bool precompressed)
    : engine_(engine),
      entry_(entry),
      key_lock_(std::move(key_lock)),
      writer_(std::move(writer)),
      expected_bytes_(expected_bytes),
      precompressed_(precompressed) {
    pending_.reserve(static_cast<size_t>(
        std::min<uint64_t>(engine_.options().chunk_size, expected_bytes_)));
    report_progress();
}

TransferSession::~TransferSession() {
    if (!finished_) {
        abort("transfer ended before completion");
    }
}

bool TransferSession::push(std::span<const uint8_t> data) {
    if (finished_) return false;

    uint64_t remaining = expected_bytes_ - received_bytes_;
    size_t take = static_cast<size_t>(std::min<uint64_t>(data.size(), remaining));
    if (take == 0) {
        return true;
    }

    pending_.insert(pending_.end(), data.begin(), data.begin() + take);
    received_bytes_ += take;

    if (pending_.size() >= engine_.options().chunk_size && !write_pending()) {
        abort("failed to write " + writer_->temp_path().string());
        return false;
    }

    report_progress();
    return true;
}

bool TransferSession::write_pending() {
    if (pending_.empty()) return true;

    if (!writer_->write(pending_)) {
        return false;
    }
    unflushed_bytes_ += pending_.size();
    pending_.clear();

    if (unflushed_bytes_ > engine_.options().max_memory_bytes) {
        if (!writer_->flush()) {
            return false;
        }
        unflushed_bytes_ = 0;
    }
    return true;
}

void TransferSession::report_progress() {
    int percent = expected_bytes_ == 0
                      ? 100
                      : static_cast<int>(received_bytes_ * 100 / expected_bytes_);
    int bucket = percent / PROGRESS_STEP_PERCENT;
    if (bucket <= last_bucket_) return;

    last_bucket_ = bucket;
    int reported = bucket * PROGRESS_STEP_PERCENT;
    log_info("Downloading %s: %d%% (%llu/%llu bytes)", entry_.key.to_string().c_str(), reported,
             static_cast<unsigned long long>(received_bytes_),
             static_cast<unsigned long long>(expected_bytes_));

    if (engine_.options().on_progress) {
        engine_.options().on_progress(entry_.key, reported);
    }
}

bool TransferSession::commit() {
    if (finished_) return false;

    if (received_bytes_ < expected_bytes_) {
        abort("short body: received " + std::to_string(received_bytes_) + " of " +
              std::to_string(expected_bytes_) + " bytes");
        return false;
    }

    if (!write_pending()) {
        abort("failed to write " + writer_->temp_path().string());
        return false;
    }

    std::string err = writer_->commit();
    if (!err.empty()) {
        abort(err);
        return false;
    }

    finished_ = true;
    key_lock_.unlock();
    return true;
}

void TransferSession::abort(const std::string& reason) {
    if (finished_) return;
    finished_ = true;
    error_ = reason;

    log_warn("Transfer of %s failed: %s", entry_.key.to_string().c_str(), reason.c_str());

    if (writer_) {
        writer_->discard();
        writer_.reset();
    }
    if (key_lock_.owns_lock()) {
        key_lock_.unlock();
    }
    engine_.finalize_not_in_flight(entry_);
}

// ============================================================================
// TransferEngine
// ============================================================================

TransferEngine::TransferEngine(ArtifactStore& store, Ledger& ledger, TransferOptions options)
    : store_(store), ledger_(ledger), options_(std::move(options)) {
    if (options_.chunk_size == 0) {
        options_.chunk_size = DEFAULT_CHUNK_SIZE;
    }
}

std::unique_ptr<TransferSession> TransferEngine::begin(CacheEntry& entry,
                                                       const HttpHeaders& headers,
                                                       std::string& error) {
    std::unique_lock<std::mutex> key_lock(store_.lock_for(entry.key));

    auto size = declared_size(headers);
    std::unique_ptr<ArtifactWriter> writer;
    if (!size) {
        error = "response carries neither Content-Length nor x-goog-stored-content-length";
    } else {
        try {
            writer = store_.begin_write(entry.key, is_gzip_encoded(headers), error);
        } catch (const std::exception& e) {
            error = e.what();
        }
    }

    if (!writer) {
        store_.discard_temp(entry.key);
        key_lock.unlock();
        finalize_not_in_flight(entry);
        return nullptr;
    }

    return std::make_unique<TransferSession>(*this, entry, std::move(key_lock), std::move(writer),
                                             *size, is_gzip_encoded(headers));
}

void TransferEngine::finalize_not_in_flight(CacheEntry& entry) {
    entry.in_flight = false;
    try {
        ledger_.update_entry(entry);
    } catch (const LedgerError& e) {
        log_error("Failed to update ledger for %s: %s", entry.key.to_string().c_str(), e.what());
    }
}

}  // namespace symcache
