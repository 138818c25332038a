#include "symcache/gzip_stream.hpp"
#include "symcache/log.hpp"

#include <zlib.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace symcache {

namespace {

constexpr size_t DEFLATE_BUFFER_SIZE = 64 * 1024;

// windowBits 15 + 16 selects the gzip wrapper instead of raw zlib.
constexpr int GZIP_WINDOW_BITS = 15 + 16;

}  // namespace

// ---------------------------------------------------------------------------
// GzipWriter
// ---------------------------------------------------------------------------

GzipWriter::GzipWriter(std::ostream& out)
    : out_(out), zs_(std::make_unique<z_stream>()), buffer_(DEFLATE_BUFFER_SIZE) {
    std::memset(zs_.get(), 0, sizeof(z_stream));
    if (deflateInit2(zs_.get(), Z_DEFAULT_COMPRESSION, Z_DEFLATED, GZIP_WINDOW_BITS, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        throw std::runtime_error("deflateInit2 failed");
    }
}

GzipWriter::~GzipWriter() {
    deflateEnd(zs_.get());
}

bool GzipWriter::deflate_into_stream(int flush_mode) {
    int ret;
    do {
        zs_->next_out = reinterpret_cast<Bytef*>(buffer_.data());
        zs_->avail_out = static_cast<uInt>(buffer_.size());
        ret = deflate(zs_.get(), flush_mode);
        if (ret == Z_STREAM_ERROR) {
            return false;
        }
        size_t produced = buffer_.size() - zs_->avail_out;
        if (produced > 0) {
            out_.write(buffer_.data(), static_cast<std::streamsize>(produced));
            if (!out_) return false;
        }
    } while (zs_->avail_out == 0);

    if (flush_mode == Z_FINISH && ret != Z_STREAM_END) {
        return false;
    }
    return true;
}

bool GzipWriter::write(std::span<const uint8_t> data) {
    if (finished_) return false;

    // avail_in is a uInt; feed very large spans in pieces.
    while (!data.empty()) {
        size_t piece = std::min<size_t>(data.size(), 1u << 30);
        zs_->next_in = const_cast<Bytef*>(data.data());
        zs_->avail_in = static_cast<uInt>(piece);
        if (!deflate_into_stream(Z_NO_FLUSH)) return false;
        bytes_in_ += piece;
        data = data.subspan(piece);
    }
    return true;
}

bool GzipWriter::flush() {
    if (finished_) return false;
    zs_->next_in = nullptr;
    zs_->avail_in = 0;
    if (!deflate_into_stream(Z_SYNC_FLUSH)) return false;
    out_.flush();
    return static_cast<bool>(out_);
}

bool GzipWriter::finish() {
    if (finished_) return true;
    zs_->next_in = nullptr;
    zs_->avail_in = 0;
    finished_ = true;
    if (!deflate_into_stream(Z_FINISH)) return false;
    out_.flush();
    return static_cast<bool>(out_);
}

// ---------------------------------------------------------------------------
// DecompressStream
// ---------------------------------------------------------------------------

DecompressStream::DecompressStream(const std::filesystem::path& path, size_t chunk_size,
                                   uint64_t max_bytes)
    : path_(path), chunk_size_(chunk_size == 0 ? 1 : chunk_size), max_bytes_(max_bytes) {
    file_ = gzopen(path.c_str(), "rb");
    if (!file_) {
        log_error("Failed to open %s for decompression", path.c_str());
        failed_ = true;
        done_ = true;
    }
}

DecompressStream::~DecompressStream() {
    if (file_) {
        gzclose(file_);
    }
}

bool DecompressStream::next(std::vector<uint8_t>& chunk) {
    chunk.clear();
    if (done_) return false;

    if (emitted_ > max_bytes_) {
        log_warn("Decompression of %s stopped after %llu bytes (ceiling %llu bytes)",
                 path_.c_str(), static_cast<unsigned long long>(emitted_),
                 static_cast<unsigned long long>(max_bytes_));
        limit_reached_ = true;
        done_ = true;
        return false;
    }

    // gzread takes an unsigned count; cap each read accordingly.
    size_t want = std::min<size_t>(chunk_size_, 1u << 30);
    chunk.resize(want);
    int n = gzread(file_, chunk.data(), static_cast<unsigned>(want));
    if (n < 0) {
        int errnum = 0;
        const char* msg = gzerror(file_, &errnum);
        log_error("Decompression of %s failed: %s", path_.c_str(), msg ? msg : "unknown error");
        chunk.clear();
        failed_ = true;
        done_ = true;
        return false;
    }
    if (n == 0) {
        chunk.clear();
        done_ = true;
        return false;
    }

    chunk.resize(static_cast<size_t>(n));
    emitted_ += static_cast<uint64_t>(n);
    return true;
}

}  // namespace symcache
