#pragma once

#include "symcache/byte_stream.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <ostream>
#include <span>
#include <vector>

// Forward declarations
struct z_stream_s;
struct gzFile_s;

namespace symcache {

/// Streaming gzip encoder writing into an output stream.
///
/// Memory use is bounded by the internal output buffer; input is consumed
/// as it is written.
class GzipWriter {
public:
    /// Throws std::runtime_error if zlib cannot be initialized.
    explicit GzipWriter(std::ostream& out);
    ~GzipWriter();

    GzipWriter(const GzipWriter&) = delete;
    GzipWriter& operator=(const GzipWriter&) = delete;

    bool write(std::span<const uint8_t> data);

    /// Emit everything buffered so far (Z_SYNC_FLUSH) and flush the stream.
    bool flush();

    /// Write the gzip trailer. No writes are accepted afterwards.
    bool finish();

    uint64_t bytes_in() const { return bytes_in_; }

private:
    bool deflate_into_stream(int flush_mode);

    std::ostream& out_;
    std::unique_ptr<z_stream_s> zs_;
    std::vector<char> buffer_;
    uint64_t bytes_in_ = 0;
    bool finished_ = false;
};

/// Lazily decompresses a gzip artifact in fixed-size reads.
///
/// Stops early with a warning once more than `max_bytes` have been emitted.
class DecompressStream : public ByteStream {
public:
    DecompressStream(const std::filesystem::path& path, size_t chunk_size, uint64_t max_bytes);
    ~DecompressStream() override;

    DecompressStream(const DecompressStream&) = delete;
    DecompressStream& operator=(const DecompressStream&) = delete;

    /// False if the file could not be opened.
    bool is_open() const { return file_ != nullptr; }

    bool next(std::vector<uint8_t>& chunk) override;
    bool failed() const override { return failed_; }

    uint64_t bytes_emitted() const { return emitted_; }
    bool limit_reached() const { return limit_reached_; }

private:
    std::filesystem::path path_;
    gzFile_s* file_ = nullptr;
    size_t chunk_size_;
    uint64_t max_bytes_;
    uint64_t emitted_ = 0;
    bool done_ = false;
    bool failed_ = false;
    bool limit_reached_ = false;
};

}  // namespace symcache
