#include "symcache/artifact_store.hpp"
#include "symcache/log.hpp"

#include <stdexcept>
#include <system_error>
#include <vector>

namespace symcache {

namespace {

/// Reads a file as-is in fixed-size chunks.
class FileStream : public ByteStream {
public:
    FileStream(const std::filesystem::path& path, size_t chunk_size)
        : file_(path, std::ios::binary), chunk_size_(chunk_size == 0 ? 1 : chunk_size) {}

    bool is_open() const { return file_.is_open(); }

    bool next(std::vector<uint8_t>& chunk) override {
        chunk.clear();
        if (done_) return false;

        chunk.resize(chunk_size_);
        file_.read(reinterpret_cast<char*>(chunk.data()),
                   static_cast<std::streamsize>(chunk_size_));
        auto n = file_.gcount();
        if (file_.bad()) {
            failed_ = true;
            done_ = true;
            chunk.clear();
            return false;
        }
        if (n <= 0) {
            done_ = true;
            chunk.clear();
            return false;
        }
        chunk.resize(static_cast<size_t>(n));
        if (file_.eof()) done_ = true;
        return true;
    }

    bool failed() const override { return failed_; }

private:
    std::ifstream file_;
    size_t chunk_size_;
    bool done_ = false;
    bool failed_ = false;
};

}  // namespace

// ---------------------------------------------------------------------------
// ArtifactWriter
// ---------------------------------------------------------------------------

ArtifactWriter::ArtifactWriter(std::filesystem::path final_path,
                               std::filesystem::path temp_path, bool precompressed)
    : final_path_(std::move(final_path)), temp_path_(std::move(temp_path)) {
    file_.open(temp_path_, std::ios::binary | std::ios::trunc);
    if (!file_) {
        return;
    }
    if (!precompressed) {
        gzip_ = std::make_unique<GzipWriter>(file_);
    }
    open_ = true;
}

ArtifactWriter::~ArtifactWriter() {
    if (!done_) {
        discard();
    }
}

bool ArtifactWriter::write(std::span<const uint8_t> data) {
    if (!open_ || done_) return false;

    if (gzip_) {
        if (!gzip_->write(data)) return false;
    } else {
        file_.write(reinterpret_cast<const char*>(data.data()),
                    static_cast<std::streamsize>(data.size()));
        if (!file_) return false;
    }
    bytes_written_ += data.size();
    return true;
}

bool ArtifactWriter::flush() {
    if (!open_ || done_) return false;
    if (gzip_) {
        return gzip_->flush();
    }
    file_.flush();
    return static_cast<bool>(file_);
}

std::string ArtifactWriter::commit() {
    if (!open_) return "temp file was never opened";
    if (done_) return "writer already closed";

    if (gzip_ && !gzip_->finish()) {
        discard();
        return "failed to finish gzip stream";
    }
    gzip_.reset();

    file_.close();
    if (file_.fail()) {
        discard();
        return "failed to close " + temp_path_.string();
    }

    std::error_code ec;
    std::filesystem::rename(temp_path_, final_path_, ec);
    if (ec) {
        discard();
        return "failed to rename " + temp_path_.string() + ": " + ec.message();
    }

    done_ = true;
    return "";
}

void ArtifactWriter::discard() {
    done_ = true;
    gzip_.reset();
    if (file_.is_open()) {
        file_.close();
    }

    std::error_code ec;
    std::filesystem::remove(temp_path_, ec);
    if (ec) {
        log_warn("Failed to remove temp file %s: %s", temp_path_.c_str(), ec.message().c_str());
    }
}

// ---------------------------------------------------------------------------
// ArtifactStore
// ---------------------------------------------------------------------------

ArtifactStore::ArtifactStore(std::filesystem::path root)
    : root_(std::move(root)) {}

std::filesystem::path ArtifactStore::directory_for(const SymbolKey& key) const {
    return root_ / key.name / key.identifier;
}

std::filesystem::path ArtifactStore::artifact_path(const SymbolKey& key) const {
    return directory_for(key) / (key.filename + ARTIFACT_SUFFIX);
}

std::filesystem::path ArtifactStore::temp_path(const SymbolKey& key) const {
    return directory_for(key) / (std::string(TEMP_PREFIX) + key.filename + ARTIFACT_SUFFIX);
}

bool ArtifactStore::exists(const SymbolKey& key) const {
    std::error_code ec;
    return std::filesystem::is_regular_file(artifact_path(key), ec);
}

std::unique_ptr<ByteStream> ArtifactStore::read_compressed(const SymbolKey& key,
                                                           size_t chunk_size) const {
    auto stream = std::make_unique<FileStream>(artifact_path(key), chunk_size);
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

std::unique_ptr<ByteStream> ArtifactStore::read_decompressed(const SymbolKey& key,
                                                             size_t chunk_size,
                                                             uint64_t max_bytes) const {
    auto path = artifact_path(key);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return nullptr;
    }
    auto stream = std::make_unique<DecompressStream>(path, chunk_size, max_bytes);
    if (!stream->is_open()) {
        return nullptr;
    }
    return stream;
}

std::mutex& ArtifactStore::lock_for(const SymbolKey& key) {
    auto dir = directory_for(key).string();

    std::lock_guard<std::mutex> lock(locks_mutex_);
    auto& slot = locks_[dir];
    if (!slot) {
        slot = std::make_unique<std::mutex>();
    }
    return *slot;
}

size_t ArtifactStore::lock_count() const {
    std::lock_guard<std::mutex> lock(locks_mutex_);
    return locks_.size();
}

std::unique_ptr<ArtifactWriter> ArtifactStore::begin_write(const SymbolKey& key,
                                                           bool precompressed,
                                                           std::string& error) {
    std::error_code ec;
    std::filesystem::create_directories(directory_for(key), ec);
    if (ec) {
        error = "failed to create " + directory_for(key).string() + ": " + ec.message();
        return nullptr;
    }

    auto writer = std::make_unique<ArtifactWriter>(artifact_path(key), temp_path(key),
                                                   precompressed);
    if (!writer->is_open()) {
        error = "failed to open " + temp_path(key).string();
        return nullptr;
    }
    return writer;
}

bool ArtifactStore::discard_temp(const SymbolKey& key) {
    std::error_code ec;
    bool removed = std::filesystem::remove(temp_path(key), ec);
    if (ec) {
        log_warn("Failed to remove temp file %s: %s", temp_path(key).c_str(),
                 ec.message().c_str());
        return false;
    }
    return removed;
}

}  // namespace symcache
