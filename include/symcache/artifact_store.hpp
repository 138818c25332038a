#pragma once

#include "symcache/byte_stream.hpp"
#include "symcache/gzip_stream.hpp"
#include "symcache/symbol_key.hpp"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <mutex>
#include <span>
#include <string>

namespace symcache {

/// Suffix of every stored artifact. Artifacts are always gzip data.
constexpr const char* ARTIFACT_SUFFIX = ".compressed";

/// Prefix of the in-progress file next to the final artifact.
constexpr const char* TEMP_PREFIX = "tmp_";

/// Writes one artifact to its temp file and publishes it by rename.
///
/// If neither commit() nor discard() is called the temp file is removed
/// on destruction, so the final path never names a partial artifact.
class ArtifactWriter {
public:
    ArtifactWriter(std::filesystem::path final_path, std::filesystem::path temp_path,
                   bool precompressed);
    ~ArtifactWriter();

    ArtifactWriter(const ArtifactWriter&) = delete;
    ArtifactWriter& operator=(const ArtifactWriter&) = delete;

    /// False if the temp file could not be created.
    bool is_open() const { return open_; }

    /// Append payload bytes. Compressed on the fly unless the writer was
    /// created for pre-compressed data.
    bool write(std::span<const uint8_t> data);

    /// Push buffered bytes down to the file.
    bool flush();

    /// Close the temp file and rename it to the final path.
    /// Returns error message or empty string on success.
    std::string commit();

    /// Close and delete the temp file.
    void discard();

    /// Payload bytes accepted so far (before compression).
    uint64_t bytes_written() const { return bytes_written_; }

    const std::filesystem::path& temp_path() const { return temp_path_; }
    const std::filesystem::path& final_path() const { return final_path_; }

private:
    std::filesystem::path final_path_;
    std::filesystem::path temp_path_;
    std::ofstream file_;
    std::unique_ptr<GzipWriter> gzip_;  // null when copying pre-compressed data
    uint64_t bytes_written_ = 0;
    bool open_ = false;
    bool done_ = false;
};

/// On-disk store of compressed symbol artifacts.
///
/// Layout relative to the root:
///   {name}/{identifier}/{filename}.compressed
///   {name}/{identifier}/tmp_{filename}.compressed   (in progress)
///
/// All filesystem work on a key must be done while holding lock_for(key).
/// The lock registry is owned by this instance and never shrinks.
class ArtifactStore {
public:
    explicit ArtifactStore(std::filesystem::path root);

    const std::filesystem::path& root() const { return root_; }

    std::filesystem::path directory_for(const SymbolKey& key) const;
    std::filesystem::path artifact_path(const SymbolKey& key) const;
    std::filesystem::path temp_path(const SymbolKey& key) const;

    bool exists(const SymbolKey& key) const;

    /// Stream the stored gzip bytes unchanged. Returns nullptr if missing.
    std::unique_ptr<ByteStream> read_compressed(const SymbolKey& key, size_t chunk_size) const;

    /// Stream the decompressed payload. Returns nullptr if missing.
    std::unique_ptr<ByteStream> read_decompressed(const SymbolKey& key, size_t chunk_size,
                                                  uint64_t max_bytes) const;

    /// Mutex serializing filesystem work on the key's directory.
    /// Created on first use and kept for the lifetime of the store.
    std::mutex& lock_for(const SymbolKey& key);

    /// Number of per-directory locks created so far.
    size_t lock_count() const;

    /// Create the key directory and open its temp file for writing.
    /// Caller must hold lock_for(key). Returns nullptr and sets `error` on failure.
    std::unique_ptr<ArtifactWriter> begin_write(const SymbolKey& key, bool precompressed,
                                                std::string& error);

    /// Remove a leftover temp file. Returns true if one was removed.
    bool discard_temp(const SymbolKey& key);

private:
    std::filesystem::path root_;

    mutable std::mutex locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> locks_;
};

}  // namespace symcache
