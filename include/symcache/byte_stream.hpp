#pragma once

#include <cstdint>
#include <vector>

namespace symcache {

/// Forward-only source of byte chunks handed to the request layer.
/// Not restartable: once next() returns false the stream is exhausted.
class ByteStream {
public:
    virtual ~ByteStream() = default;

    /// Replace `chunk` with the next piece of data.
    /// Returns false (and leaves `chunk` empty) at end of stream or on error.
    virtual bool next(std::vector<uint8_t>& chunk) = 0;

    /// True if the stream ended because of an I/O or format error.
    virtual bool failed() const = 0;
};

}  // namespace symcache
