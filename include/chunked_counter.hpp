#pragma once

#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <functional>
#include <istream>
#include <memory>
#include <stdexcept>
#include <utility>

#include "byte_histogram.hpp"
#include "freqs_error.hpp"
#include "si_iec_literals.hpp"

// the result of counting an entire byte source
struct ChunkedCount {
    ByteHistogram histogram;
    uint64_t total_bytes = 0;
    size_t chunks = 0;
};

/// \brief Counts the bytes of an input stream chunk by chunk.
///
/// Only a single buffer of \c capacity bytes is ever held, regardless of the length of the input.
/// Counting is commutative, so the result does not depend on where chunk boundaries fall.
class ChunkedCounter {
public:
    static constexpr size_t DEFAULT_CAPACITY = 128_Ki;

    // called after each chunk with the number of chunks and bytes processed so far
    using ProgressFunc = std::function<void(size_t, uint64_t)>;

private:
    size_t capacity_;
    std::unique_ptr<char[]> buffer_;
    ProgressFunc on_chunk_;

public:
    inline ChunkedCounter(size_t const capacity = DEFAULT_CAPACITY) : capacity_(capacity) {
        if(capacity_ == 0) {
            throw std::invalid_argument("chunk capacity must be at least one byte");
        }
        buffer_ = std::make_unique<char[]>(capacity_);
    }

    inline ChunkedCounter(size_t const capacity, ProgressFunc on_chunk) : ChunkedCounter(capacity) {
        on_chunk_ = std::move(on_chunk);
    }

    size_t capacity() const { return capacity_; }

    /// \brief Reads the given stream until it is exhausted and counts every byte.
    ///
    /// Throws a \ref ReadFailure if the stream reports an error; in that case, no result is available.
    ChunkedCount consume_all(std::istream& in) {
        ChunkedCount result;

        while(true) {
            errno = 0;
            in.read(buffer_.get(), capacity_);
            auto const len = size_t(in.gcount());
            if(in.bad()) {
                throw ReadFailure(result.total_bytes + len, errno ? std::strerror(errno) : "stream error");
            }
            if(len == 0) break;

            // count and discard the chunk
            auto const* chunk = (unsigned char const*)buffer_.get();
            for(size_t i = 0; i < len; i++) {
                result.histogram.increment(chunk[i]);
            }
            result.total_bytes += len;
            ++result.chunks;

            if(on_chunk_) on_chunk_(result.chunks, result.total_bytes);

            // a short read means the stream hit its end
            if(!in) break;
        }
        return result;
    }
};
