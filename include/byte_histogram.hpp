#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

// occurrence counts of each byte value, indexed directly by the byte
class ByteHistogram {
public:
    static constexpr size_t SIGMA = 256;

private:
    std::array<uint64_t, SIGMA> count_;

public:
    inline ByteHistogram() {
        count_.fill(0);
    }

    inline void increment(unsigned char const c) {
        ++count_[c];
    }

    inline uint64_t operator[](size_t const c) const {
        return count_[c];
    }

    /// \brief The total number of bytes counted.
    inline uint64_t total() const {
        uint64_t n = 0;
        for(auto const x : count_) n += x;
        return n;
    }

    /// \brief The number of byte values that occurred at least once.
    inline size_t distinct() const {
        size_t d = 0;
        for(auto const x : count_) {
            if(x) ++d;
        }
        return d;
    }

    /// \brief Adds the counts of another histogram, e.g., one obtained for a disjoint range of the same input.
    ByteHistogram& operator+=(ByteHistogram const& other) {
        for(size_t c = 0; c < SIGMA; c++) {
            count_[c] += other.count_[c];
        }
        return *this;
    }

    bool operator==(ByteHistogram const&) const = default;
};
