#pragma once

#include <cstddef>
#include <cstdint>
#include <iostream>

static constexpr size_t idiv_ceil(size_t const a, size_t const b) {
    return ((a + b) - 1ULL) / b;
}

// prints "processed chunk i / n" in place, or "i / ?" if the input size is unknown
class ChunkProgress {
private:
    std::ostream* out_;
    size_t num_chunks_;
    bool known_;

public:
    inline ChunkProgress(std::ostream& out, uint64_t const file_size, size_t const chunk_capacity)
        : out_(&out), num_chunks_(idiv_ceil(file_size, chunk_capacity)), known_(true) {
    }

    // for inputs like pipes, whose size cannot be queried in advance
    inline ChunkProgress(std::ostream& out) : out_(&out), num_chunks_(0), known_(false) {
    }

    bool known() const { return known_; }
    size_t num_chunks() const { return num_chunks_; }

    void operator()(size_t const chunks_done, uint64_t) {
        *out_ << "\rprocessed chunk " << chunks_done << " / ";
        if(known_) {
            *out_ << num_chunks_;
        } else {
            *out_ << "?";
        }
        out_->flush();
    }

    void finish() {
        *out_ << std::endl << "done!" << std::endl;
    }
};
