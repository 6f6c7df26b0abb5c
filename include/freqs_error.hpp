#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

// the input file could not be opened
struct SourceOpenFailure : public std::runtime_error {
    std::string path;

    SourceOpenFailure(std::string const& _path, std::string const& cause)
        : std::runtime_error("could not open file " + _path + ": " + cause), path(_path) {
    }
};

// reading from the input failed after some bytes had already been consumed
struct ReadFailure : public std::runtime_error {
    uint64_t offset;

    ReadFailure(uint64_t const _offset, std::string const& cause)
        : std::runtime_error("read failed at byte " + std::to_string(_offset) + ": " + cause), offset(_offset) {
    }
};

// the output file could not be opened for appending
struct SinkOpenFailure : public std::runtime_error {
    std::string path;

    SinkOpenFailure(std::string const& _path, std::string const& cause)
        : std::runtime_error("could not open output file " + _path + ": " + cause), path(_path) {
    }
};

// one or more table lines could not be written
struct SinkWriteFailure : public std::runtime_error {
    size_t num_failed;

    SinkWriteFailure(size_t const _num_failed, size_t const num_lines)
        : std::runtime_error(std::to_string(_num_failed) + " of " + std::to_string(num_lines) + " lines could not be written"), num_failed(_num_failed) {
    }
};
