#pragma once

#include <cstdint>
#include <iomanip>
#include <sstream>
#include <string>
#include <vector>

#include "byte_histogram.hpp"
#include "byte_label.hpp"

// one row of a frequency table
struct DisplayLine {
    std::string hex;   // the byte value in lowercase hex, two digits, no prefix
    uint64_t count;
    std::string label; // see byte_label

    // e.g., "  41 : 12: A"
    std::string str() const {
        std::ostringstream oss;
        oss << "  " << std::left << std::setw(3) << hex << ": " << count << ": " << label;
        return oss.str();
    }
};

inline std::string byte_hex(uint8_t const c) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << (unsigned int)c;
    return oss.str();
}

/// \brief Produces one line for each byte that occurs in the histogram, in ascending order of byte value.
inline std::vector<DisplayLine> render(ByteHistogram const& hist) {
    std::vector<DisplayLine> lines;
    for(size_t c = 0; c < ByteHistogram::SIGMA; c++) {
        auto const count = hist[c];
        if(count) {
            lines.push_back(DisplayLine { byte_hex(uint8_t(c)), count, byte_label(uint8_t(c)) });
        }
    }
    return lines;
}

/// \brief Produces the complete output text line by line: an empty line followed by the table rows.
inline std::vector<std::string> render_text(ByteHistogram const& hist) {
    auto const table = render(hist);

    std::vector<std::string> text;
    text.reserve(table.size() + 1);
    text.emplace_back();
    for(auto const& line : table) {
        text.push_back(line.str());
    }
    return text;
}
