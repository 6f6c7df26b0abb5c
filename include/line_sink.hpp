#pragma once

#include <cstddef>
#include <iostream>
#include <string>
#include <vector>

/// \brief Writes each line to the given stream, flushing after every line.
///
/// A line that cannot be written is reported on \c std::cerr and skipped; the remaining lines are still attempted.
/// Returns the number of lines that failed.
inline size_t write_lines(std::ostream& out, std::vector<std::string> const& lines) {
    size_t num_failed = 0;
    for(auto const& line : lines) {
        out << line << std::endl;
        if(!out) {
            std::cerr << "failed to write line: \"" << line << "\"" << std::endl;
            ++num_failed;
            out.clear();
        }
    }
    return num_failed;
}
