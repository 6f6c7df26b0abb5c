#pragma once

#include <cerrno>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <iopp/file_input_stream.hpp>

#include <pm/result.hpp>
#include <pm/stopwatch.hpp>

#include "chunked_counter.hpp"
#include "freqs_error.hpp"
#include "line_sink.hpp"
#include "progress.hpp"
#include "table_renderer.hpp"

enum ExitCode : int {
    EXIT_OK = 0,
    EXIT_USAGE = 1,
    EXIT_SOURCE_OPEN = 2,
    EXIT_READ = 3,
    EXIT_SINK_OPEN = 4,
    EXIT_SINK_WRITE = 5,
    EXIT_OTHER = 6,
};

struct FreqsConfig {
    std::string output; // empty for standard output
    uint64_t chunk_size = ChunkedCounter::DEFAULT_CAPACITY;
    bool quiet = false;
    bool stats = false;
};

/// \brief Drops a trailing \c -o or \c --out that is not followed by a filename.
///
/// Such a flag selects standard output, as if it had not been given at all.
/// Returns the new argument count.
inline int drop_bare_out_flag(int const argc, char const* const* argv) {
    if(argc > 1) {
        std::string_view const last = argv[argc - 1];
        if(last == "-o" || last == "--out") return argc - 1;
    }
    return argc;
}

/// \brief Counts the bytes of the input file and writes the table to the configured sink.
///
/// The console stream receives progress, and the table itself unless an output file is configured.
/// Throws a SourceOpenFailure, ReadFailure, SinkOpenFailure or SinkWriteFailure on failure.
inline void run_freqs(std::string const& input, FreqsConfig const& config, std::ostream& console) {
    std::error_code ec;
    auto const status = std::filesystem::status(input, ec);
    if(ec || !std::filesystem::exists(status)) {
        throw SourceOpenFailure(input, ec ? ec.message() : "no such file or directory");
    }
    if(std::filesystem::is_directory(status)) {
        throw SourceOpenFailure(input, "is a directory");
    }

    // pipes and devices have no size, which only affects the progress display
    bool const has_size = std::filesystem::is_regular_file(status);
    uint64_t file_size = 0;
    if(has_size) {
        file_size = std::filesystem::file_size(input, ec);
        if(ec) throw SourceOpenFailure(input, ec.message());

        errno = 0;
        std::ifstream probe(input, std::ios::binary);
        if(!probe) throw SourceOpenFailure(input, errno ? std::strerror(errno) : "cannot open for reading");
    }

    std::unique_ptr<iopp::FileInputStream> fis;
    try {
        fis = std::make_unique<iopp::FileInputStream>(input);
    } catch(std::exception const& e) {
        throw SourceOpenFailure(input, e.what());
    }
    if(!*fis) throw SourceOpenFailure(input, "bad file or path");

    // open the sink before reading any input
    std::ofstream ofs;
    if(!config.output.empty()) {
        errno = 0;
        ofs.open(config.output, std::ios::out | std::ios::app);
        if(!ofs) throw SinkOpenFailure(config.output, errno ? std::strerror(errno) : "cannot open for appending");
    }

    auto progress = has_size ? ChunkProgress(console, file_size, config.chunk_size) : ChunkProgress(console);
    ChunkedCounter counter(config.chunk_size, [&](size_t const chunks, uint64_t const bytes){
        if(!config.quiet) progress(chunks, bytes);
    });

    pm::Stopwatch t;
    t.start();
    auto const count = counter.consume_all(*fis);
    t.stop();

    if(!config.quiet) progress.finish();

    auto const text = render_text(count.histogram);
    auto const num_failed = config.output.empty() ? write_lines(console, text) : write_lines(ofs, text);

    if(config.stats) {
        pm::Result result;
        result.add("file", std::filesystem::path(input).filename().string());
        result.add("n", count.total_bytes);
        result.add("chunks", count.chunks);
        result.add("distinct", count.histogram.distinct());
        result.add("time", (uint64_t)std::round(t.elapsed_time_millis()));
        console << result.str() << std::endl;
    }

    if(num_failed) throw SinkWriteFailure(num_failed, text.size());
}

/// \brief Validates the arguments, runs \ref run_freqs on the first one and maps any error to an exit code.
///
/// Errors are reported on the console stream as "Error: <message>" followed by "Aborting".
inline int freqs_main(std::vector<std::string> const& args, FreqsConfig const& config, std::ostream& console) {
    if(args.empty()) {
        console << "Not enough arguments. try passing -h" << std::endl;
        return EXIT_USAGE;
    }

    if(config.chunk_size == 0) {
        console << "The chunk size must be at least one byte." << std::endl;
        return EXIT_USAGE;
    }

    auto abort_with = [&](std::exception const& e, int const code){
        console << std::endl << "Error: " << e.what() << std::endl << "Aborting" << std::endl;
        return code;
    };

    try {
        run_freqs(args[0], config, console);
        return EXIT_OK;
    } catch(SourceOpenFailure const& e) {
        return abort_with(e, EXIT_SOURCE_OPEN);
    } catch(ReadFailure const& e) {
        return abort_with(e, EXIT_READ);
    } catch(SinkOpenFailure const& e) {
        return abort_with(e, EXIT_SINK_OPEN);
    } catch(SinkWriteFailure const& e) {
        return abort_with(e, EXIT_SINK_WRITE);
    } catch(std::exception const& e) {
        return abort_with(e, EXIT_OTHER);
    }
}
