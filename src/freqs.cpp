#include <iostream>

#include <oocmd.hpp>

#include <freqs_app.hpp>

using namespace oocmd;

struct Options : public ConfigObject {
    FreqsConfig config;
    bool help = false;

    Options() : ConfigObject("freqs", "Counts the occurrences of each byte value in a file") {
        param('o', "out", config.output, "Append the table to this file instead of printing it.");
        param('c', "chunk-size", config.chunk_size, "The number of bytes to read at once.");
        param('h', "help", help, "Print usage information and exit.");
        param('q', "quiet", config.quiet, "Do not display progress.");
        param("stats", config.stats, "Print a summary line after the table.");
    }
};

Options options;

static void print_usage(Application const& app) {
    std::cout << R"(
Usage:
    freqs <path to file>
        performs analysis on target file,
        then prints results as stdout.

    freqs <path to target file> -o <outfile>
        performs analysis on target file,
        then appends results to outfile,
        which is created if it does not exist.
        if o flag is specified with no outfile,
        prints to stdout instead.
)" << std::endl;
    app.print_usage(options);
}

int main(int argc, char** argv) {
    argc = drop_bare_out_flag(argc, argv);

    Application app(options, argc, argv);
    if(!app) return EXIT_USAGE;

    if(options.help) {
        print_usage(app);
        return EXIT_OK;
    }

    std::vector<std::string> args(app.args().begin(), app.args().end());
    return freqs_main(args, options.config, std::cout);
}
