#ifndef NANOCOLLAPSE_CLI_ARGS_HPP
#define NANOCOLLAPSE_CLI_ARGS_HPP

#include "nanocollapse/collapse_pipeline.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace nanocollapse {
namespace cli {

// Thrown instead of calling exit(); carries the process exit code.
// Code 0 for --help/--version, 1 for usage errors.
class ParseArgsExit : public std::runtime_error {
public:
    explicit ParseArgsExit(int exit_code, const std::string& message = "")
        : std::runtime_error(message), exit_code_(exit_code) {}

    int exit_code() const { return exit_code_; }

private:
    int exit_code_;
};

struct Options {
    std::vector<std::string> inputs;   // empty = stdin
    std::string outpath = "./";
    std::string outprefix = "out";
    int num_threads = 4;               // reader + writer + workers
    size_t max_reads = 0;              // 0 = all reads
    std::string stat_fields = "mean,median,num_signals";
    bool write_samples = false;
    size_t samples_npoints = 0;        // resample written samples (0 = off)
    size_t queue_size = DEFAULT_QUEUE_CAPACITY;
    bool verbose = false;
    bool quiet = false;
};

// Print version string to stdout
void print_version();

// Print usage/help for the collapse subcommand to stdout
void print_usage(const char* program_name);

// Parse collapse arguments. Throws ParseArgsExit.
Options parse_args(int argc, char* argv[]);

// Translate parsed options into a pipeline configuration.
// Throws InvalidConfig (e.g. unknown stat field).
PipelineConfig build_pipeline_config(const Options& opts);

}  // namespace cli
}  // namespace nanocollapse

#endif  // NANOCOLLAPSE_CLI_ARGS_HPP
