#include "args.hpp"
#include "nanocollapse/kmer_stats.hpp"
#include "nanocollapse/version.h"
#include <iostream>
#include <string>

namespace nanocollapse {
namespace cli {

void print_version() {
    std::cout << "nanocollapse " << NANOCOLLAPSE_VERSION << "\n";
}

void print_usage(const char* program_name) {
    std::cout << "nanocollapse v" << NANOCOLLAPSE_VERSION << "\n\n";
    std::cout << "Collapse nanopolish eventalign output by kmer instead of by event.\n\n";
    std::cout << "Usage: nanocollapse " << program_name << " -i <eventalign.tsv> [options]\n\n";
    std::cout << "Input/Output:\n";
    std::cout << "  -i, --input <file>       eventalign TSV (or .gz), repeatable; '-' = stdin (default)\n";
    std::cout << "  -o, --outpath <dir>      Output directory, created if missing (default: ./)\n";
    std::cout << "  -p, --outprefix <str>    Output file prefix (default: out)\n";
    std::cout << "                           Writes <prefix>_eventalign_collapse.tsv and .tsv.idx\n";
    std::cout << "\nProcessing:\n";
    std::cout << "  -t, --threads <int>      Total threads, reader and writer included, >= 3 (default: 4)\n";
    std::cout << "  -n, --max-reads <int>    Stop after this many reads, 0 = all (default: 0)\n";
    std::cout << "  --queue-size <int>       Capacity of the work and result queues (default: 1000)\n";
    std::cout << "\nSignal statistics (eventalign run with --samples):\n";
    std::cout << "  -s, --stat-fields <list> Comma list of mean,std,median,mad,num_signals\n";
    std::cout << "                           (default: mean,median,num_signals)\n";
    std::cout << "  --write-samples          Also write the raw samples of each kmer\n";
    std::cout << "  --samples-npoints <int>  Resample written samples to this many points (default: off)\n";
    std::cout << "\n";
    std::cout << "  -v, --verbose            Verbose output with progress\n";
    std::cout << "  -q, --quiet              Errors only\n";
    std::cout << "  -V, --version            Show version and exit\n";
    std::cout << "  -h, --help               Show this help message\n";
    std::cout << "\n";
    std::cout << "Examples:\n";
    std::cout << "  nanopolish eventalign ... --samples | nanocollapse " << program_name << " -o collapsed\n";
    std::cout << "  nanocollapse " << program_name << " -i events.tsv.gz -o out -p sample1 -t 8 -s mean,std,num_signals\n";
}

Options parse_args(int argc, char* argv[]) {
    Options opts;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto require_value = [&](const std::string& flag) -> std::string {
            if (i + 1 >= argc) {
                throw ParseArgsExit(1, "Error: Missing value for " + flag);
            }
            return argv[++i];
        };

        auto parse_size = [&](const std::string& flag, const std::string& value) -> size_t {
            try {
                size_t idx = 0;
                if (!value.empty() && value[0] == '-') {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                size_t parsed = std::stoull(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        auto parse_int = [&](const std::string& flag, const std::string& value) -> int {
            try {
                size_t idx = 0;
                int parsed = std::stoi(value, &idx);
                if (idx != value.size()) {
                    throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
                }
                return parsed;
            } catch (const ParseArgsExit&) {
                throw;
            } catch (const std::exception&) {
                throw ParseArgsExit(1, "Error: Invalid integer for " + flag + ": " + value);
            }
        };

        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            throw ParseArgsExit(0);
        } else if (arg == "-V" || arg == "--version") {
            print_version();
            throw ParseArgsExit(0);
        } else if (arg == "-i" || arg == "--input") {
            opts.inputs.push_back(require_value(arg));
        } else if (arg == "-o" || arg == "--outpath") {
            opts.outpath = require_value(arg);
        } else if (arg == "-p" || arg == "--outprefix") {
            opts.outprefix = require_value(arg);
            if (opts.outprefix.empty()) {
                throw ParseArgsExit(1, "Error: --outprefix must not be empty");
            }
        } else if (arg == "-t" || arg == "--threads") {
            opts.num_threads = parse_int(arg, require_value(arg));
            if (opts.num_threads < MIN_THREADS) {
                throw ParseArgsExit(1, "Error: --threads must be >= 3 (reader, writer and one worker)");
            }
        } else if (arg == "-n" || arg == "--max-reads") {
            opts.max_reads = parse_size(arg, require_value(arg));
        } else if (arg == "--queue-size") {
            opts.queue_size = parse_size(arg, require_value(arg));
            if (opts.queue_size < 1) {
                throw ParseArgsExit(1, "Error: --queue-size must be >= 1");
            }
        } else if (arg == "-s" || arg == "--stat-fields") {
            opts.stat_fields = require_value(arg);
        } else if (arg == "--write-samples") {
            opts.write_samples = true;
        } else if (arg == "--samples-npoints") {
            opts.samples_npoints = parse_size(arg, require_value(arg));
        } else if (arg == "-v" || arg == "--verbose") {
            opts.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            opts.quiet = true;
        } else if (arg == "-") {
            opts.inputs.push_back(arg);
        } else {
            throw ParseArgsExit(1, "Error: Unknown option: " + arg);
        }
    }

    if (opts.verbose && opts.quiet) {
        throw ParseArgsExit(1, "Error: --verbose and --quiet are mutually exclusive");
    }
    if (opts.samples_npoints > 0 && !opts.write_samples) {
        throw ParseArgsExit(1, "Error: --samples-npoints requires --write-samples");
    }

    return opts;
}

PipelineConfig build_pipeline_config(const Options& opts) {
    PipelineConfig config;
    config.inputs = opts.inputs;
    config.outputs = make_output_paths(opts.outpath, opts.outprefix);
    config.max_reads = opts.max_reads;
    config.threads = opts.num_threads;
    config.queue_capacity = opts.queue_size;
    config.collapse.stat_fields = parse_stat_fields(opts.stat_fields);
    config.collapse.write_samples = opts.write_samples;
    config.collapse.samples_npoints = opts.samples_npoints;
    if (opts.quiet) {
        config.verbosity = log_utils::Verbosity::QUIET;
    } else if (opts.verbose) {
        config.verbosity = log_utils::Verbosity::VERBOSE;
    } else {
        config.verbosity = log_utils::Verbosity::NORMAL;
    }
    return config;
}

}  // namespace cli
}  // namespace nanocollapse
