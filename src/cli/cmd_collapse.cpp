/**
 * @file cmd_collapse.cpp
 * @brief Collapse nanopolish eventalign output by kmer.
 */

#include "subcommand.hpp"
#include "args.hpp"
#include "nanocollapse/collapse_pipeline.hpp"
#include "nanocollapse/log_utils.hpp"

#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace nanocollapse {
namespace cli {

int cmd_collapse(int argc, char* argv[]) {
    Options opts;
    try {
        opts = parse_args(argc, argv);
    } catch (const ParseArgsExit& e) {
        if (e.what()[0] != '\0') {
            std::cerr << e.what() << "\n";
            std::cerr << "Run 'nanocollapse collapse --help' for usage.\n";
        }
        return e.exit_code();
    }

    try {
        PipelineConfig config = build_pipeline_config(opts);
        config.validate();

        std::error_code ec;
        std::filesystem::create_directories(opts.outpath, ec);
        if (ec) {
            std::cerr << "Error: Cannot create output directory " << opts.outpath
                      << ": " << ec.message() << "\n";
            return 1;
        }

        if (opts.verbose) {
            std::cerr << "Output: " << config.outputs.data << "\n";
            std::cerr << "Index:  " << config.outputs.index << "\n";
        }

        const RunStats stats = run_collapse(config);

        if (opts.verbose) {
            std::cerr << "Written: " << stats.reads << " reads, " << stats.bytes << " bytes\n";
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}

namespace {
    static CommandRegistrar collapse_registrar(
        "collapse",
        "Collapse eventalign events into per-kmer records with a byte-offset index",
        cmd_collapse, 10);
}

}  // namespace cli
}  // namespace nanocollapse
