// Unit tests for CLI argument parsing
// Compile: g++ -std=c++20 -I../include -I../src -I<build>/generated -o test_cli_args test_cli_args.cpp \
//          ../src/cli/args.cpp ../src/*.cpp -lz -pthread

#include "cli/args.hpp"
#include "nanocollapse/errors.hpp"
#include <cassert>
#include <cstring>
#include <cstdlib>
#include <iostream>
#include <vector>

class ArgvBuilder {
public:
    ArgvBuilder& add(const char* arg) {
        args_.push_back(strdup(arg));
        return *this;
    }

    int argc() const { return static_cast<int>(args_.size()); }
    char** argv() { return args_.data(); }

    ~ArgvBuilder() {
        for (char* arg : args_) {
            std::free(arg);
        }
    }

private:
    std::vector<char*> args_;
};

static void expect_parse_exit(int expected_code, ArgvBuilder& builder) {
    bool threw = false;
    try {
        (void)nanocollapse::cli::parse_args(builder.argc(), builder.argv());
    } catch (const nanocollapse::cli::ParseArgsExit& e) {
        threw = true;
        assert(e.exit_code() == expected_code);
    }
    assert(threw);
}

void test_basic_args() {
    std::cout << "Testing basic args... ";
    ArgvBuilder builder;
    builder.add("collapse").add("-i").add("a.tsv").add("--input").add("b.tsv.gz")
           .add("-o").add("results").add("-p").add("sample1");
    auto opts = nanocollapse::cli::parse_args(builder.argc(), builder.argv());
    assert(opts.inputs.size() == 2);
    assert(opts.inputs[0] == "a.tsv");
    assert(opts.inputs[1] == "b.tsv.gz");
    assert(opts.outpath == "results");
    assert(opts.outprefix == "sample1");
    std::cout << "PASSED\n";
}

void test_defaults() {
    std::cout << "Testing defaults... ";
    ArgvBuilder builder;
    builder.add("collapse");
    auto opts = nanocollapse::cli::parse_args(builder.argc(), builder.argv());
    assert(opts.inputs.empty());
    assert(opts.outpath == "./");
    assert(opts.outprefix == "out");
    assert(opts.num_threads == 4);
    assert(opts.max_reads == 0);
    assert(opts.stat_fields == "mean,median,num_signals");
    assert(opts.write_samples == false);
    assert(opts.samples_npoints == 0);
    assert(opts.queue_size == 1000);
    assert(opts.verbose == false);
    assert(opts.quiet == false);
    std::cout << "PASSED\n";
}

void test_stdin_input() {
    std::cout << "Testing stdin input... ";
    ArgvBuilder builder;
    builder.add("collapse").add("-");
    auto opts = nanocollapse::cli::parse_args(builder.argc(), builder.argv());
    assert(opts.inputs.size() == 1);
    assert(opts.inputs[0] == "-");
    std::cout << "PASSED\n";
}

void test_numeric_args() {
    std::cout << "Testing numeric args... ";
    ArgvBuilder builder;
    builder.add("collapse")
           .add("--threads").add("8")
           .add("-n").add("500")
           .add("--queue-size").add("64")
           .add("--write-samples")
           .add("--samples-npoints").add("20");
    auto opts = nanocollapse::cli::parse_args(builder.argc(), builder.argv());
    assert(opts.num_threads == 8);
    assert(opts.max_reads == 500);
    assert(opts.queue_size == 64);
    assert(opts.write_samples == true);
    assert(opts.samples_npoints == 20);
    std::cout << "PASSED\n";
}

void test_pipeline_config() {
    std::cout << "Testing pipeline config translation... ";
    ArgvBuilder builder;
    builder.add("collapse")
           .add("-i").add("events.tsv")
           .add("-o").add("out_dir").add("-p").add("s1")
           .add("-t").add("5")
           .add("-s").add("median,mad")
           .add("-v");
    auto opts = nanocollapse::cli::parse_args(builder.argc(), builder.argv());
    auto config = nanocollapse::cli::build_pipeline_config(opts);
    assert(config.inputs.size() == 1);
    assert(config.outputs.data == "out_dir/s1_eventalign_collapse.tsv");
    assert(config.outputs.index == "out_dir/s1_eventalign_collapse.tsv.idx");
    assert(config.threads == 5);
    assert(config.worker_count() == 3);
    assert(config.collapse.stat_fields.size() == 2);
    assert(config.collapse.stat_fields[0] == nanocollapse::StatField::MEDIAN);
    assert(config.collapse.stat_fields[1] == nanocollapse::StatField::MAD);
    assert(config.verbosity == nanocollapse::log_utils::Verbosity::VERBOSE);
    config.validate();
    std::cout << "PASSED\n";
}

void test_unknown_stat_field() {
    std::cout << "Testing unknown stat field... ";
    ArgvBuilder builder;
    builder.add("collapse").add("-s").add("mean,variance");
    auto opts = nanocollapse::cli::parse_args(builder.argc(), builder.argv());
    bool threw = false;
    try {
        (void)nanocollapse::cli::build_pipeline_config(opts);
    } catch (const nanocollapse::InvalidConfig&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_validation_errors() {
    std::cout << "Testing validation errors... ";
    {
        ArgvBuilder builder;
        builder.add("collapse").add("--threads").add("2");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("--threads").add("x");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("--max-reads").add("-5");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("--queue-size").add("0");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("-p").add("");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("-v").add("-q");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("--samples-npoints").add("10");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("-i");
        expect_parse_exit(1, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("--bogus");
        expect_parse_exit(1, builder);
    }
    std::cout << "PASSED\n";
}

void test_controlled_exits() {
    std::cout << "Testing help/version controlled exits... ";
    {
        ArgvBuilder builder;
        builder.add("collapse").add("--help");
        expect_parse_exit(0, builder);
    }
    {
        ArgvBuilder builder;
        builder.add("collapse").add("-V");
        expect_parse_exit(0, builder);
    }
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== CLI Argument Parsing Tests ===\n\n";
    test_basic_args();
    test_defaults();
    test_stdin_input();
    test_numeric_args();
    test_pipeline_config();
    test_unknown_stat_field();
    test_validation_errors();
    test_controlled_exits();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
