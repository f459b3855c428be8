// Unit tests for per-kmer signal statistics
// Compile: g++ -std=c++20 -I../include -o test_kmer_stats test_kmer_stats.cpp ../src/kmer_stats.cpp

#include "nanocollapse/errors.hpp"
#include "nanocollapse/kmer_stats.hpp"

#include <cassert>
#include <cmath>
#include <iostream>
#include <string>
#include <vector>

using namespace nanocollapse;

static bool near(double a, double b, double tol = 1e-5) {
    return std::fabs(a - b) < tol;
}

void test_stat_field_names() {
    std::cout << "Testing stat field names... ";
    assert(parse_stat_field("mean") == StatField::MEAN);
    assert(parse_stat_field("std") == StatField::STD);
    assert(parse_stat_field("median") == StatField::MEDIAN);
    assert(parse_stat_field("mad") == StatField::MAD);
    assert(parse_stat_field("num_signals") == StatField::NUM_SIGNALS);
    assert(std::string(stat_field_name(StatField::NUM_SIGNALS)) == "num_signals");

    bool threw = false;
    try {
        (void)parse_stat_field("variance");
    } catch (const InvalidConfig&) {
        threw = true;
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_stat_field_list() {
    std::cout << "Testing stat field lists... ";
    auto fields = parse_stat_fields("mad,mean");
    assert(fields.size() == 2);
    assert(fields[0] == StatField::MAD);
    assert(fields[1] == StatField::MEAN);

    auto defaults = default_stat_fields();
    assert(defaults.size() == 3);
    assert(defaults[0] == StatField::MEAN);
    assert(defaults[1] == StatField::MEDIAN);
    assert(defaults[2] == StatField::NUM_SIGNALS);

    for (const char* bad : {"", ",", "mean,mean", "mean,foo"}) {
        bool threw = false;
        try {
            (void)parse_stat_fields(bad);
        } catch (const InvalidConfig&) {
            threw = true;
        }
        assert(threw);
    }
    std::cout << "PASSED\n";
}

void test_parse_samples() {
    std::cout << "Testing sample parsing... ";
    auto v = parse_samples("80.5,81,,79.25", "r1");
    assert(v.size() == 3);
    assert(near(v[0], 80.5));
    assert(near(v[1], 81.0));
    assert(near(v[2], 79.25));
    assert(parse_samples("", "r1").empty());

    bool threw = false;
    try {
        (void)parse_samples("80.5,abc", "read_42");
    } catch (const ParseError& e) {
        threw = true;
        assert(std::string(e.what()).find("read_42") != std::string::npos);
    }
    assert(threw);
    std::cout << "PASSED\n";
}

void test_signal_stats() {
    std::cout << "Testing signal statistics... ";
    SignalStats s = compute_signal_stats({1.0f, 2.0f, 3.0f, 4.0f, 10.0f});
    assert(s.num_signals == 5);
    assert(near(s.mean, 4.0));
    assert(near(s.median, 3.0));
    // |x - 3| = 2,1,0,1,7 -> median 1
    assert(near(s.mad, 1.0));
    // population variance: (9+4+1+0+36)/5 = 10
    assert(near(s.std, std::sqrt(10.0)));

    SignalStats even = compute_signal_stats({4.0f, 1.0f, 3.0f, 2.0f});
    assert(near(even.median, 2.5));
    std::cout << "PASSED\n";
}

void test_empty_stats_are_nan() {
    std::cout << "Testing statistics of no samples... ";
    SignalStats s = compute_signal_stats({});
    assert(s.num_signals == 0);
    assert(std::isnan(s.mean));
    assert(std::isnan(s.std));
    assert(std::isnan(s.median));
    assert(std::isnan(s.mad));
    std::cout << "PASSED\n";
}

void test_interpolation() {
    std::cout << "Testing sample interpolation... ";
    auto up = interpolate_samples({0.0f, 10.0f}, 5);
    assert(up.size() == 5);
    assert(near(up[0], 0.0));
    assert(near(up[1], 2.5));
    assert(near(up[2], 5.0));
    assert(near(up[4], 10.0));

    auto down = interpolate_samples({0.0f, 1.0f, 2.0f, 3.0f, 4.0f}, 3);
    assert(down.size() == 3);
    assert(near(down[0], 0.0));
    assert(near(down[1], 2.0));
    assert(near(down[2], 4.0));

    auto flat = interpolate_samples({7.0f}, 4);
    assert(flat.size() == 4);
    assert(near(flat[3], 7.0));

    assert(interpolate_samples({}, 10).empty());
    std::cout << "PASSED\n";
}

int main() {
    std::cout << "\n=== Kmer Signal Statistics Tests ===\n\n";
    test_stat_field_names();
    test_stat_field_list();
    test_parse_samples();
    test_signal_stats();
    test_empty_stats_are_nan();
    test_interpolation();
    std::cout << "\nAll tests passed!\n";
    return 0;
}
