#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace nanocollapse {

// Per-kmer raw signal statistics, written in the order they are configured.
enum class StatField {
    MEAN,
    STD,
    MEDIAN,
    MAD,
    NUM_SIGNALS
};

const char* stat_field_name(StatField field);

// Throws InvalidConfig for names outside mean, std, median, mad, num_signals.
StatField parse_stat_field(std::string_view name);

// Comma-separated list, e.g. "mean,median,num_signals". Duplicates and
// empty lists are rejected with InvalidConfig.
std::vector<StatField> parse_stat_fields(const std::string& list);

// mean, median, num_signals
std::vector<StatField> default_stat_fields();

struct SignalStats {
    double mean = 0.0;
    double std = 0.0;     // population standard deviation
    double median = 0.0;
    double mad = 0.0;     // median absolute deviation, unscaled
    size_t num_signals = 0;
};

// Parse a comma-separated sample list. Empty items are skipped.
// Throws ParseError mentioning `read_id` on a malformed value.
std::vector<float> parse_samples(std::string_view csv, const std::string& read_id);

// All statistics are NaN for an empty input.
SignalStats compute_signal_stats(std::vector<float> samples);

// Linear interpolation of `samples` onto `npoints` evenly spaced positions
// spanning the first to the last sample.
std::vector<float> interpolate_samples(const std::vector<float>& samples, size_t npoints);

}  // namespace nanocollapse
