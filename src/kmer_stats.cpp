#include "nanocollapse/kmer_stats.hpp"
#include "nanocollapse/errors.hpp"

#include <algorithm>
#include <charconv>
#include <cmath>
#include <limits>
#include <system_error>

namespace nanocollapse {

namespace {

constexpr StatField ALL_FIELDS[] = {
    StatField::MEAN, StatField::STD, StatField::MEDIAN, StatField::MAD, StatField::NUM_SIGNALS
};

// Median of `v`, reordering it in place. `v` must not be empty.
double median_inplace(std::vector<double>& v) {
    const size_t mid = v.size() / 2;
    std::nth_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid), v.end());
    const double upper = v[mid];
    if (v.size() % 2 == 1) return upper;
    const double lower = *std::max_element(v.begin(), v.begin() + static_cast<std::ptrdiff_t>(mid));
    return (lower + upper) / 2.0;
}

}  // namespace

const char* stat_field_name(StatField field) {
    switch (field) {
        case StatField::MEAN: return "mean";
        case StatField::STD: return "std";
        case StatField::MEDIAN: return "median";
        case StatField::MAD: return "mad";
        case StatField::NUM_SIGNALS: return "num_signals";
    }
    return "unknown";
}

StatField parse_stat_field(std::string_view name) {
    for (StatField f : ALL_FIELDS) {
        if (name == stat_field_name(f)) return f;
    }
    throw InvalidConfig("Unsupported stat field '" + std::string(name) +
                        "' (choose from mean, std, median, mad, num_signals)");
}

std::vector<StatField> parse_stat_fields(const std::string& list) {
    std::vector<StatField> fields;
    size_t start = 0;
    while (start <= list.size()) {
        size_t comma = list.find(',', start);
        if (comma == std::string::npos) comma = list.size();
        std::string_view name(list.data() + start, comma - start);
        if (!name.empty()) {
            const StatField f = parse_stat_field(name);
            if (std::find(fields.begin(), fields.end(), f) != fields.end()) {
                throw InvalidConfig("Stat field '" + std::string(name) + "' listed twice");
            }
            fields.push_back(f);
        }
        start = comma + 1;
    }
    if (fields.empty()) {
        throw InvalidConfig("No stat fields given");
    }
    return fields;
}

std::vector<StatField> default_stat_fields() {
    return {StatField::MEAN, StatField::MEDIAN, StatField::NUM_SIGNALS};
}

std::vector<float> parse_samples(std::string_view csv, const std::string& read_id) {
    std::vector<float> out;
    out.reserve(csv.size() / 6 + 1);
    const char* p = csv.data();
    const char* end = p + csv.size();
    while (p < end) {
        const char* comma = std::find(p, end, ',');
        if (comma > p) {
            float value = 0.0f;
            auto [ptr, ec] = std::from_chars(p, comma, value);
            if (ec != std::errc() || ptr != comma) {
                throw ParseError("Invalid sample value '" + std::string(p, comma) +
                                 "' in column 'samples' of read " + read_id);
            }
            out.push_back(value);
        }
        p = comma + 1;
    }
    return out;
}

SignalStats compute_signal_stats(std::vector<float> samples) {
    SignalStats stats;
    stats.num_signals = samples.size();
    if (samples.empty()) {
        const double nan = std::numeric_limits<double>::quiet_NaN();
        stats.mean = stats.std = stats.median = stats.mad = nan;
        return stats;
    }

    const double n = static_cast<double>(samples.size());
    double sum = 0.0;
    for (float s : samples) sum += s;
    stats.mean = sum / n;

    double sq = 0.0;
    for (float s : samples) {
        const double d = s - stats.mean;
        sq += d * d;
    }
    stats.std = std::sqrt(sq / n);

    std::vector<double> work(samples.begin(), samples.end());
    stats.median = median_inplace(work);
    for (size_t i = 0; i < samples.size(); ++i) {
        work[i] = std::fabs(static_cast<double>(samples[i]) - stats.median);
    }
    stats.mad = median_inplace(work);
    return stats;
}

std::vector<float> interpolate_samples(const std::vector<float>& samples, size_t npoints) {
    std::vector<float> out;
    if (samples.empty() || npoints == 0) return out;
    out.reserve(npoints);
    if (samples.size() == 1 || npoints == 1) {
        out.assign(npoints, samples.front());
        return out;
    }

    const double last = static_cast<double>(samples.size() - 1);
    const double step = last / static_cast<double>(npoints - 1);
    for (size_t i = 0; i < npoints; ++i) {
        const double x = std::min(last, step * static_cast<double>(i));
        const size_t lo = static_cast<size_t>(x);
        const size_t hi = std::min(lo + 1, samples.size() - 1);
        const double frac = x - static_cast<double>(lo);
        out.push_back(static_cast<float>(samples[lo] + (samples[hi] - samples[lo]) * frac));
    }
    return out;
}

}  // namespace nanocollapse
