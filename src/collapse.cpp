#include "nanocollapse/collapse.hpp"
#include "nanocollapse/errors.hpp"

#include <charconv>
#include <cmath>
#include <string>

namespace nanocollapse {

void append_float(std::string& out, double value) {
    if (std::isnan(value)) {
        out += "nan";
        return;
    }
    char buf[32];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    (void)ec;
    out.append(buf, static_cast<size_t>(ptr - buf));
}

void append_float(std::string& out, float value) {
    if (std::isnan(value)) {
        out += "nan";
        return;
    }
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    (void)ec;
    out.append(buf, static_cast<size_t>(ptr - buf));
}

namespace {

template <typename Int>
void append_int(std::string& out, Int value) {
    char buf[24];
    auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), value);
    (void)ec;
    out.append(buf, static_cast<size_t>(ptr - buf));
}

void add_to_buckets(KmerAggregate& kmer, const EventRecord& record, double duration) {
    if (record.model_kmer == AMBIGUOUS_KMER) {
        kmer.nnnnn_dwell_time += duration;
    } else if (record.model_kmer != record.reference_kmer) {
        kmer.mismatch_dwell_time += duration;
    }
}

size_t header_slot(const OptionalColumns& columns) {
    return (columns.signal_index ? 1u : 0u) | (columns.samples ? 2u : 0u);
}

}  // namespace

std::string kmer_header_line(const OptionalColumns& columns, const CollapseOptions& options) {
    std::string header = "ref_pos\tref_kmer\tnum_events\tdwell_time\tNNNNN_dwell_time\tmismatch_dwell_time";
    if (columns.signal_index) {
        header += "\tstart_idx\tend_idx";
    }
    if (columns.samples) {
        for (StatField f : options.stat_fields) {
            header += '\t';
            header += stat_field_name(f);
        }
        if (options.write_samples) {
            header += "\tsamples";
        }
    }
    return header;
}

ReadCollapser::ReadCollapser(CollapseOptions options)
    : options_(std::move(options)),
      needs_parsed_samples_(!options_.stat_fields.empty() ||
                            (options_.write_samples && options_.samples_npoints > 0)) {}

const std::string& ReadCollapser::header_for(const OptionalColumns& columns) {
    const size_t slot = header_slot(columns);
    if (!header_ready_[slot]) {
        headers_[slot] = kmer_header_line(columns, options_);
        header_ready_[slot] = true;
    }
    return headers_[slot];
}

void ReadCollapser::seed(KmerAggregate& kmer, const EventRecord& record, const Event& event,
                         const OptionalColumns& columns) const {
    kmer.position = event.position;
    kmer.ref_kmer = record.reference_kmer;
    kmer.num_events = 1;
    kmer.dwell_time = event.event_length;
    kmer.nnnnn_dwell_time = 0.0;
    kmer.mismatch_dwell_time = 0.0;
    add_to_buckets(kmer, record, event.event_length);
    if (columns.signal_index) {
        kmer.start_idx = event.start_idx;
        kmer.end_idx = event.end_idx;
    }
    kmer.samples.clear();
    if (columns.samples) {
        kmer.samples = record.samples;
    }
}

void ReadCollapser::fold(KmerAggregate& kmer, const EventRecord& record, const Event& event,
                         const OptionalColumns& columns) const {
    ++kmer.num_events;
    kmer.dwell_time += event.event_length;
    add_to_buckets(kmer, record, event.event_length);
    if (columns.signal_index) {
        kmer.start_idx = event.start_idx;
        kmer.end_idx = event.end_idx;
    }
    if (columns.samples && !record.samples.empty()) {
        if (!kmer.samples.empty()) kmer.samples += ',';
        kmer.samples += record.samples;
    }
}

void ReadCollapser::append_kmer_line(std::string& out, const KmerAggregate& kmer,
                                     const OptionalColumns& columns,
                                     const std::string& read_id) const {
    append_int(out, kmer.position);
    out += '\t';
    out += kmer.ref_kmer;
    out += '\t';
    append_int(out, kmer.num_events);
    out += '\t';
    append_float(out, kmer.dwell_time);
    out += '\t';
    append_float(out, kmer.nnnnn_dwell_time);
    out += '\t';
    append_float(out, kmer.mismatch_dwell_time);

    if (columns.signal_index) {
        out += '\t';
        append_int(out, kmer.start_idx);
        out += '\t';
        append_int(out, kmer.end_idx);
    }

    if (columns.samples) {
        std::vector<float> values;
        if (needs_parsed_samples_) {
            values = parse_samples(kmer.samples, read_id);
        }

        if (!options_.stat_fields.empty()) {
            const SignalStats stats = compute_signal_stats(values);
            for (StatField f : options_.stat_fields) {
                out += '\t';
                switch (f) {
                    case StatField::MEAN: append_float(out, stats.mean); break;
                    case StatField::STD: append_float(out, stats.std); break;
                    case StatField::MEDIAN: append_float(out, stats.median); break;
                    case StatField::MAD: append_float(out, stats.mad); break;
                    case StatField::NUM_SIGNALS: append_int(out, stats.num_signals); break;
                }
            }
        }

        if (options_.write_samples) {
            out += '\t';
            if (options_.samples_npoints > 0) {
                const std::vector<float> resampled =
                    interpolate_samples(values, options_.samples_npoints);
                for (size_t i = 0; i < resampled.size(); ++i) {
                    if (i > 0) out += ',';
                    append_float(out, resampled[i]);
                }
            } else {
                out += kmer.samples;
            }
        }
    }
    out += '\n';
}

CollapsedRead ReadCollapser::collapse(const ReadGroup& group) {
    if (group.events.empty()) {
        throw ParseError("Read group " + group.read_id + " / " + group.ref_id + " has no events");
    }

    const OptionalColumns& columns = group.columns;
    const std::string& read_id = group.read_id;

    CollapsedRead result;
    ReadSummary& summary = result.summary;
    summary.read_id = group.read_id;
    summary.ref_id = group.ref_id;

    std::string& block = result.block;
    block.reserve(group.events.size() * 48 + 128);
    block += '#';
    block += group.read_id;
    block += '\t';
    block += group.ref_id;
    block += '\n';
    block += header_for(columns);
    block += '\n';

    auto account = [&summary](const KmerAggregate& kmer) {
        ++summary.kmers;
        summary.dwell_time += kmer.dwell_time;
        if (kmer.nnnnn_dwell_time > 0.0) ++summary.nnnnn_kmers;
        if (kmer.mismatch_dwell_time > 0.0) ++summary.mismatch_kmers;
    };

    KmerAggregate kmer;
    Event event = parse_event(group.events.front(), columns, read_id);
    seed(kmer, group.events.front(), event, columns);
    summary.ref_start = kmer.position;

    for (size_t i = 1; i < group.events.size(); ++i) {
        const EventRecord& record = group.events[i];
        event = parse_event(record, columns, read_id);

        const int64_t offset = event.position >= kmer.position
            ? event.position - kmer.position
            : kmer.position - event.position;
        if (offset == 0) {
            fold(kmer, record, event, columns);
            continue;
        }

        append_kmer_line(block, kmer, columns, read_id);
        account(kmer);
        if (offset >= 2) {
            summary.missing_kmers += static_cast<uint64_t>(offset - 1);
        }
        seed(kmer, record, event, columns);
    }

    append_kmer_line(block, kmer, columns, read_id);
    account(kmer);
    summary.ref_end = kmer.position + 1;
    return result;
}

CollapsedRead collapse_read_group(const ReadGroup& group, const CollapseOptions& options) {
    ReadCollapser collapser(options);
    return collapser.collapse(group);
}

}  // namespace nanocollapse
