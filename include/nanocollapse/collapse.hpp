#pragma once
/**
 * @file collapse.hpp
 * @brief Position-based collapse of one read group into kmer records
 *
 * Consecutive events at the same reference position are folded into one
 * KmerAggregate. The aggregate is written out as soon as the position
 * changes, so a read is processed in a single pass with one live aggregate.
 *
 * Block layout for one read:
 *   #<read_id>\t<ref_id>
 *   <column header>
 *   <one line per kmer>
 */

#include "nanocollapse/eventalign.hpp"
#include "nanocollapse/kmer_stats.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace nanocollapse {

// Run-wide settings for the kmer lines; identical for every worker.
struct CollapseOptions {
    std::vector<StatField> stat_fields = default_stat_fields();
    bool write_samples = false;
    size_t samples_npoints = 0;  // 0 = write samples as observed
};

// Per-read totals written to the index file.
struct ReadSummary {
    std::string read_id;
    std::string ref_id;
    int64_t ref_start = 0;
    int64_t ref_end = 0;  // last kmer position + 1
    uint64_t kmers = 0;
    uint64_t nnnnn_kmers = 0;
    uint64_t mismatch_kmers = 0;
    uint64_t missing_kmers = 0;  // positions skipped between observed kmers
    double dwell_time = 0.0;
};

struct CollapsedRead {
    ReadSummary summary;
    std::string block;  // newline terminated
};

struct KmerAggregate {
    int64_t position = 0;
    std::string ref_kmer;
    uint32_t num_events = 0;
    double dwell_time = 0.0;
    double nnnnn_dwell_time = 0.0;
    double mismatch_dwell_time = 0.0;
    int64_t start_idx = 0;
    int64_t end_idx = 0;
    std::string samples;  // comma-joined raw text
};

// Float column text: shortest form that parses back to `value`, NaN as "nan".
void append_float(std::string& out, double value);
void append_float(std::string& out, float value);

// Column header line (without newline) for reads with `columns`.
std::string kmer_header_line(const OptionalColumns& columns, const CollapseOptions& options);

/**
 * @brief Collapses read groups; one instance per worker thread
 *
 * Header lines are cached per column combination. Not thread-safe.
 */
class ReadCollapser {
public:
    explicit ReadCollapser(CollapseOptions options);

    // Throws ParseError on a malformed numeric field or an empty group.
    CollapsedRead collapse(const ReadGroup& group);

private:
    void seed(KmerAggregate& kmer, const EventRecord& record, const Event& event,
              const OptionalColumns& columns) const;
    void fold(KmerAggregate& kmer, const EventRecord& record, const Event& event,
              const OptionalColumns& columns) const;
    void append_kmer_line(std::string& out, const KmerAggregate& kmer,
                          const OptionalColumns& columns, const std::string& read_id) const;
    const std::string& header_for(const OptionalColumns& columns);

    CollapseOptions options_;
    bool needs_parsed_samples_;
    std::string headers_[4];
    bool header_ready_[4] = {false, false, false, false};
};

// Convenience wrapper around a temporary ReadCollapser.
CollapsedRead collapse_read_group(const ReadGroup& group, const CollapseOptions& options);

}  // namespace nanocollapse
