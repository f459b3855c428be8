#pragma once
/**
 * @file eventalign.hpp
 * @brief nanopolish eventalign TSV input: header layout, events, read groups
 *
 * Input is one header line followed by one line per event, sorted so that
 * all events of one (read, contig) pair are contiguous. EventalignReader
 * streams one or more such files and yields one ReadGroup per pair.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace nanocollapse {

class LineReader;

// Model k-mer reported for an event the aligner could not model.
constexpr std::string_view AMBIGUOUS_KMER = "NNNNN";

/**
 * @brief Presence of the optional eventalign columns
 *
 * Resolved once from the header; the aggregation code only consults these
 * flags.
 */
struct OptionalColumns {
    bool signal_index = false;  // start_idx and end_idx (--signal-index)
    bool samples = false;       // samples (--samples)

    bool operator==(const OptionalColumns& o) const {
        return signal_index == o.signal_index && samples == o.samples;
    }
};

/**
 * @brief Column indices resolved from an eventalign header line
 */
struct ColumnLayout {
    static constexpr size_t NONE = static_cast<size_t>(-1);

    size_t contig = NONE;
    size_t read_id = NONE;  // read_name, or read_index when names were not written
    size_t position = NONE;
    size_t reference_kmer = NONE;
    size_t model_kmer = NONE;
    size_t event_length = NONE;
    size_t start_idx = NONE;
    size_t end_idx = NONE;
    size_t samples = NONE;
    size_t num_columns = 0;
    OptionalColumns optional;

    // Throws SchemaError naming the first missing required column.
    static ColumnLayout resolve(const std::vector<std::string_view>& header);
};

// Split a tab-separated line into `fields` (views into `line`).
void split_tsv(std::string_view line, std::vector<std::string_view>& fields);

/**
 * @brief One eventalign row, reduced to the columns the collapse needs
 *
 * Numeric fields stay as text; the worker converts them (parse_event).
 * Optional fields are empty when their column is absent.
 */
struct EventRecord {
    std::string position;
    std::string reference_kmer;
    std::string model_kmer;
    std::string event_length;
    std::string start_idx;
    std::string end_idx;
    std::string samples;
};

// Numeric view of an EventRecord.
struct Event {
    int64_t position = 0;
    double event_length = 0.0;
    int64_t start_idx = 0;
    int64_t end_idx = 0;
};

/**
 * @brief All consecutive events of one (read id, reference id) pair
 */
struct ReadGroup {
    std::string read_id;
    std::string ref_id;
    OptionalColumns columns;
    std::vector<EventRecord> events;
};

// Throw ParseError mentioning `read_id` and `column` on malformed input.
int64_t parse_int_field(std::string_view value, std::string_view column, const std::string& read_id);
double parse_float_field(std::string_view value, std::string_view column, const std::string& read_id);

// Convert the numeric fields of `record`. Optional fields are parsed only
// when `columns` says they are present.
Event parse_event(const EventRecord& record, const OptionalColumns& columns, const std::string& read_id);

/**
 * @brief Streaming read-group reader over an ordered list of inputs
 *
 * Holds only the group being built. Groups never span two input files.
 * Once `max_reads` groups have been returned (0 = unlimited) next() returns
 * false without touching the remaining inputs.
 */
class EventalignReader {
public:
    explicit EventalignReader(std::vector<std::string> inputs, size_t max_reads = 0);
    ~EventalignReader();

    EventalignReader(const EventalignReader&) = delete;
    EventalignReader& operator=(const EventalignReader&) = delete;

    // Fill `group` with the next complete read group. Returns false when the
    // inputs are exhausted or the ceiling is reached.
    // Throws SchemaError, ParseError or IOError.
    bool next(ReadGroup& group);

    const ColumnLayout& layout() const { return layout_; }

    size_t groups_emitted() const { return groups_emitted_; }
    uint64_t lines_read() const { return lines_read_; }
    size_t files_opened() const { return file_idx_; }

private:
    bool open_next_input();
    bool fill_group(ReadGroup& group);
    bool read_event(std::string& read_id, std::string& ref_id, EventRecord& record);

    std::vector<std::string> inputs_;
    size_t max_reads_;
    size_t file_idx_ = 0;
    std::unique_ptr<LineReader> current_;
    uint64_t current_line_no_ = 0;

    bool has_layout_ = false;
    ColumnLayout layout_;
    std::string header_line_;

    // First event of the next group, read while closing the previous one.
    bool has_pending_ = false;
    std::string pending_read_id_;
    std::string pending_ref_id_;
    EventRecord pending_event_;

    std::string line_;
    std::vector<std::string_view> fields_;
    size_t groups_emitted_ = 0;
    uint64_t lines_read_ = 0;
};

}  // namespace nanocollapse
