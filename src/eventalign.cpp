#include "nanocollapse/eventalign.hpp"
#include "nanocollapse/errors.hpp"
#include "nanocollapse/line_reader.hpp"

#include <charconv>
#include <cstring>
#include <string>
#include <system_error>

namespace nanocollapse {

// ============================================================================
// Header layout
// ============================================================================

ColumnLayout ColumnLayout::resolve(const std::vector<std::string_view>& header) {
    auto find = [&](std::string_view name) -> size_t {
        for (size_t i = 0; i < header.size(); ++i) {
            if (header[i] == name) return i;
        }
        return NONE;
    };
    auto require = [&](std::string_view name) -> size_t {
        const size_t idx = find(name);
        if (idx == NONE) {
            throw SchemaError("Missing required eventalign column '" + std::string(name) + "'");
        }
        return idx;
    };

    ColumnLayout layout;
    layout.num_columns = header.size();
    layout.contig = require("contig");

    layout.read_id = find("read_name");
    if (layout.read_id == NONE) layout.read_id = find("read_index");
    if (layout.read_id == NONE) {
        throw SchemaError("Missing required eventalign column 'read_name' or 'read_index'");
    }

    layout.position = require("position");
    layout.reference_kmer = require("reference_kmer");
    layout.model_kmer = require("model_kmer");
    layout.event_length = require("event_length");

    // start_idx/end_idx only count as a pair
    const size_t start = find("start_idx");
    const size_t end = find("end_idx");
    if (start != NONE && end != NONE) {
        layout.start_idx = start;
        layout.end_idx = end;
        layout.optional.signal_index = true;
    }

    layout.samples = find("samples");
    layout.optional.samples = layout.samples != NONE;
    return layout;
}

void split_tsv(std::string_view line, std::vector<std::string_view>& fields) {
    fields.clear();
    const char* p = line.data();
    const char* end = p + line.size();
    while (true) {
        const char* tab = static_cast<const char*>(
            memchr(p, '\t', static_cast<size_t>(end - p)));
        if (!tab) {
            fields.emplace_back(p, static_cast<size_t>(end - p));
            return;
        }
        fields.emplace_back(p, static_cast<size_t>(tab - p));
        p = tab + 1;
    }
}

// ============================================================================
// Numeric fields
// ============================================================================

namespace {

[[noreturn]] void throw_bad_field(std::string_view kind, std::string_view value,
                                  std::string_view column, const std::string& read_id) {
    throw ParseError("Invalid " + std::string(kind) + " '" + std::string(value) +
                     "' in column '" + std::string(column) + "' of read " + read_id);
}

}  // namespace

int64_t parse_int_field(std::string_view value, std::string_view column, const std::string& read_id) {
    int64_t out = 0;
    const char* first = value.data();
    const char* last = first + value.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (value.empty() || ec != std::errc() || ptr != last) {
        throw_bad_field("integer", value, column, read_id);
    }
    return out;
}

double parse_float_field(std::string_view value, std::string_view column, const std::string& read_id) {
    double out = 0.0;
    const char* first = value.data();
    const char* last = first + value.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    if (value.empty() || ec != std::errc() || ptr != last) {
        throw_bad_field("number", value, column, read_id);
    }
    return out;
}

Event parse_event(const EventRecord& record, const OptionalColumns& columns, const std::string& read_id) {
    Event event;
    event.position = parse_int_field(record.position, "position", read_id);
    event.event_length = parse_float_field(record.event_length, "event_length", read_id);
    if (columns.signal_index) {
        event.start_idx = parse_int_field(record.start_idx, "start_idx", read_id);
        event.end_idx = parse_int_field(record.end_idx, "end_idx", read_id);
    }
    return event;
}

// ============================================================================
// EventalignReader
// ============================================================================

EventalignReader::EventalignReader(std::vector<std::string> inputs, size_t max_reads)
    : inputs_(std::move(inputs)), max_reads_(max_reads) {
    if (inputs_.empty()) inputs_.emplace_back(STDIN_PATH);
}

EventalignReader::~EventalignReader() = default;

bool EventalignReader::next(ReadGroup& group) {
    if (max_reads_ > 0 && groups_emitted_ >= max_reads_) return false;

    while (true) {
        if (!current_ && !open_next_input()) return false;
        if (fill_group(group)) {
            ++groups_emitted_;
            return true;
        }
        current_.reset();  // exhausted, move to the next input
    }
}

bool EventalignReader::open_next_input() {
    while (file_idx_ < inputs_.size()) {
        const std::string& path = inputs_[file_idx_++];
        current_ = open_line_reader(path);
        current_line_no_ = 0;
        has_pending_ = false;

        if (!current_->readline(line_)) {
            current_.reset();  // empty input, no header
            continue;
        }
        ++current_line_no_;

        if (!has_layout_) {
            split_tsv(line_, fields_);
            layout_ = ColumnLayout::resolve(fields_);
            header_line_ = line_;
            has_layout_ = true;
        } else if (line_ != header_line_) {
            throw SchemaError("Header of " + current_->source() +
                              " differs from the header of " + inputs_.front());
        }
        return true;
    }
    return false;
}

bool EventalignReader::read_event(std::string& read_id, std::string& ref_id, EventRecord& record) {
    while (current_->readline(line_)) {
        ++current_line_no_;
        if (line_.empty()) continue;
        ++lines_read_;

        split_tsv(line_, fields_);
        if (fields_.size() < layout_.num_columns) {
            throw ParseError(current_->source() + ":" + std::to_string(current_line_no_) +
                             ": expected " + std::to_string(layout_.num_columns) +
                             " fields, found " + std::to_string(fields_.size()));
        }

        read_id.assign(fields_[layout_.read_id]);
        ref_id.assign(fields_[layout_.contig]);
        record.position.assign(fields_[layout_.position]);
        record.reference_kmer.assign(fields_[layout_.reference_kmer]);
        record.model_kmer.assign(fields_[layout_.model_kmer]);
        record.event_length.assign(fields_[layout_.event_length]);
        if (layout_.optional.signal_index) {
            record.start_idx.assign(fields_[layout_.start_idx]);
            record.end_idx.assign(fields_[layout_.end_idx]);
        }
        if (layout_.optional.samples) {
            record.samples.assign(fields_[layout_.samples]);
        }
        return true;
    }
    return false;
}

bool EventalignReader::fill_group(ReadGroup& group) {
    group.events.clear();
    group.columns = layout_.optional;

    if (has_pending_) {
        group.read_id = std::move(pending_read_id_);
        group.ref_id = std::move(pending_ref_id_);
        group.events.push_back(std::move(pending_event_));
        has_pending_ = false;
    } else {
        EventRecord first;
        if (!read_event(group.read_id, group.ref_id, first)) return false;
        group.events.push_back(std::move(first));
    }

    while (read_event(pending_read_id_, pending_ref_id_, pending_event_)) {
        if (pending_read_id_ != group.read_id || pending_ref_id_ != group.ref_id) {
            has_pending_ = true;
            return true;
        }
        group.events.push_back(std::move(pending_event_));
    }
    return true;
}

}  // namespace nanocollapse
