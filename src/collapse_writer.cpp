#include "nanocollapse/collapse_writer.hpp"
#include "nanocollapse/errors.hpp"

#include <string>

namespace nanocollapse {

CollapseWriter::CollapseWriter(const std::string& data_path, const std::string& index_path)
    : data_path_(data_path), index_path_(index_path) {
    data_.open(data_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!data_) throw IOError("Cannot open output file: " + data_path);
    index_.open(index_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!index_) throw IOError("Cannot open index file: " + index_path);

    index_ << INDEX_HEADER << '\n';
    check(index_, index_path_, "write");
}

void CollapseWriter::check(const std::ofstream& out, const std::string& path, const char* what) const {
    if (!out) {
        throw IOError(std::string("Failed to ") + what + " " + path);
    }
}

void CollapseWriter::write(const CollapsedRead& read) {
    const ReadSummary& s = read.summary;
    const uint64_t block_len = read.block.size();

    line_.clear();
    line_ += s.ref_id;
    line_ += '\t';
    line_ += std::to_string(s.ref_start);
    line_ += '\t';
    line_ += std::to_string(s.ref_end);
    line_ += '\t';
    line_ += s.read_id;
    line_ += '\t';
    line_ += std::to_string(s.kmers);
    line_ += '\t';
    append_float(line_, s.dwell_time);
    line_ += '\t';
    line_ += std::to_string(s.nnnnn_kmers);
    line_ += '\t';
    line_ += std::to_string(s.mismatch_kmers);
    line_ += '\t';
    line_ += std::to_string(s.missing_kmers);
    line_ += '\t';
    line_ += std::to_string(offset_);
    line_ += '\t';
    line_ += std::to_string(block_len > 0 ? block_len - 1 : 0);  // without trailing newline
    line_ += '\n';

    data_.write(read.block.data(), static_cast<std::streamsize>(block_len));
    check(data_, data_path_, "write");
    index_.write(line_.data(), static_cast<std::streamsize>(line_.size()));
    check(index_, index_path_, "write");

    offset_ += block_len;
    ++reads_written_;
}

void CollapseWriter::finish() {
    data_ << END_OF_DATA;
    data_.flush();
    check(data_, data_path_, "write");
    index_.flush();
    check(index_, index_path_, "write");
}

}  // namespace nanocollapse
