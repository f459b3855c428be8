#pragma once

#include "nanocollapse/collapse.hpp"

#include <cstdint>
#include <fstream>
#include <string>

namespace nanocollapse {

/**
 * @brief Writes collapsed reads to the data file and its byte-offset index
 *
 * Each index row locates one block: reading byte_len bytes at byte_offset of
 * the data file yields the block without its trailing newline. Blocks are
 * written in call order. finish() appends the "#" end-of-data line; a data
 * file without it is incomplete.
 */
class CollapseWriter {
public:
    static constexpr const char* INDEX_HEADER =
        "ref_id\tref_start\tref_end\tread_id\tkmers\tdwell_time\tNNNNN_kmers"
        "\tmismatch_kmers\tmissing_kmers\tbyte_offset\tbyte_len";
    static constexpr const char* END_OF_DATA = "#\n";

    // Truncates both files and writes the index header. Throws IOError.
    CollapseWriter(const std::string& data_path, const std::string& index_path);

    CollapseWriter(const CollapseWriter&) = delete;
    CollapseWriter& operator=(const CollapseWriter&) = delete;

    // Throws IOError.
    void write(const CollapsedRead& read);

    // End-of-data line and flush. Throws IOError.
    void finish();

    uint64_t reads_written() const { return reads_written_; }
    uint64_t bytes_written() const { return offset_; }

private:
    void check(const std::ofstream& out, const std::string& path, const char* what) const;

    std::string data_path_;
    std::string index_path_;
    std::ofstream data_;
    std::ofstream index_;
    uint64_t offset_ = 0;
    uint64_t reads_written_ = 0;
    std::string line_;
};

}  // namespace nanocollapse
