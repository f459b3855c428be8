#pragma once
// Abstract line reader over plain, gzip-compressed or stdin input.
//
// The rapidgzip backend lives in src/line_reader_backend.cpp, the only TU
// that includes rapidgzip headers. Every other TU sees this interface.

#include <cstddef>
#include <memory>
#include <string>

namespace nanocollapse {

// Input path that selects standard input.
constexpr const char* STDIN_PATH = "-";

class LineReader {
public:
    static constexpr size_t BUFFER_SIZE = 4 * 1024 * 1024;  // 4 MB

    virtual ~LineReader() = default;

    // Read one line (without trailing "\n" or "\r\n") into `line`.
    // Returns false on EOF. Throws IOError on a read failure.
    virtual bool readline(std::string& line) = 0;

    // Name used in log and error messages.
    virtual const std::string& source() const = 0;
};

// True when the file starts with the gzip magic bytes.
bool is_gzip(const std::string& path);

// Opens `path` ("-" for stdin). Gzip input is decompressed transparently.
// Throws IOError when the input cannot be opened.
std::unique_ptr<LineReader> open_line_reader(const std::string& path);

// Implemented in src/line_reader_backend.cpp.
// Returns nullptr when HAVE_RAPIDGZIP is not defined; caller falls back to zlib.
std::unique_ptr<LineReader> make_rapidgzip_reader(const std::string& path);

}  // namespace nanocollapse
