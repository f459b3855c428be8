// line_reader_backend.cpp
// Implements make_rapidgzip_reader() - the only translation unit that
// includes rapidgzip headers, isolating its ODR-visible symbols from all
// other TUs.

#ifdef HAVE_RAPIDGZIP
#include <rapidgzip/rapidgzip.hpp>
#include <filereader/Standard.hpp>
#endif

#include "nanocollapse/line_reader.hpp"

#include <cstring>
#include <memory>
#include <string>
#include <vector>

namespace {

#ifdef HAVE_RAPIDGZIP
class RapidgzipLineReader : public nanocollapse::LineReader {
public:
    explicit RapidgzipLineReader(const std::string& path)
        : source_(path) {
        buf_.resize(BUFFER_SIZE);
        reader_ = std::make_unique<rapidgzip::ParallelGzipReader<>>(
            std::make_unique<rapidgzip::StandardFileReader>(path),
            0,          // threads: 0 = auto-detect from hardware_concurrency
            BUFFER_SIZE
        );
    }

    bool readline(std::string& line) override {
        line.clear();
        while (true) {
            const char* start = buf_.data() + buf_pos_;
            const size_t avail = buf_used_ - buf_pos_;
            const char* nl = static_cast<const char*>(std::memchr(start, '\n', avail));
            if (nl) {
                line.append(start, static_cast<size_t>(nl - start));
                buf_pos_ = static_cast<size_t>(nl - buf_.data()) + 1;
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return true;
            }
            line.append(start, avail);
            buf_pos_ = buf_used_ = 0;
            if (eof_ || !refill()) {
                if (!line.empty() && line.back() == '\r') line.pop_back();
                return !line.empty();
            }
        }
    }

    const std::string& source() const override { return source_; }

private:
    bool refill() {
        const size_t n = reader_->read(buf_.data(), buf_.size());
        if (n == 0) { eof_ = true; return false; }
        buf_used_ = n;
        buf_pos_  = 0;
        return true;
    }

    std::unique_ptr<rapidgzip::ParallelGzipReader<>> reader_;
    std::string       source_;
    std::vector<char> buf_;
    size_t            buf_pos_ = 0;
    size_t            buf_used_ = 0;
    bool              eof_ = false;
};
#endif  // HAVE_RAPIDGZIP

}  // anonymous namespace

namespace nanocollapse {

std::unique_ptr<LineReader> make_rapidgzip_reader(const std::string& path) {
#ifdef HAVE_RAPIDGZIP
    return std::make_unique<RapidgzipLineReader>(path);
#else
    (void)path;
    return nullptr;  // caller falls back to zlib
#endif
}

}  // namespace nanocollapse
