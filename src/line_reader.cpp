#include "nanocollapse/line_reader.hpp"
#include "nanocollapse/errors.hpp"

#include <cstdio>
#include <cstring>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>
#include <zlib.h>

namespace nanocollapse {

namespace {

// zlib reads plain files transparently, so this one class covers plain files,
// gzip files without rapidgzip, and stdin.
class ZlibLineReader : public LineReader {
public:
    ZlibLineReader(gzFile gz, std::string source)
        : gz_(gz), source_(std::move(source)) {
        gzbuffer(gz_, 1024 * 1024);  // 1MB internal buffer
        buf_.resize(BUFFER_SIZE);
    }

    ~ZlibLineReader() override {
        if (gz_) gzclose(gz_);
    }

    ZlibLineReader(const ZlibLineReader&) = delete;
    ZlibLineReader& operator=(const ZlibLineReader&) = delete;

    bool readline(std::string& line) override {
        line.clear();
        while (true) {
            const char* start = buf_.data() + pos_;
            const size_t avail = used_ - pos_;
            const char* nl = static_cast<const char*>(memchr(start, '\n', avail));
            if (nl) {
                line.append(start, static_cast<size_t>(nl - start));
                pos_ = static_cast<size_t>(nl - buf_.data()) + 1;
                strip_cr(line);
                return true;
            }
            line.append(start, avail);
            pos_ = used_ = 0;
            if (eof_ || !refill()) {
                strip_cr(line);
                return !line.empty();
            }
        }
    }

    const std::string& source() const override { return source_; }

private:
    static void strip_cr(std::string& line) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
    }

    bool refill() {
        const int n = gzread(gz_, buf_.data(), static_cast<unsigned>(buf_.size()));
        if (n < 0) {
            int errnum = 0;
            const char* msg = gzerror(gz_, &errnum);
            throw IOError("Read failed on " + source_ + ": " + (msg ? msg : "unknown zlib error"));
        }
        if (n == 0) {
            eof_ = true;
            return false;
        }
        used_ = static_cast<size_t>(n);
        pos_ = 0;
        return true;
    }

    gzFile gz_ = nullptr;
    std::string source_;
    std::vector<char> buf_;
    size_t pos_ = 0;
    size_t used_ = 0;
    bool eof_ = false;
};

}  // namespace

bool is_gzip(const std::string& path) {
    FILE* f = fopen(path.c_str(), "rb");
    if (!f) return false;
    unsigned char magic[2] = {0, 0};
    const bool gz = (fread(magic, 1, 2, f) == 2) &&
                    (magic[0] == 0x1f && magic[1] == 0x8b);
    fclose(f);
    return gz;
}

std::unique_ptr<LineReader> open_line_reader(const std::string& path) {
    if (path == STDIN_PATH) {
        // gzclose() closes its descriptor; keep the process stdin open.
        const int fd = dup(STDIN_FILENO);
        if (fd < 0) throw IOError("Cannot duplicate stdin descriptor");
        gzFile gz = gzdopen(fd, "rb");
        if (!gz) {
            close(fd);
            throw IOError("Cannot open stdin for reading");
        }
        return std::make_unique<ZlibLineReader>(gz, "<stdin>");
    }

    if (is_gzip(path)) {
        if (auto reader = make_rapidgzip_reader(path)) return reader;
    }

    gzFile gz = gzopen(path.c_str(), "rb");
    if (!gz) throw IOError("Cannot open input file: " + path);
    return std::make_unique<ZlibLineReader>(gz, path);
}

}  // namespace nanocollapse
