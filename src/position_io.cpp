#include "degen/position_io.hpp"
#include "degen/errors.hpp"

#include <cstdio>
#include <cstring>
#include <unistd.h>
#include <zlib.h>

namespace degen {

// Large I/O buffer for zlib reads
constexpr unsigned GZBUF_SIZE = 256 * 1024;

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n";
    const size_t b = s.find_first_not_of(ws);
    if (b == std::string::npos) return "";
    const size_t e = s.find_last_not_of(ws);
    return s.substr(b, e - b + 1);
}

// Owns a gzFile; closes on scope exit
class GzInput {
public:
    explicit GzInput(const std::string& path) {
        if (path == "-") {
            // dup so gzclose does not close the process stdin
            const int fd = dup(fileno(stdin));
            if (fd >= 0) file_ = gzdopen(fd, "rb");
        } else {
            file_ = gzopen(path.c_str(), "rb");
        }
        if (file_) gzbuffer(file_, GZBUF_SIZE);
    }
    ~GzInput() {
        if (file_) gzclose(file_);
    }
    GzInput(const GzInput&) = delete;
    GzInput& operator=(const GzInput&) = delete;

    bool is_open() const { return file_ != nullptr; }

    // Read one line without the trailing newline. Returns false on EOF.
    bool getline(std::string& line) {
        line.clear();
        bool got_any = false;
        while (gzgets(file_, buffer_, sizeof(buffer_))) {
            got_any = true;
            size_t len = strlen(buffer_);
            if (len > 0 && buffer_[len - 1] == '\n') {
                line.append(buffer_, len - 1);
                return true;
            }
            line.append(buffer_, len);
        }
        return got_any;
    }

    bool failed() {
        int err = Z_OK;
        gzerror(file_, &err);
        return err != Z_OK && err != Z_STREAM_END;
    }

private:
    gzFile file_ = nullptr;
    char buffer_[65536];
};

}  // namespace

Position parse_position_line(const std::string& line, uint32_t ordinal) {
    Position p;
    p.id = ordinal;

    const std::string text = trim(line);
    const size_t tab = text.rfind('\t');
    const size_t split = tab != std::string::npos ? tab : text.find_last_of(' ');

    if (split == std::string::npos) {
        p.name = "Position " + std::to_string(ordinal);
        p.codon = text;
    } else {
        p.name = trim(text.substr(0, split));
        p.codon = trim(text.substr(split + 1));
        if (p.name.empty()) p.name = "Position " + std::to_string(ordinal);
    }
    return p;
}

std::vector<Position> read_positions(const std::string& path) {
    GzInput in(path);
    if (!in.is_open()) {
        throw DegenError(ErrorKind::INPUT_FORMAT, "Cannot open position file: " + path);
    }

    std::vector<Position> positions;
    std::string line;
    while (in.getline(line)) {
        const std::string text = trim(line);
        if (text.empty() || text[0] == '#') continue;
        positions.push_back(parse_position_line(text, static_cast<uint32_t>(positions.size() + 1)));
    }

    if (in.failed()) {
        throw DegenError(ErrorKind::INPUT_FORMAT, "Read error in position file: " + path);
    }
    if (positions.empty()) {
        throw DegenError(ErrorKind::INPUT_FORMAT, "No positions found in " + path);
    }
    return positions;
}

}  // namespace degen
