#include "line_source.hpp"
#include "errors.hpp"
#include "globalvar.hpp"
#include "string_utils.hpp"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace linescrub {

std::vector<std::string_view> split_lines(std::string_view content) {
    std::vector<std::string_view> lines;
    size_t start = 0;
    while (start < content.size()) {
        size_t nl = content.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(content.substr(start));
            break;
        }
        size_t end = nl;
        if (end > start && content[end - 1] == '\r') end--;
        lines.push_back(content.substr(start, end - start));
        start = nl + 1;
    }
    return lines;
}

// ---- buffered strategy ----

BufferedLineSource::BufferedLineSource(const std::string& path) : LineSource(path) {
    errno = 0;
    std::ifstream ifs(path, std::ios::in | std::ios::binary);
    if (!ifs.is_open()) {
        std::string cause = errno != 0 ? std::strerror(errno) : "cannot open";
        throw io_error("Failed to open input file '" + path + "': " + cause, path);
    }
    std::vector<char> buffer(globalvar::io_chunk_size);
    std::string pending;

    for (;;) {
        errno = 0;
        ifs.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        size_t n = static_cast<size_t>(ifs.gcount());
        if (ifs.bad()) {
            std::string cause = errno != 0 ? std::strerror(errno) : "stream error";
            throw io_error("Failed to read input file '" + path + "': " + cause, path);
        }
        if (n == 0) break;
        const char* p = buffer.data();
        const char* end = p + n;
        while (p < end) {
            const char* nl = static_cast<const char*>(std::memchr(p, '\n', end - p));
            if (nl == nullptr) {
                pending.append(p, end);
                break;
            }
            pending.append(p, nl);
            // "\r\n" may straddle two chunks, so strip only once the '\n' is seen
            if (!pending.empty() && pending.back() == '\r') pending.pop_back();
            add_line(pending);
            p = nl + 1;
        }
        if (ifs.eof()) break;
    }
    if (!pending.empty()) add_line(pending);

    // storage_ is final now; views into it stay put
    lines_.reserve(storage_.size());
    for (const auto& line : storage_) {
        lines_.emplace_back(line);
    }
}

void BufferedLineSource::add_line(std::string& pending) {
    if (!string_utils::is_valid_utf8(pending)) {
        throw decoding_error("Invalid UTF-8 in input file '" + path_ + "' at line " +
                             std::to_string(storage_.size() + 1));
    }
    storage_.push_back(std::move(pending));
    pending.clear();
}

// ---- memory-mapped strategy ----

MappedLineSource::MappedLineSource(const std::string& path)
    : LineSource(path), address_(nullptr), length_(0) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        throw io_error("Failed to open input file '" + path + "': " + std::strerror(errno), path);
    }

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        int err = errno;
        ::close(fd);
        throw io_error("Failed to stat input file '" + path + "': " + std::strerror(err), path);
    }
    if (!S_ISREG(st.st_mode)) {
        ::close(fd);
        throw io_error("Failed to memory-map input file '" + path + "': not a regular file", path);
    }

    // mmap rejects zero-length mappings; an empty file simply has no lines
    if (st.st_size > 0) {
        void* addr = ::mmap(nullptr, static_cast<size_t>(st.st_size), PROT_READ, MAP_PRIVATE, fd, 0);
        int err = errno;
        ::close(fd);
        if (addr == MAP_FAILED) {
            throw io_error("Failed to memory-map input file '" + path + "': " + std::strerror(err), path);
        }
        address_ = addr;
        length_ = static_cast<size_t>(st.st_size);
    } else {
        ::close(fd);
    }

    // The destructor does not run for a throwing constructor
    try {
        std::string_view data = content();
        size_t bad = string_utils::find_invalid_utf8(data);
        if (bad != std::string_view::npos) {
            throw decoding_error("Invalid UTF-8 in input file '" + path + "' at byte offset " +
                                 std::to_string(bad));
        }
        lines_ = split_lines(data);
    } catch (...) {
        if (address_ != nullptr) ::munmap(address_, length_);
        throw;
    }
}

MappedLineSource::~MappedLineSource() {
    if (address_ != nullptr) ::munmap(address_, length_);
}

std::string_view MappedLineSource::content() const {
    if (address_ == nullptr) return std::string_view();
    return std::string_view(static_cast<const char*>(address_), length_);
}

} // namespace linescrub
