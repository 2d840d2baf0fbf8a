#pragma once
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace linescrub {

// Split content into lines at '\n'. A '\r' directly before the '\n' is part
// of the terminator. A final '\n' does not start another (empty) line, and
// empty content has no lines.
std::vector<std::string_view> split_lines(std::string_view content);

// Materialized input lines. The views stay valid as long as the source lives.
class LineSource {
public:
    virtual ~LineSource() = default;

    const std::vector<std::string_view>& lines() const { return lines_; }
    std::size_t size() const { return lines_.size(); }
    const std::string& path() const { return path_; }

protected:
    explicit LineSource(const std::string& path) : path_(path) {}

    std::string path_;
    std::vector<std::string_view> lines_;
};

// Sequential chunked read of the raw bytes; every line is an owned copy.
// Throws io_error or decoding_error.
class BufferedLineSource : public LineSource {
public:
    explicit BufferedLineSource(const std::string& path);

private:
    void add_line(std::string& pending);

    std::vector<std::string> storage_;
};

// Read-only memory map of the whole file; lines point into the mapping.
// The mapping is checked as UTF-8 in full before any line is sliced.
class MappedLineSource : public LineSource {
public:
    explicit MappedLineSource(const std::string& path);
    ~MappedLineSource() override;
    MappedLineSource(const MappedLineSource&) = delete;
    MappedLineSource& operator=(const MappedLineSource&) = delete;

    std::string_view content() const;

private:
    void* address_;
    std::size_t length_;
};

} // namespace linescrub
