#pragma once
#include <cstddef>
#include <fstream>
#include <string>
#include <string_view>
#include <vector>

namespace linescrub {

// Writes records terminated by '\n' to a plain UTF-8 text file, whatever the
// path is called. Any failure throws io_error; bytes already handed
// to the destination are left in place.
class SinkWriter {
public:
    explicit SinkWriter(const std::string& path);
    ~SinkWriter();
    SinkWriter(const SinkWriter&) = delete;
    SinkWriter& operator=(const SinkWriter&) = delete;

    void write_line(std::string_view line);
    // Flush everything and close; success is only reported after this returns
    void finish();

private:
    void check_stream(const char* action);

    std::string path_;
    std::ofstream out_;
    bool finished_;
};

// Write all lines in order; returns the number of records written
std::size_t write_lines(const std::string& path, const std::vector<std::string>& lines);

} // namespace linescrub
