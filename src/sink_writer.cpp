#include "sink_writer.hpp"
#include "errors.hpp"
#include <cerrno>
#include <cstring>

namespace linescrub {

SinkWriter::SinkWriter(const std::string& path) : path_(path), finished_(false) {
    errno = 0;
    out_.open(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out_.is_open()) {
        std::string cause = errno != 0 ? std::strerror(errno) : "cannot open";
        throw io_error("Failed to create output file '" + path + "': " + cause, path);
    }
}

SinkWriter::~SinkWriter() {
    // finish() reports errors; this only releases the handle on error paths
    if (!finished_ && out_.is_open()) out_.close();
}

void SinkWriter::check_stream(const char* action) {
    if (!out_) {
        std::string cause = errno != 0 ? std::strerror(errno) : "stream error";
        throw io_error(std::string("Failed to ") + action + " output file '" + path_ + "': " + cause, path_);
    }
}

void SinkWriter::write_line(std::string_view line) {
    errno = 0;
    out_.write(line.data(), static_cast<std::streamsize>(line.size()));
    out_.put('\n');
    check_stream("write to");
}

void SinkWriter::finish() {
    if (finished_) return;
    finished_ = true;
    errno = 0;
    out_.flush();
    check_stream("flush");
    out_.close();
    check_stream("close");
}

std::size_t write_lines(const std::string& path, const std::vector<std::string>& lines) {
    SinkWriter writer(path);
    for (const auto& line : lines) {
        writer.write_line(line);
    }
    writer.finish();
    return lines.size();
}

} // namespace linescrub
