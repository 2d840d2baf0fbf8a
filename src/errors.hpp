#pragma once
#include <string>
#include <cstddef>
#include <stdexcept>

namespace linescrub {

// Base of every error a scrub operation can report
class scrub_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// A pattern failed to compile; nothing was processed
class rule_compilation_error : public scrub_error {
public:
    rule_compilation_error(const std::string& pattern, const std::string& reason, std::size_t offset)
        : scrub_error("Invalid regex pattern '" + pattern + "': " + reason +
                      " at offset " + std::to_string(offset)),
          pattern_(pattern), reason_(reason), offset_(offset) {}

    const std::string& pattern() const { return pattern_; }
    const std::string& reason() const { return reason_; }
    std::size_t offset() const { return offset_; }

private:
    std::string pattern_;
    std::string reason_;
    std::size_t offset_;
};

// Source or destination could not be opened, read, written or flushed
class io_error : public scrub_error {
public:
    io_error(const std::string& message, const std::string& path)
        : scrub_error(message), path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

// Input bytes are not valid UTF-8
class decoding_error : public scrub_error {
public:
    using scrub_error::scrub_error;
};

// The matcher reported a failure other than "no match"
class match_error : public scrub_error {
public:
    using scrub_error::scrub_error;
};

} // namespace linescrub
