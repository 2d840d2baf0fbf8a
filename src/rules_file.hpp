#pragma once
#include "rule_compiler.hpp"
#include <stdexcept>
#include <string>

namespace linescrub {

// Malformed rules file; the message carries the line number
class rules_file_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

namespace rules_file {

// Parse "pattern<TAB>replacement" lines. Blank lines and lines starting with
// '#' are skipped. Only the first TAB separates; the replacement may be empty.
// File order is application order.
RuleList parse(const std::string& content, const std::string& filename = "<rules>");

// Read and parse a rules file; io_error / decoding_error / rules_file_error
RuleList load(const std::string& path);

} // namespace rules_file
} // namespace linescrub
