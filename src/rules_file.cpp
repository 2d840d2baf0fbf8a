#include "rules_file.hpp"
#include "line_source.hpp"
#include "string_utils.hpp"

namespace linescrub {
namespace rules_file {

static RuleList parse_lines(const std::vector<std::string_view>& lines, const std::string& filename) {
    RuleList rules;
    for (size_t i = 0; i < lines.size(); i++) {
        std::string line(lines[i]);
        if (string_utils::strip(line).empty() || string_utils::starts_with(line, "#")) continue;

        size_t tab = line.find('\t');
        if (tab == std::string::npos) {
            throw rules_file_error(filename + ":" + std::to_string(i + 1) +
                                   ": Expected \"pattern<TAB>replacement\", got \"" +
                                   string_utils::make_printable(line) + "\"");
        }
        if (tab == 0) {
            throw rules_file_error(filename + ":" + std::to_string(i + 1) + ": Empty pattern");
        }
        rules.emplace_back(line.substr(0, tab), line.substr(tab + 1));
    }
    return rules;
}

RuleList parse(const std::string& content, const std::string& filename) {
    return parse_lines(split_lines(content), filename);
}

RuleList load(const std::string& path) {
    BufferedLineSource source(path);
    return parse_lines(source.lines(), path);
}

} // namespace rules_file
} // namespace linescrub
