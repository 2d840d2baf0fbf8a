#pragma once
#include "pcre2_regex.hpp"
#include "rule_compiler.hpp"
#include "thread_pool.hpp"
#include <string>
#include <string_view>
#include <vector>

namespace linescrub {

// Applies a rule set to one line at a time, reusing its match buffers.
// One instance per thread; the RuleSet itself is shared.
class LineScrubber {
public:
    explicit LineScrubber(const RuleSet& rules);

    // Each rule rewrites the output of the previous one, in rule order.
    // Throws match_error if the matcher gives up (resource limits).
    std::string scrub(std::string_view line);

private:
    const RuleSet& rules_;
    std::vector<pcre2_regex::MatchData> match_data_;
    std::string scratch_;
};

// Single line, no threads
std::string scrub_line(std::string_view line, const RuleSet& rules);

// Scrub every line on the pool. result[i] is always the scrubbed lines[i],
// whatever order the chunks finish in.
std::vector<std::string> scrub_lines(const std::vector<std::string_view>& lines,
                                     const RuleSet& rules, ThreadPool& pool);

} // namespace linescrub
