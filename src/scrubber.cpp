#include "scrubber.hpp"
#include "errors.hpp"
#include "globalvar.hpp"
#include <algorithm>

namespace linescrub {

LineScrubber::LineScrubber(const RuleSet& rules) : rules_(rules) {
    match_data_.reserve(rules.size());
    for (const auto& rule : rules.rules()) {
        match_data_.emplace_back(*rule.pattern);
    }
}

std::string LineScrubber::scrub(std::string_view line) {
    std::string current(line);
    const auto& rules = rules_.rules();
    for (size_t i = 0; i < rules.size(); i++) {
        try {
            if (pcre2_regex::replace_all(*rules[i].pattern, *rules[i].replacement,
                                         current, match_data_[i], scratch_)) {
                current.swap(scratch_);
            }
        } catch (const pcre2_regex::match_error& e) {
            throw match_error(e.what());
        }
    }
    return current;
}

std::string scrub_line(std::string_view line, const RuleSet& rules) {
    LineScrubber scrubber(rules);
    return scrubber.scrub(line);
}

static void scrub_range(const std::vector<std::string_view>& lines, const RuleSet& rules,
                        std::vector<std::string>& result, size_t begin, size_t end) {
    LineScrubber scrubber(rules);
    for (size_t i = begin; i < end; i++) {
        result[i] = scrubber.scrub(lines[i]);
    }
}

std::vector<std::string> scrub_lines(const std::vector<std::string_view>& lines,
                                     const RuleSet& rules, ThreadPool& pool) {
    const size_t n = lines.size();
    std::vector<std::string> result(n);
    if (n == 0) return result;

    // Small inputs are not worth the hand-off to the pool
    if (pool.size() <= 1 || n < 2 * globalvar::min_lines_per_chunk) {
        scrub_range(lines, rules, result, 0, n);
        return result;
    }

    size_t chunks = std::min(pool.size() * globalvar::chunks_per_worker,
                             (n + globalvar::min_lines_per_chunk - 1) / globalvar::min_lines_per_chunk);
    size_t chunk_size = (n + chunks - 1) / chunks;

    run_chunks(pool, n, chunk_size, [&lines, &rules, &result](size_t begin, size_t end) {
        scrub_range(lines, rules, result, begin, end);
    });
    return result;
}

} // namespace linescrub
