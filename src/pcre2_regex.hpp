#pragma once
#define PCRE2_CODE_UNIT_WIDTH 8
#include <pcre2.h>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>
#include <map>
#include <stdexcept>

namespace linescrub {
namespace pcre2_regex {

// Exception for bad patterns
class regex_error : public std::runtime_error {
public:
    regex_error(const std::string& message, std::size_t offset)
        : std::runtime_error(message), offset_(offset) {}

    // Byte offset in the pattern where compilation stopped
    std::size_t offset() const { return offset_; }

private:
    std::size_t offset_;
};

// Exception for a failed match call (resource limits, not "no match")
class match_error : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Get PCRE2 error message for an error code
std::string error_message(int errorcode);

// RAII owner of a compiled pattern. Immutable after construction and
// safe to match from several threads at once, each with its own MatchData.
class CompiledPattern {
public:
    explicit CompiledPattern(const std::string& pattern, bool use_jit = true);
    ~CompiledPattern();
    CompiledPattern(const CompiledPattern&) = delete;
    CompiledPattern& operator=(const CompiledPattern&) = delete;

    const std::string& pattern() const { return pattern_; }
    const pcre2_code* code() const { return code_; }
    bool jit_compiled() const { return jit_compiled_; }
    uint32_t capture_count() const { return capture_count_; }

    // name -> group index
    const std::map<std::string, int>& named_groups() const { return named_groups_; }

private:
    std::string pattern_;
    pcre2_code* code_;
    bool jit_compiled_;
    uint32_t capture_count_;
    std::map<std::string, int> named_groups_;
};

// RAII wrapper for pcre2_match_data; one per worker and pattern
class MatchData {
public:
    explicit MatchData(const CompiledPattern& pattern);
    ~MatchData();
    MatchData(const MatchData&) = delete;
    MatchData& operator=(const MatchData&) = delete;
    MatchData(MatchData&& other) noexcept;
    MatchData& operator=(MatchData&& other) noexcept;

    pcre2_match_data* get() const { return data_; }

private:
    pcre2_match_data* data_;
};

// Replacement template parsed once against a pattern.
// Syntax: $N, ${N}, $name, ${name}, $$ for a literal dollar sign.
class ReplacementTemplate {
public:
    ReplacementTemplate(const std::string& replacement, const CompiledPattern& pattern);

    const std::string& source() const { return source_; }

    // Append the expansion for the current match in match_data to out
    void expand(std::string_view subject, pcre2_match_data* match_data, std::string& out) const;

private:
    struct Piece {
        std::string text;  // literal text when group < 0
        int group;
    };

    void add_literal(const std::string& text);
    void add_group(int group);

    std::string source_;
    std::vector<Piece> pieces_;
};

// Replace every non-overlapping match of pattern in subject.
// Returns false (and leaves out untouched) when there was no match.
bool replace_all(const CompiledPattern& pattern, const ReplacementTemplate& replacement,
                 std::string_view subject, MatchData& match_data, std::string& out);

} // namespace pcre2_regex
} // namespace linescrub
