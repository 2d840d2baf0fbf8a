#define PCRE2_CODE_UNIT_WIDTH 8
#include "pcre2_regex.hpp"
#include <cctype>
#include <new>
#include <utility>

namespace linescrub {
namespace pcre2_regex {

// Empty string_views may carry a null data pointer, which pcre2_match rejects
static const char empty_subject[] = "";

std::string error_message(int errorcode) {
    PCRE2_UCHAR buffer[256];
    pcre2_get_error_message(errorcode, buffer, sizeof(buffer));
    return reinterpret_cast<const char*>(buffer);
}

// Extract named groups mapping from compiled pattern
static std::map<std::string, int> extract_named_groups(const pcre2_code* code) {
    std::map<std::string, int> named_groups;
    uint32_t namecount = 0;
    pcre2_pattern_info(code, PCRE2_INFO_NAMECOUNT, &namecount);
    if (namecount > 0) {
        PCRE2_SPTR nametable;
        uint32_t nameentrysize;
        pcre2_pattern_info(code, PCRE2_INFO_NAMETABLE, &nametable);
        pcre2_pattern_info(code, PCRE2_INFO_NAMEENTRYSIZE, &nameentrysize);
        for (uint32_t i = 0; i < namecount; i++) {
            PCRE2_SPTR entry = nametable + i * nameentrysize;
            int group_num = (entry[0] << 8) | entry[1];
            std::string name(reinterpret_cast<const char*>(entry + 2));
            named_groups[name] = group_num;
        }
    }
    return named_groups;
}

CompiledPattern::CompiledPattern(const std::string& pattern, bool use_jit)
    : pattern_(pattern), code_(nullptr), jit_compiled_(false), capture_count_(0) {
    int errorcode;
    PCRE2_SIZE erroroffset;
    code_ = pcre2_compile(
        reinterpret_cast<PCRE2_SPTR>(pattern.data()),
        pattern.size(),
        PCRE2_UTF | PCRE2_UCP,
        &errorcode, &erroroffset, nullptr);
    if (code_ == nullptr) {
        throw regex_error(error_message(errorcode), erroroffset);
    }
    if (use_jit) {
        // A pattern the JIT cannot handle still works through the interpreter
        jit_compiled_ = pcre2_jit_compile(code_, PCRE2_JIT_COMPLETE) == 0;
    }
    pcre2_pattern_info(code_, PCRE2_INFO_CAPTURECOUNT, &capture_count_);
    named_groups_ = extract_named_groups(code_);
}

CompiledPattern::~CompiledPattern() {
    if (code_) pcre2_code_free(code_);
}

MatchData::MatchData(const CompiledPattern& pattern)
    : data_(pcre2_match_data_create_from_pattern(pattern.code(), nullptr)) {
    if (data_ == nullptr) {
        throw std::bad_alloc();
    }
}

MatchData::~MatchData() {
    if (data_) pcre2_match_data_free(data_);
}

MatchData::MatchData(MatchData&& other) noexcept : data_(other.data_) {
    other.data_ = nullptr;
}

MatchData& MatchData::operator=(MatchData&& other) noexcept {
    if (this != &other) {
        if (data_) pcre2_match_data_free(data_);
        data_ = other.data_;
        other.data_ = nullptr;
    }
    return *this;
}

ReplacementTemplate::ReplacementTemplate(const std::string& replacement, const CompiledPattern& pattern)
    : source_(replacement) {
    auto is_name_char = [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
    };
    // Resolve a group reference; unknown groups expand to nothing
    auto add_reference = [&](const std::string& ref) {
        bool is_number = true;
        for (char c : ref) {
            if (!std::isdigit(static_cast<unsigned char>(c))) { is_number = false; break; }
        }
        if (is_number) {
            if (ref.size() > 9) return;
            int idx = std::stoi(ref);
            if (idx <= static_cast<int>(pattern.capture_count())) add_group(idx);
            return;
        }
        auto it = pattern.named_groups().find(ref);
        if (it != pattern.named_groups().end()) add_group(it->second);
    };

    std::string literal;
    size_t i = 0;
    while (i < replacement.size()) {
        if (replacement[i] != '$') {
            literal += replacement[i];
            i++;
            continue;
        }
        if (i + 1 < replacement.size() && replacement[i + 1] == '$') {
            literal += '$';
            i += 2;
            continue;
        }
        if (i + 1 < replacement.size() && replacement[i + 1] == '{') {
            // ${name} or ${number}
            size_t close = replacement.find('}', i + 2);
            if (close == std::string::npos || close == i + 2) {
                literal += '$';
                i++;
                continue;
            }
            add_literal(literal);
            literal.clear();
            add_reference(replacement.substr(i + 2, close - i - 2));
            i = close + 1;
            continue;
        }
        // $name or $number, taking the longest run of name characters
        size_t j = i + 1;
        while (j < replacement.size() && is_name_char(replacement[j])) j++;
        if (j == i + 1) {
            literal += '$';
            i++;
            continue;
        }
        add_literal(literal);
        literal.clear();
        add_reference(replacement.substr(i + 1, j - i - 1));
        i = j;
    }
    add_literal(literal);
}

void ReplacementTemplate::add_literal(const std::string& text) {
    if (text.empty()) return;
    if (!pieces_.empty() && pieces_.back().group < 0) {
        pieces_.back().text += text;
    } else {
        pieces_.push_back({text, -1});
    }
}

void ReplacementTemplate::add_group(int group) {
    pieces_.push_back({std::string(), group});
}

void ReplacementTemplate::expand(std::string_view subject, pcre2_match_data* match_data,
                                 std::string& out) const {
    PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match_data);
    uint32_t count = pcre2_get_ovector_count(match_data);
    for (const auto& piece : pieces_) {
        if (piece.group < 0) {
            out += piece.text;
            continue;
        }
        uint32_t idx = static_cast<uint32_t>(piece.group);
        if (idx >= count || ovector[2 * idx] == PCRE2_UNSET) continue;
        out.append(subject.substr(ovector[2 * idx], ovector[2 * idx + 1] - ovector[2 * idx]));
    }
}

// Run one match attempt; false on no match, throws on any other failure.
// Subjects are validated as UTF-8 before they reach the matcher.
static bool match_at(const CompiledPattern& pattern, std::string_view subject, size_t offset,
                     uint32_t options, MatchData& match_data) {
    const char* data = subject.data() ? subject.data() : empty_subject;
    int rc = pcre2_match(pattern.code(),
                         reinterpret_cast<PCRE2_SPTR>(data),
                         subject.size(), offset, options | PCRE2_NO_UTF_CHECK,
                         match_data.get(), nullptr);
    if (rc == PCRE2_ERROR_NOMATCH) return false;
    if (rc < 0) {
        throw match_error("Matching pattern '" + pattern.pattern() + "' failed: " + error_message(rc));
    }
    return true;
}

bool replace_all(const CompiledPattern& pattern, const ReplacementTemplate& replacement,
                 std::string_view subject, MatchData& match_data, std::string& out) {
    bool matched = false;
    size_t offset = 0;
    size_t last = 0;
    uint32_t options = 0;

    while (offset <= subject.size() && match_at(pattern, subject, offset, options, match_data)) {
        PCRE2_SIZE* ovector = pcre2_get_ovector_pointer(match_data.get());
        size_t start = ovector[0];
        size_t end = ovector[1];
        if (!matched) {
            out.clear();
            out.reserve(subject.size());
            matched = true;
        }
        out.append(subject.substr(last, start - last));
        replacement.expand(subject, match_data.get(), out);
        last = end;
        offset = end;
        options = PCRE2_NOTEMPTY_ATSTART;
    }
    if (matched) out.append(subject.substr(last));
    return matched;
}

} // namespace pcre2_regex
} // namespace linescrub
