#include "rule_compiler.hpp"
#include "errors.hpp"
#include "string_utils.hpp"

namespace linescrub {

RuleSet compile_rules(const RuleList& rules, bool use_jit) {
    RuleSet result;
    result.rules_.reserve(rules.size());

    for (const auto& rule : rules) {
        const std::string& pattern = rule.first;
        const std::string& replacement = rule.second;

        std::shared_ptr<const pcre2_regex::CompiledPattern> compiled;
        try {
            compiled = std::make_shared<pcre2_regex::CompiledPattern>(pattern, use_jit);
        } catch (const pcre2_regex::regex_error& e) {
            throw rule_compilation_error(pattern, e.what(), e.offset());
        }

        // Output of one rule is the subject of the next, so it must stay valid UTF-8
        std::size_t bad = string_utils::find_invalid_utf8(replacement);
        if (bad != std::string::npos) {
            throw rule_compilation_error(pattern, "replacement is not valid UTF-8", bad);
        }

        auto templ = std::make_shared<pcre2_regex::ReplacementTemplate>(replacement, *compiled);
        result.rules_.push_back({std::move(compiled), std::move(templ)});
    }
    return result;
}

RuleList to_rule_list(const RuleMap& rules) {
    return RuleList(rules.begin(), rules.end());
}

RuleSet compile_rules(const RuleMap& rules, bool use_jit) {
    return compile_rules(to_rule_list(rules), use_jit);
}

} // namespace linescrub
