#pragma once
#include "pcre2_regex.hpp"
#include <map>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace linescrub {

// Rules in application order: (pattern, replacement)
using RuleList = std::vector<std::pair<std::string, std::string>>;

// Convenience mapping form; applied in byte-wise order of the pattern text
using RuleMap = std::map<std::string, std::string>;

// One validated rule, ready to be matched from any thread
struct CompiledRule {
    std::shared_ptr<const pcre2_regex::CompiledPattern> pattern;
    std::shared_ptr<const pcre2_regex::ReplacementTemplate> replacement;
};

class RuleSet;

// Compile every rule in the order given. Throws rule_compilation_error for
// the first pattern (or replacement) that is rejected; no partial set escapes.
RuleSet compile_rules(const RuleList& rules, bool use_jit = true);
RuleSet compile_rules(const RuleMap& rules, bool use_jit = true);

// Ordered, immutable list of compiled rules. Copies share the compiled
// patterns; nothing in it changes after compile_rules() returns.
class RuleSet {
public:
    RuleSet() = default;

    const std::vector<CompiledRule>& rules() const { return rules_; }
    std::size_t size() const { return rules_.size(); }
    bool empty() const { return rules_.empty(); }

private:
    friend RuleSet compile_rules(const RuleList& rules, bool use_jit);

    std::vector<CompiledRule> rules_;
};

// The ordered list a RuleMap is applied as
RuleList to_rule_list(const RuleMap& rules);

} // namespace linescrub
