#include "scrub_api.hpp"
#include "errors.hpp"
#include "line_source.hpp"
#include "scrubber.hpp"
#include "sink_writer.hpp"
#include "string_utils.hpp"
#include "thread_pool.hpp"

namespace linescrub {

static void log_compiled(const Settings& settings, const RuleSet& rule_set) {
    if (!settings.debug) return;
    std::size_t jit = 0;
    for (const auto& rule : rule_set.rules()) {
        if (rule.pattern->jit_compiled()) jit++;
    }
    debug_log(settings, "Compiled " + std::to_string(rule_set.size()) + " rules (" +
                        std::to_string(jit) + " JIT)");
    if (settings.use_jit && jit < rule_set.size()) {
        debug_log(settings, std::to_string(rule_set.size() - jit) + " rules fell back to the interpreter");
    }
}

template <class Source>
static std::size_t scrub_stream(const char* strategy, const std::string& input_path,
                                const std::string& output_path, const RuleList& rules,
                                const Settings& settings) {
    // Rules first: a bad pattern must fail before anything is opened
    RuleSet rule_set = compile_rules(rules, settings.use_jit);
    log_compiled(settings, rule_set);

    Source source(input_path);
    debug_log(settings, std::string("Loaded ") + std::to_string(source.size()) + " lines from '" +
                        input_path + "' (" + strategy + ")");

    std::vector<std::string> scrubbed;
    {
        ThreadPool pool(settings.workers());
        debug_log(settings, "Scrubbing with " + std::to_string(pool.size()) + " workers");
        scrubbed = scrub_lines(source.lines(), rule_set, pool);
    }

    std::size_t written = write_lines(output_path, scrubbed);
    debug_log(settings, "Wrote " + std::to_string(written) + " lines to '" + output_path + "'");
    return written;
}

std::size_t scrub_stream_parallel(const std::string& input_path, const std::string& output_path,
                                  const RuleList& rules, const Settings& settings) {
    return scrub_stream<BufferedLineSource>("buffered", input_path, output_path, rules, settings);
}

std::size_t scrub_stream_parallel(const std::string& input_path, const std::string& output_path,
                                  const RuleMap& rules, const Settings& settings) {
    return scrub_stream_parallel(input_path, output_path, to_rule_list(rules), settings);
}

std::size_t scrub_stream_mapped(const std::string& input_path, const std::string& output_path,
                                const RuleList& rules, const Settings& settings) {
    return scrub_stream<MappedLineSource>("memory-mapped", input_path, output_path, rules, settings);
}

std::size_t scrub_stream_mapped(const std::string& input_path, const std::string& output_path,
                                const RuleMap& rules, const Settings& settings) {
    return scrub_stream_mapped(input_path, output_path, to_rule_list(rules), settings);
}

std::string scrub_text(const std::string& text, const RuleList& rules, const Settings& settings) {
    RuleSet rule_set = compile_rules(rules, settings.use_jit);
    log_compiled(settings, rule_set);
    std::size_t bad = string_utils::find_invalid_utf8(text);
    if (bad != std::string::npos) {
        throw decoding_error("Invalid UTF-8 in text at byte offset " + std::to_string(bad));
    }
    return scrub_line(text, rule_set);
}

std::string scrub_text(const std::string& text, const RuleMap& rules, const Settings& settings) {
    return scrub_text(text, to_rule_list(rules), settings);
}

} // namespace linescrub
