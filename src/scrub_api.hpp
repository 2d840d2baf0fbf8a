#pragma once
#include "globalvar.hpp"
#include "rule_compiler.hpp"
#include <cstddef>
#include <string>

namespace linescrub {

// Each call runs compile -> load -> scrub -> write and either returns the
// full line count or throws a scrub_error subclass:
//   rule_compilation_error  a pattern was rejected (nothing opened or created)
//   io_error                input could not be read, or output written/flushed
//   decoding_error          input is not valid UTF-8
//
// RuleList overloads apply rules in list order. RuleMap overloads apply them
// in the map's order (byte-wise by pattern text). With a braced initializer
// the two overloads are ambiguous; name the container type.

// Buffered strategy: sequential read, owned line copies
std::size_t scrub_stream_parallel(const std::string& input_path, const std::string& output_path,
                                  const RuleList& rules, const Settings& settings = Settings());
std::size_t scrub_stream_parallel(const std::string& input_path, const std::string& output_path,
                                  const RuleMap& rules, const Settings& settings = Settings());

// Memory-mapped strategy: zero-copy lines into the mapped file
std::size_t scrub_stream_mapped(const std::string& input_path, const std::string& output_path,
                                const RuleList& rules, const Settings& settings = Settings());
std::size_t scrub_stream_mapped(const std::string& input_path, const std::string& output_path,
                                const RuleMap& rules, const Settings& settings = Settings());

// In-memory transform of a single string, treated as one line
std::string scrub_text(const std::string& text, const RuleList& rules,
                       const Settings& settings = Settings());
std::string scrub_text(const std::string& text, const RuleMap& rules,
                       const Settings& settings = Settings());

} // namespace linescrub
