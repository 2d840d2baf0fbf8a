#pragma once
#include <string>
#include <vector>
#include <utility>
#include <cstddef>

namespace linescrub {
namespace globalvar {

// Version info
constexpr int version_major = 0;
constexpr int version_minor = 1;
constexpr int version_release = 0;
inline const std::string linescrub_version = "0.1.0";

// Environment variables read by Settings::from_environment()
inline const std::string env_threads = "LINESCRUB_THREADS";
inline const std::string env_no_jit = "LINESCRUB_NO_JIT";
inline const std::string env_debug = "LINESCRUB_DEBUG";

// Bytes requested per read call by the buffered line source
constexpr std::size_t io_chunk_size = 1 << 16;

// Below this many lines per worker the pool is not worth waking up
constexpr std::size_t min_lines_per_chunk = 256;

// Chunks handed out per worker, so a slow chunk does not stall the pass
constexpr std::size_t chunks_per_worker = 4;

// Default rule set: the PII patterns most log redaction jobs start from
inline std::vector<std::pair<std::string, std::string>> default_pii_rules() {
    return {
        {R"(\b[A-Za-z0-9._%+-]+@[A-Za-z0-9.-]+\.[A-Z|a-z]{2,}\b)", "[EMAIL]"},
        {R"(\b(?:\d{1,3}\.){3}\d{1,3}\b)", "[IP]"},
        {R"(\b(?:\d{4}[-\s]?){3}\d{4}\b)", "[CREDIT_CARD]"},
        {R"(\b\d{3}-\d{2}-\d{4}\b)", "[SSN]"},
        {R"(\+?1[-.]?\d{3}[-.]?\d{3}[-.]?\d{4})", "[PHONE]"},
        {R"(Bearer\s+[A-Za-z0-9\-._~+/]+=*)", "Bearer [TOKEN]"},
    };
}

} // namespace globalvar

// Per-call tuning knobs
struct Settings {
    // 0 = one worker per hardware thread
    unsigned worker_count = 0;
    bool use_jit = true;
    bool debug = false;

    // Resolved worker count (never 0)
    unsigned workers() const;

    // Defaults overridden by LINESCRUB_* environment variables
    static Settings from_environment();
};

// Print a "[Debug]" line to stderr when enabled
void debug_log(const Settings& settings, const std::string& message);

} // namespace linescrub
