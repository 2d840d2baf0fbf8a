#pragma once
#include "globalvar.hpp"
#include "rule_compiler.hpp"
#include <cstddef>
#include <string>
#include <utility>

namespace linescrub {

struct BenchmarkResult {
    double parallel_seconds;
    double sequential_seconds;
    // sequential_seconds / parallel_seconds, 0 when the parallel pass took no time
    double speedup;
    std::size_t parallel_lines;
    std::size_t sequential_lines;
    // lines per second
    double parallel_throughput;
    double sequential_throughput;
};

// Times the parallel engine against a single-worker pass of the same engine
class Benchmark {
public:
    // Uses the default PII rule preset
    explicit Benchmark(const Settings& settings = Settings());
    explicit Benchmark(RuleList rules, const Settings& settings = Settings());

    const RuleList& rules() const { return rules_; }

    // (elapsed seconds, lines processed)
    std::pair<double, std::size_t> run_parallel(const std::string& input_path, const std::string& output_path,
                                                bool use_mmap = false) const;
    std::pair<double, std::size_t> run_sequential(const std::string& input_path,
                                                  const std::string& output_path) const;

    // Empty output paths default to <input>.parallel.scrubbed and
    // <input>.sequential.scrubbed
    BenchmarkResult run(const std::string& input_path, const std::string& parallel_output = "",
                        const std::string& sequential_output = "", bool use_mmap = false) const;

private:
    RuleList rules_;
    Settings settings_;
};

} // namespace linescrub
