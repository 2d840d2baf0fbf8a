#include "benchmark.hpp"
#include "errors.hpp"
#include "scrub_api.hpp"
#include <chrono>
#include <tuple>

namespace linescrub {

Benchmark::Benchmark(const Settings& settings)
    : rules_(globalvar::default_pii_rules()), settings_(settings) {}

Benchmark::Benchmark(RuleList rules, const Settings& settings)
    : rules_(std::move(rules)), settings_(settings) {}

template <class F>
static std::pair<double, std::size_t> timed(F&& f) {
    auto start = std::chrono::steady_clock::now();
    std::size_t lines = f();
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
    return {elapsed.count(), lines};
}

std::pair<double, std::size_t> Benchmark::run_parallel(const std::string& input_path,
                                                       const std::string& output_path,
                                                       bool use_mmap) const {
    return timed([&] {
        return use_mmap ? scrub_stream_mapped(input_path, output_path, rules_, settings_)
                        : scrub_stream_parallel(input_path, output_path, rules_, settings_);
    });
}

std::pair<double, std::size_t> Benchmark::run_sequential(const std::string& input_path,
                                                         const std::string& output_path) const {
    Settings single = settings_;
    single.worker_count = 1;
    return timed([&] { return scrub_stream_parallel(input_path, output_path, rules_, single); });
}

BenchmarkResult Benchmark::run(const std::string& input_path, const std::string& parallel_output,
                               const std::string& sequential_output, bool use_mmap) const {
    std::string par_out = parallel_output.empty() ? input_path + ".parallel.scrubbed" : parallel_output;
    std::string seq_out = sequential_output.empty() ? input_path + ".sequential.scrubbed" : sequential_output;

    BenchmarkResult result{};
    debug_log(settings_, "Benchmark: parallel pass on " + std::to_string(settings_.workers()) + " workers");
    std::tie(result.parallel_seconds, result.parallel_lines) = run_parallel(input_path, par_out, use_mmap);
    debug_log(settings_, "Benchmark: sequential pass");
    std::tie(result.sequential_seconds, result.sequential_lines) = run_sequential(input_path, seq_out);

    if (result.parallel_lines != result.sequential_lines) {
        throw scrub_error("Benchmark passes disagree: " + std::to_string(result.parallel_lines) +
                          " vs " + std::to_string(result.sequential_lines) + " lines");
    }

    result.speedup = result.parallel_seconds > 0 ? result.sequential_seconds / result.parallel_seconds : 0;
    result.parallel_throughput = result.parallel_seconds > 0 ? result.parallel_lines / result.parallel_seconds : 0;
    result.sequential_throughput =
        result.sequential_seconds > 0 ? result.sequential_lines / result.sequential_seconds : 0;
    return result;
}

} // namespace linescrub
