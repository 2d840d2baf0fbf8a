#include "benchmark.hpp"
#include "errors.hpp"
#include "globalvar.hpp"
#include "rules_file.hpp"
#include "sample_logs.hpp"
#include "scrub_api.hpp"
#include <cstdio>
#include <iostream>
#include <string>
#include <vector>

using namespace linescrub;

static void print_usage() {
    std::cerr << "Usage:\n"
              << "  linescrub file <input> <output> [options]\n"
              << "  linescrub text <text> [options]\n"
              << "  linescrub bench <input> [options]\n"
              << "  linescrub generate <output> <line-count> [--seed <n>]\n"
              << "\nOptions:\n"
              << "  --rules <path>     Rules file, one \"pattern<TAB>replacement\" per line\n"
              << "                     (default: built-in PII rules)\n"
              << "  --mmap             Read the input through a memory map (file, bench)\n"
              << "  --threads <n>      Worker threads (default: all cores)\n"
              << "  --no-jit           Do not JIT-compile patterns\n"
              << "  --debug            Print debug messages\n"
              << "\nEnvironment: " << globalvar::env_threads << ", " << globalvar::env_no_jit
              << ", " << globalvar::env_debug << "\n";
}

struct CommonOptions {
    std::string rules_path;
    bool use_mmap = false;
    Settings settings = Settings::from_environment();
    std::vector<std::string> positional;
};

// Returns false after printing a message when an option is not understood
static bool parse_options(int argc, char* argv[], int first, CommonOptions& opts) {
    for (int i = first; i < argc; i++) {
        std::string arg = argv[i];
        if (arg == "--rules" && i + 1 < argc) {
            opts.rules_path = argv[++i];
        } else if (arg == "--mmap") {
            opts.use_mmap = true;
        } else if (arg == "--threads" && i + 1 < argc) {
            try {
                opts.settings.worker_count = static_cast<unsigned>(std::stoul(argv[++i]));
            } catch (const std::exception&) {
                std::cerr << "Error: invalid thread count \"" << argv[i] << "\"\n";
                return false;
            }
        } else if (arg == "--no-jit") {
            opts.settings.use_jit = false;
        } else if (arg == "--debug") {
            opts.settings.debug = true;
        } else if (arg.size() > 1 && arg[0] == '-' && arg != "--") {
            std::cerr << "Unknown option: " << arg << "\n";
            return false;
        } else {
            opts.positional.push_back(arg);
        }
    }
    return true;
}

static RuleList load_rules(const CommonOptions& opts) {
    if (opts.rules_path.empty()) return globalvar::default_pii_rules();
    RuleList rules = rules_file::load(opts.rules_path);
    debug_log(opts.settings, "Loaded " + std::to_string(rules.size()) + " rules from '" + opts.rules_path + "'");
    if (rules.empty()) {
        std::cerr << "Warning: rules file \"" << opts.rules_path << "\" contains no rules\n";
    }
    return rules;
}

static int cmd_file(const CommonOptions& opts) {
    if (opts.positional.size() != 2) {
        std::cerr << "Error: expected <input> <output>\n";
        print_usage();
        return 1;
    }
    RuleList rules = load_rules(opts);
    const std::string& input = opts.positional[0];
    const std::string& output = opts.positional[1];
    std::size_t lines = opts.use_mmap ? scrub_stream_mapped(input, output, rules, opts.settings)
                                      : scrub_stream_parallel(input, output, rules, opts.settings);
    std::cout << "Processed " << lines << " lines\n";
    return 0;
}

static int cmd_text(const CommonOptions& opts) {
    if (opts.positional.size() != 1) {
        std::cerr << "Error: expected <text>\n";
        print_usage();
        return 1;
    }
    std::cout << scrub_text(opts.positional[0], load_rules(opts), opts.settings) << "\n";
    return 0;
}

static int cmd_bench(const CommonOptions& opts) {
    if (opts.positional.size() != 1) {
        std::cerr << "Error: expected <input>\n";
        print_usage();
        return 1;
    }
    Benchmark benchmark(load_rules(opts), opts.settings);
    BenchmarkResult r = benchmark.run(opts.positional[0], "", "", opts.use_mmap);

    char buf[256];
    std::snprintf(buf, sizeof(buf), "Parallel (%u workers): %zu lines in %.3fs (%.0f lines/sec)\n",
                  opts.settings.workers(), r.parallel_lines, r.parallel_seconds, r.parallel_throughput);
    std::cout << buf;
    std::snprintf(buf, sizeof(buf), "Sequential:           %zu lines in %.3fs (%.0f lines/sec)\n",
                  r.sequential_lines, r.sequential_seconds, r.sequential_throughput);
    std::cout << buf;
    std::snprintf(buf, sizeof(buf), "Speedup: %.2fx\n", r.speedup);
    std::cout << buf;
    return 0;
}

static int cmd_generate(int argc, char* argv[]) {
    if (argc < 4) {
        std::cerr << "Error: expected <output> <line-count>\n";
        print_usage();
        return 1;
    }
    std::string output = argv[2];
    std::size_t count = 0;
    unsigned long seed = 42;
    try {
        count = std::stoul(argv[3]);
        for (int i = 4; i < argc; i++) {
            std::string arg = argv[i];
            if (arg == "--seed" && i + 1 < argc) {
                seed = std::stoul(argv[++i]);
            } else {
                std::cerr << "Unknown option: " << arg << "\n";
                return 1;
            }
        }
    } catch (const std::exception&) {
        std::cerr << "Error: invalid number\n";
        return 1;
    }
    std::size_t lines = sample_logs::generate(output, count, static_cast<uint32_t>(seed));
    std::cout << "Generated " << lines << " lines in " << output << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage();
        return 1;
    }

    std::string subcommand = argv[1];
    if (subcommand == "--help" || subcommand == "-h") {
        print_usage();
        return 0;
    }
    if (subcommand == "--version") {
        std::cout << "linescrub " << globalvar::linescrub_version << "\n";
        return 0;
    }

    try {
        if (subcommand == "generate") {
            return cmd_generate(argc, argv);
        }
        CommonOptions opts;
        if (!parse_options(argc, argv, 2, opts)) return 1;
        if (subcommand == "file") return cmd_file(opts);
        if (subcommand == "text") return cmd_text(opts);
        if (subcommand == "bench") return cmd_bench(opts);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    std::cerr << "Unknown subcommand: " << subcommand << "\n";
    print_usage();
    return 1;
}
