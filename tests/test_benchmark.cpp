#include "test_helpers.hpp"
#include "benchmark.hpp"
#include "sample_logs.hpp"

using namespace linescrub;

TEST(BenchmarkTest, DefaultsToPiiPreset) {
    Benchmark benchmark;
    EXPECT_EQ(benchmark.rules(), globalvar::default_pii_rules());
    EXPECT_FALSE(benchmark.rules().empty());
}

TEST(BenchmarkTest, KeepsCustomRules) {
    RuleList custom = {{"test", "[REPLACED]"}};
    Benchmark benchmark(custom);
    EXPECT_EQ(benchmark.rules(), custom);
}

class BenchmarkRunTest : public TempDirTest {};

TEST_F(BenchmarkRunTest, SinglePasses) {
    std::string content;
    for (int i = 0; i < 100; i++) {
        if (i > 0) content += "\n";
        content += "User user" + std::to_string(i) + "@test.com from 10.0.0." + std::to_string(i);
    }
    write_file(path("test.log"), content);
    Benchmark benchmark;

    auto parallel = benchmark.run_parallel(path("test.log"), path("par.log"));
    EXPECT_EQ(parallel.second, 100u);
    EXPECT_GE(parallel.first, 0.0);
    EXPECT_TRUE(fs::exists(path("par.log")));

    auto mapped = benchmark.run_parallel(path("test.log"), path("map.log"), true);
    EXPECT_EQ(mapped.second, 100u);

    auto sequential = benchmark.run_sequential(path("test.log"), path("seq.log"));
    EXPECT_EQ(sequential.second, 100u);
    EXPECT_EQ(read_file(path("par.log")), read_file(path("seq.log")));
    EXPECT_EQ(read_file(path("map.log")), read_file(path("seq.log")));
}

TEST_F(BenchmarkRunTest, FullRunComparesBothPasses) {
    sample_logs::generate(path("sample.log"), 2000);
    Settings settings;
    settings.worker_count = 4;
    Benchmark benchmark(settings);

    BenchmarkResult result = benchmark.run(path("sample.log"));
    EXPECT_EQ(result.parallel_lines, 2000u);
    EXPECT_EQ(result.sequential_lines, 2000u);
    EXPECT_GE(result.speedup, 0.0);
    EXPECT_GE(result.parallel_throughput, 0.0);

    std::string parallel = read_file(path("sample.log") + ".parallel.scrubbed");
    std::string sequential = read_file(path("sample.log") + ".sequential.scrubbed");
    EXPECT_EQ(parallel, sequential);
    EXPECT_EQ(parallel.find('@'), std::string::npos);
}

TEST_F(BenchmarkRunTest, ExplicitOutputPaths) {
    sample_logs::generate(path("sample.log"), 300);
    Benchmark benchmark(RuleList{{"\\d", "#"}});
    BenchmarkResult result = benchmark.run(path("sample.log"), path("p.log"), path("s.log"), true);
    EXPECT_EQ(result.parallel_lines, 300u);
    EXPECT_EQ(read_file(path("p.log")), read_file(path("s.log")));
    EXPECT_EQ(read_file(path("p.log")).find_first_of("0123456789"), std::string::npos);
}

TEST(SampleLogsTest, SameSeedSameLines) {
    sample_logs::LogGenerator a(5);
    sample_logs::LogGenerator b(5);
    for (int i = 0; i < 50; i++) {
        EXPECT_EQ(a.next_line(), b.next_line());
    }
}
