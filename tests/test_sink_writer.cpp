#include "test_helpers.hpp"
#include "errors.hpp"
#include "sink_writer.hpp"

using namespace linescrub;

class SinkWriterTest : public TempDirTest {};

TEST_F(SinkWriterTest, EveryRecordIsNewlineTerminated) {
    std::vector<std::string> lines = {"a", "", "b"};
    EXPECT_EQ(write_lines(path("out.log"), lines), 3u);
    EXPECT_EQ(read_file(path("out.log")), "a\n\nb\n");
}

TEST_F(SinkWriterTest, NoLinesGivesEmptyFile) {
    EXPECT_EQ(write_lines(path("out.log"), {}), 0u);
    EXPECT_TRUE(fs::exists(path("out.log")));
    EXPECT_EQ(read_file(path("out.log")), "");
}

TEST_F(SinkWriterTest, ExistingFileIsTruncated) {
    write_file(path("out.log"), "old content that is longer\n");
    write_lines(path("out.log"), {"new"});
    EXPECT_EQ(read_file(path("out.log")), "new\n");
}

TEST_F(SinkWriterTest, GzSuffixStillWritesPlainText) {
    SinkWriter writer(path("out.log.gz"));
    writer.write_line("a@b.com");
    writer.write_line("x");
    writer.finish();
    EXPECT_EQ(read_file(path("out.log.gz")), "a@b.com\nx\n");
}

TEST_F(SinkWriterTest, FinishIsIdempotent) {
    SinkWriter writer(path("out.log"));
    writer.write_line("only");
    writer.finish();
    writer.finish();
    EXPECT_EQ(read_file(path("out.log")), "only\n");
}

TEST_F(SinkWriterTest, MissingDirectoryIsAnIoError) {
    try {
        SinkWriter writer(path("no/such/dir/out.log"));
        FAIL() << "expected io_error";
    } catch (const io_error& e) {
        EXPECT_EQ(e.path(), path("no/such/dir/out.log"));
        EXPECT_NE(std::string(e.what()).find("Failed to create output file"), std::string::npos);
    }
    EXPECT_THROW(SinkWriter{path("no/such/dir/out.log.gz")}, io_error);
}

TEST_F(SinkWriterTest, FullDeviceIsReported) {
    if (!fs::exists("/dev/full")) GTEST_SKIP() << "/dev/full not available";
    std::vector<std::string> lines(1000, std::string(1000, 'x'));
    EXPECT_THROW(write_lines("/dev/full", lines), io_error);
}
