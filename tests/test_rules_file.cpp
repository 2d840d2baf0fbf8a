#include "test_helpers.hpp"
#include "errors.hpp"
#include "rules_file.hpp"
#include "scrub_api.hpp"

using namespace linescrub;

TEST(RulesFileTest, ParsesPatternsInFileOrder) {
    RuleList rules = rules_file::parse(
        "# redaction rules\n"
        "\n"
        "\\d{3}-\\d{2}-\\d{4}\t[SSN]\n"
        "   \n"
        "(\\w+)@example\\.com\t<$1>\n");
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].first, "\\d{3}-\\d{2}-\\d{4}");
    EXPECT_EQ(rules[0].second, "[SSN]");
    EXPECT_EQ(rules[1].first, "(\\w+)@example\\.com");
    EXPECT_EQ(rules[1].second, "<$1>");
}

TEST(RulesFileTest, OnlyFirstTabSeparates) {
    RuleList rules = rules_file::parse("a\tb\tc\n");
    ASSERT_EQ(rules.size(), 1u);
    EXPECT_EQ(rules[0].first, "a");
    EXPECT_EQ(rules[0].second, "b\tc");
}

TEST(RulesFileTest, EmptyReplacementAndCrLf) {
    RuleList rules = rules_file::parse("secret\t\r\nkey\tK\r\n");
    ASSERT_EQ(rules.size(), 2u);
    EXPECT_EQ(rules[0].second, "");
    EXPECT_EQ(rules[1].second, "K");
}

TEST(RulesFileTest, MissingTabReportsLine) {
    try {
        rules_file::parse("# header\nok\tfine\nno separator here\n", "rules.tsv");
        FAIL() << "expected rules_file_error";
    } catch (const rules_file_error& e) {
        EXPECT_NE(std::string(e.what()).find("rules.tsv:3:"), std::string::npos);
    }
}

TEST(RulesFileTest, EmptyPatternIsRejected) {
    EXPECT_THROW(rules_file::parse("\t[X]\n"), rules_file_error);
}

TEST(RulesFileTest, EmptyContentHasNoRules) {
    EXPECT_TRUE(rules_file::parse("").empty());
    EXPECT_TRUE(rules_file::parse("# only a comment\n").empty());
}

class RulesFileLoadTest : public TempDirTest {};

TEST_F(RulesFileLoadTest, LoadedRulesDriveAScrub) {
    write_file(path("rules.tsv"), "a\tb\nb\tc\n");
    RuleList rules = rules_file::load(path("rules.tsv"));
    EXPECT_EQ(scrub_text("a", rules), "c");
}

TEST_F(RulesFileLoadTest, MissingFileIsAnIoError) {
    EXPECT_THROW(rules_file::load(path("missing.tsv")), io_error);
}

TEST_F(RulesFileLoadTest, ErrorsNameTheFile) {
    write_file(path("bad.tsv"), "no tab\n");
    try {
        rules_file::load(path("bad.tsv"));
        FAIL() << "expected rules_file_error";
    } catch (const rules_file_error& e) {
        EXPECT_NE(std::string(e.what()).find(path("bad.tsv") + ":1:"), std::string::npos);
    }
}
