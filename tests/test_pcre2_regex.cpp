#include <gtest/gtest.h>
#include "pcre2_regex.hpp"
#include <utility>

using namespace linescrub::pcre2_regex;

// Expand every match of pattern in subject; the subject itself when nothing matches
static std::string replace_all(const CompiledPattern& pattern, const std::string& replacement,
                               std::string_view subject) {
    ReplacementTemplate templ(replacement, pattern);
    MatchData md(pattern);
    std::string out;
    if (!linescrub::pcre2_regex::replace_all(pattern, templ, subject, md, out)) out.assign(subject);
    return out;
}

TEST(Pcre2RegexTest, ReplacesEveryOccurrence) {
    CompiledPattern p("\\d+");
    EXPECT_EQ(replace_all(p, "#", "a1b22c333"), "a#b#c#");
}

TEST(Pcre2RegexTest, NoMatchLeavesSubjectUnchanged) {
    CompiledPattern p("\\d+");
    MatchData md(p);
    ReplacementTemplate templ("#", p);
    std::string out = "untouched";
    EXPECT_FALSE(replace_all(p, templ, "no digits here", md, out));
    EXPECT_EQ(out, "untouched");
    EXPECT_EQ(replace_all(p, "#", "no digits here"), "no digits here");
}

TEST(Pcre2RegexTest, NumberedGroupReferences) {
    CompiledPattern p("(\\w+)@(\\w+)\\.com");
    EXPECT_EQ(replace_all(p, "$2 at ${1}", "x bob@site.com y"), "x site at bob y");
    EXPECT_EQ(replace_all(p, "[$0]", "bob@site.com"), "[bob@site.com]");
}

TEST(Pcre2RegexTest, NamedGroupReferences) {
    CompiledPattern p("(?<user>\\w+)@(?<host>\\w+)");
    EXPECT_EQ(replace_all(p, "<$user>", "bob@x"), "<bob>");
    EXPECT_EQ(replace_all(p, "${host}_${user}", "bob@x"), "x_bob");
    ASSERT_EQ(p.named_groups().size(), 2u);
    EXPECT_EQ(p.named_groups().at("user"), 1);
    EXPECT_EQ(p.capture_count(), 2u);
}

TEST(Pcre2RegexTest, DollarEscapesAndLiterals) {
    CompiledPattern p("\\d");
    EXPECT_EQ(replace_all(p, "$$", "a1"), "a$");
    EXPECT_EQ(replace_all(p, "$-", "1"), "$-");
    EXPECT_EQ(replace_all(p, "${", "1"), "${");
    EXPECT_EQ(replace_all(p, "${}", "1"), "${}");
    EXPECT_EQ(replace_all(p, "cost $", "1"), "cost $");
}

TEST(Pcre2RegexTest, UnknownGroupsExpandToNothing) {
    CompiledPattern p("(a)");
    EXPECT_EQ(replace_all(p, "[$9]", "a"), "[]");
    EXPECT_EQ(replace_all(p, "[$missing]", "a"), "[]");
    // The longest name wins: "$1a" names group "1a", not group 1 then "a"
    EXPECT_EQ(replace_all(p, "$1a", "a"), "");
    EXPECT_EQ(replace_all(p, "${1}a", "a"), "aa");
}

TEST(Pcre2RegexTest, UnsetOptionalGroupIsEmpty) {
    CompiledPattern p("x(y)?z");
    EXPECT_EQ(replace_all(p, "[$1]", "xz xyz"), "[] [y]");
}

TEST(Pcre2RegexTest, EmptyMatchesDoNotFollowPreviousMatch) {
    CompiledPattern p("x*");
    EXPECT_EQ(replace_all(p, "-", "abxd"), "-a-b-d-");
    EXPECT_EQ(replace_all(p, "-", ""), "-");
}

TEST(Pcre2RegexTest, MatchDataIsReusedAcrossSubjects) {
    CompiledPattern p("(\\w)(\\d)");
    ReplacementTemplate templ("$2$1", p);
    EXPECT_EQ(templ.source(), "$2$1");
    MatchData md(p);
    std::string out;
    ASSERT_TRUE(replace_all(p, templ, "a1 b2", md, out));
    EXPECT_EQ(out, "1a 2b");
    EXPECT_FALSE(replace_all(p, templ, "none", md, out));
    EXPECT_EQ(out, "1a 2b");

    MatchData moved(std::move(md));
    ASSERT_TRUE(replace_all(p, templ, "c3", moved, out));
    EXPECT_EQ(out, "3c");
}

TEST(Pcre2RegexTest, UnicodeAwareClasses) {
    CompiledPattern word("\\w+");
    EXPECT_EQ(replace_all(word, "X", "日本語 テスト"), "X X");
    CompiledPattern accented("é");
    EXPECT_EQ(replace_all(accented, "e", "café é"), "cafe e");
}

TEST(Pcre2RegexTest, InvalidPatternThrows) {
    EXPECT_THROW(CompiledPattern("[invalid(regex"), regex_error);
    EXPECT_THROW(CompiledPattern("(unclosed", false), regex_error);
    EXPECT_NO_THROW(CompiledPattern("\\b\\d{3}-\\d{2}-\\d{4}\\b"));
    try {
        CompiledPattern p("abc(");
        FAIL() << "expected regex_error";
    } catch (const regex_error& e) {
        EXPECT_FALSE(std::string(e.what()).empty());
        EXPECT_EQ(e.offset(), 4u);
    }
}

TEST(Pcre2RegexTest, InterpreterAndJitAgree) {
    CompiledPattern jit("\\b(?:\\d{1,3}\\.){3}\\d{1,3}\\b", true);
    CompiledPattern interp("\\b(?:\\d{1,3}\\.){3}\\d{1,3}\\b", false);
    EXPECT_FALSE(interp.jit_compiled());
    std::string line = "from 10.0.0.1 to 192.168.1.100";
    EXPECT_EQ(replace_all(jit, "[IP]", line), replace_all(interp, "[IP]", line));
    EXPECT_EQ(replace_all(interp, "[IP]", line), "from [IP] to [IP]");
}
