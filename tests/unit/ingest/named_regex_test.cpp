#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "fxp/ingest/named_regex.hpp"

using namespace fxp::ingest;
using fxp::foundation::ErrorCode;

TEST(NamedRegexTest, PythonStyleGroups) {
    auto rx = NamedRegex::compile(R"((?P<killer>\S+) killed (?P<victim>\S+))");
    ASSERT_TRUE(rx);

    Captures caps;
    ASSERT_TRUE(rx.value().search("[12:00:00] PlayerA killed PlayerB", caps));
    EXPECT_EQ(caps["killer"], "PlayerA");
    EXPECT_EQ(caps["victim"], "PlayerB");
    EXPECT_EQ(rx.value().groupNames(), (std::vector<std::string>{"killer", "victim"}));
}

TEST(NamedRegexTest, EcmaStyleGroupsAndUnnamedGroups) {
    auto rx = NamedRegex::compile(R"((\d+)-(?<name>\w+)-(x|y)-(?<tail>\w+))");
    ASSERT_TRUE(rx);

    Captures caps;
    ASSERT_TRUE(rx.value().search("12-bravo-y-end", caps));
    EXPECT_EQ(caps["name"], "bravo");
    EXPECT_EQ(caps["tail"], "end");
    EXPECT_EQ(caps.size(), 2u);
}

TEST(NamedRegexTest, NonParticipatingGroupsAreAbsent) {
    auto rx = NamedRegex::compile(R"((?P<killer>\S+) killed (?P<victim>\S+)(?: (?P<hs>HEADSHOT))?)");
    ASSERT_TRUE(rx);

    Captures caps;
    ASSERT_TRUE(rx.value().search("A killed B", caps));
    EXPECT_EQ(caps.count("hs"), 0u);

    ASSERT_TRUE(rx.value().search("A killed B HEADSHOT", caps));
    EXPECT_EQ(caps["hs"], "HEADSHOT");
}

TEST(NamedRegexTest, BackReferences) {
    auto py = NamedRegex::compile(R"((?P<word>\w+) (?P=word)1)");
    ASSERT_TRUE(py);
    Captures caps;
    EXPECT_TRUE(py.value().search("echo echo1", caps));
    EXPECT_EQ(caps["word"], "echo");
    EXPECT_FALSE(py.value().search("echo other1", caps));

    auto ecma = NamedRegex::compile(R"((?<word>\w+) \k<word>)");
    ASSERT_TRUE(ecma);
    EXPECT_TRUE(ecma.value().search("again again", caps));
}

TEST(NamedRegexTest, CaseInsensitivePrefix) {
    auto rx = NamedRegex::compile(R"((?i)(?P<name>\w+) EXTRACTED)");
    ASSERT_TRUE(rx);
    Captures caps;
    ASSERT_TRUE(rx.value().search("PlayerC extracted", caps));
    EXPECT_EQ(caps["name"], "PlayerC");
}

TEST(NamedRegexTest, CharacterClassesAreCopiedVerbatim) {
    auto rx = NamedRegex::compile(R"(\[(?P<ts>[^\]]+)\] (?P<who>[(?P<x>)]+))");
    ASSERT_TRUE(rx);
    EXPECT_EQ(rx.value().groupNames(), (std::vector<std::string>{"ts", "who"}));

    Captures caps;
    ASSERT_TRUE(rx.value().search("[12:00:00] (P<x>)", caps));
    EXPECT_EQ(caps["ts"], "12:00:00");
    EXPECT_EQ(caps["who"], "(P<x>)");
}

TEST(NamedRegexTest, SourceIsPreserved) {
    std::string pattern = R"((?P<name>\w+) survived)";
    auto rx = NamedRegex::compile(pattern);
    ASSERT_TRUE(rx);
    EXPECT_EQ(rx.value().source(), pattern);
    EXPECT_EQ(rx.value().translated(), R"((\w+) survived)");
}

TEST(NamedRegexTest, CompileErrors) {
    for (const char* bad : {"(?P<a>x)(?P<a>y)",  // duplicate name
                            "(?P=missing)",      // unknown back-reference
                            "(?P<>x)",           // empty name
                            "[abc",              // unterminated class
                            "(unbalanced",       // std::regex error
                            "trailing\\"}) {
        auto rx = NamedRegex::compile(bad);
        ASSERT_FALSE(rx) << bad;
        EXPECT_EQ(rx.error().code(), ErrorCode::RuleCompileFailed) << bad;
    }
}

TEST(NamedRegexTest, NoMatchClearsCaptures) {
    auto rx = NamedRegex::compile(R"((?P<name>\w+) extracted)");
    ASSERT_TRUE(rx);
    Captures caps{{"stale", "value"}};
    EXPECT_FALSE(rx.value().search("nothing here", caps));
    EXPECT_TRUE(caps.empty());
}
