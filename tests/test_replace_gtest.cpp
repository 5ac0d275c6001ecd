#include <gtest/gtest.h>
#include "pcregex.h"

#include <string>
#include <vector>

using namespace pcregex;

// Test suite for replacement, template expansion and splitting

TEST(ReplaceTest, TemplateByNumber) {
    Regexp re = Regexp::compile("(\\d+)\\.\\d+");
    EXPECT_EQ(re.replaceAll("123.54321 Test", "${1}.12345"), "123.12345 Test");
    EXPECT_EQ(re.replaceAll("123.54321 Test", "$1.12345"), "123.12345 Test");
}

TEST(ReplaceTest, TemplateMissingGroupExpandsToNothing) {
    Regexp re = Regexp::compile("(\\d+)\\.\\d+");
    EXPECT_EQ(re.replaceAll("123.54321 Test", "${9}.12345"), ".12345 Test");
    EXPECT_EQ(re.replaceAll("123.54321 Test", "${hi}.12345"), ".12345 Test");
}

TEST(ReplaceTest, TemplateWholeMatch) {
    Regexp re = Regexp::compile("\\d+");
    EXPECT_EQ(re.replaceAll("a1b22", "<${0}>"), "a<1>b<22>");
}

TEST(ReplaceTest, TemplateByName) {
    Regexp re = Regexp::compile("(?P<key>\\w+)=(?P<value>\\w+)");
    EXPECT_EQ(re.replaceAll("a=1, b=2", "${value}=${key}"), "1=a, 2=b");
    EXPECT_EQ(re.replaceAll("x=y", "$value:$key"), "y:x");
}

TEST(ReplaceTest, TemplateEscapesAndStrayDollars) {
    Regexp re = Regexp::compile("(\\d+)");
    EXPECT_EQ(re.replaceAll("cost 5", "$$$1"), "cost $5");
    EXPECT_EQ(re.replaceAll("cost 5", "$"), "cost $");
    EXPECT_EQ(re.replaceAll("cost 5", "${}"), "cost ${}");
    EXPECT_EQ(re.replaceAll("cost 5", "${1"), "cost ${1");
    EXPECT_EQ(re.replaceAll("cost 5", "$-"), "cost $-");
}

TEST(ReplaceTest, BareNameTakesLongestRun) {
    // $1x names a group called "1x"; braces end the reference early
    Regexp re = Regexp::compile("(\\d+)");
    EXPECT_EQ(re.replaceAll("cost 5", "$1x"), "cost ");
    EXPECT_EQ(re.replaceAll("cost 5", "${1}x"), "cost 5x");
}

TEST(ReplaceTest, TemplateNonParticipatingGroup) {
    Regexp re = Regexp::compile("(a)|(b)");
    EXPECT_EQ(re.replaceAll("ab", "[$1|$2]"), "[a|][|b]");
}

TEST(ReplaceTest, Literal) {
    Regexp re = Regexp::compile("(\\d+)\\.\\d+");
    EXPECT_EQ(re.replaceAllLiteral("123.54321 Test", "${1}.12345"), "${1}.12345 Test");
}

TEST(ReplaceTest, Callback) {
    Regexp re = Regexp::compile("(\\d+)\\.\\d+");
    std::string out = re.replaceAllFunc("123.54321 Test", [](const std::string& m) {
        std::string r = m;
        for (char& c : r) {
            if (c == '.') {
                c = ',';
            }
        }
        return r;
    });
    EXPECT_EQ(out, "123,54321 Test");
}

TEST(ReplaceTest, NoMatchReturnsSubject) {
    Regexp re = Regexp::compile("\\d+");
    EXPECT_EQ(re.replaceAll("no digits", "X"), "no digits");
    EXPECT_EQ(re.replaceAllLiteral("", "X"), "");
}

TEST(ReplaceTest, DriftWithGrowingAndShrinkingReplacements) {
    Regexp re = Regexp::compile("\\d+");
    EXPECT_EQ(re.replaceAllLiteral("a1b22c333d", "XXXXX"), "aXXXXXbXXXXXcXXXXXd");
    EXPECT_EQ(re.replaceAllLiteral("a1b22c333d", ""), "abcd");

    int calls = 0;
    std::string out = re.replaceAllFunc("1 22 333", [&](const std::string& m) {
        calls++;
        return std::to_string(m.size());
    });
    EXPECT_EQ(out, "1 2 3");
    EXPECT_EQ(calls, 3);
}

TEST(ReplaceTest, WholeSubjectMatch) {
    Regexp re = Regexp::compile(".+");
    EXPECT_EQ(re.replaceAllLiteral("abcdef", "xyz"), "xyz");
}

TEST(ReplaceTest, EmptyMatchesInsert) {
    Regexp re = Regexp::compile("a*");
    EXPECT_EQ(re.replaceAllLiteral("baaac", "-"), "b-c-");
}

TEST(ReplaceTest, ExpanderSeesOriginalOffsets) {
    Regexp re = Regexp::compile("(\\w)(\\w)");
    std::string src = "ab cd";
    std::string out = re.replace(src, [&](const MatchRecord& m) {
        return re.expand("$2$1", src, m);
    });
    EXPECT_EQ(out, "ba dc");
}

// Splitting

TEST(SplitTest, ZeroWidthPattern) {
    Regexp re = Regexp::compile("a*");
    std::vector<std::string> parts = re.split("abaabaccadaaae", 5);
    std::vector<std::string> expected = {"", "b", "b", "c", "cadaaae"};
    EXPECT_EQ(parts, expected);
}

TEST(SplitTest, EmptySubject) {
    Regexp re = Regexp::compile("a*");
    EXPECT_TRUE(re.split("", 0).empty());

    std::vector<std::string> parts = re.split("", 5);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "");
}

TEST(SplitTest, ZeroPartsIsEmpty) {
    Regexp re = Regexp::compile(",");
    EXPECT_TRUE(re.split("a,b,c", 0).empty());
}

TEST(SplitTest, Unlimited) {
    Regexp re = Regexp::compile(",\\s*");
    std::vector<std::string> parts = re.split("a, b,c,  d", -1);
    std::vector<std::string> expected = {"a", "b", "c", "d"};
    EXPECT_EQ(parts, expected);
}

TEST(SplitTest, LimitKeepsRemainder) {
    Regexp re = Regexp::compile(",");
    std::vector<std::string> parts = re.split("a,b,c,d", 2);
    std::vector<std::string> expected = {"a", "b,c,d"};
    EXPECT_EQ(parts, expected);
}

TEST(SplitTest, NoMatch) {
    Regexp re = Regexp::compile(",");
    std::vector<std::string> parts = re.split("abc", -1);
    ASSERT_EQ(parts.size(), 1u);
    EXPECT_EQ(parts[0], "abc");
}
