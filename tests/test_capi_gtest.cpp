#include <gtest/gtest.h>
#include "pcregex_capi.h"

#include <string.h>
#include <string>

// Test suite for the extern "C" binding

TEST(CApiTest, CompileAndMatch) {
    pcregex_t* re = pcregex_compile("\\d+ (?=USD)", 0);
    ASSERT_NE(re, nullptr);
    EXPECT_STREQ(pcregex_error(), "");

    EXPECT_EQ(pcregex_match(re, "9000 USD"), 1);
    EXPECT_EQ(pcregex_match(re, "9000 RUB"), 0);
    pcregex_free(re);
}

TEST(CApiTest, CompileError) {
    pcregex_t* re = pcregex_compile("(", 0);
    EXPECT_EQ(re, nullptr);
    EXPECT_NE(strstr(pcregex_error(), "offset 1"), nullptr);

    EXPECT_EQ(pcregex_compile(NULL, 0), nullptr);
    EXPECT_STRNE(pcregex_error(), "");
}

TEST(CApiTest, Find) {
    pcregex_t* re = pcregex_compile("(\\d+)", 0);
    ASSERT_NE(re, nullptr);

    char* found = pcregex_find(re, "3 times 4 is 12");
    ASSERT_NE(found, nullptr);
    EXPECT_STREQ(found, "3");
    pcregex_string_free(found);

    EXPECT_EQ(pcregex_find(re, "none"), nullptr);
    EXPECT_STREQ(pcregex_error(), "");
    pcregex_free(re);
}

TEST(CApiTest, ReplaceAll) {
    pcregex_t* re = pcregex_compile("(\\d+)\\.\\d+", 0);
    ASSERT_NE(re, nullptr);

    char* out = pcregex_replace_all(re, "123.54321 Test", "${1}.12345");
    ASSERT_NE(out, nullptr);
    EXPECT_STREQ(out, "123.12345 Test");
    pcregex_string_free(out);
    pcregex_free(re);
}

TEST(CApiTest, Split) {
    pcregex_t* re = pcregex_compile("a*", 0);
    ASSERT_NE(re, nullptr);

    char** parts = pcregex_split(re, "abaabaccadaaae", 5);
    ASSERT_NE(parts, nullptr);
    const char* expected[] = {"", "b", "b", "c", "cadaaae"};
    int count = 0;
    for (char** p = parts; *p; p++, count++) {
        ASSERT_LT(count, 5);
        EXPECT_STREQ(*p, expected[count]);
    }
    EXPECT_EQ(count, 5);
    pcregex_list_free(parts);

    char** none = pcregex_split(re, "abc", 0);
    ASSERT_NE(none, nullptr);
    EXPECT_EQ(none[0], nullptr);
    pcregex_list_free(none);
    pcregex_free(re);
}

TEST(CApiTest, CalloutsWithoutHandlerAndBadArguments) {
    pcregex_t* re = pcregex_compile("(?C1)a", 0);
    ASSERT_NE(re, nullptr);
    // No callout installed: callouts are ignored
    EXPECT_EQ(pcregex_match(re, "a"), 1);
    pcregex_free(re);

    EXPECT_EQ(pcregex_match(NULL, "a"), -1);
    EXPECT_STRNE(pcregex_error(), "");
}

TEST(CApiTest, Escape) {
    char* escaped = pcregex_escape("1.5+2");
    ASSERT_NE(escaped, nullptr);
    EXPECT_STREQ(escaped, "1\\.5\\+2");
    pcregex_string_free(escaped);
}

#ifdef PCREGEX_HAS_GLOB
TEST(CApiTest, GlobEmpty) {
    char** none = pcregex_glob("");
    ASSERT_NE(none, nullptr);
    EXPECT_EQ(none[0], nullptr);
    pcregex_list_free(none);
}

TEST(CApiTest, GlobMissingBase) {
    EXPECT_EQ(pcregex_glob("/pcregex_no_such_dir/*"), nullptr);
    EXPECT_STRNE(pcregex_error(), "");
}
#endif

TEST(CApiTest, FreeNullIsSafe) {
    pcregex_free(NULL);
    pcregex_string_free(NULL);
    pcregex_list_free(NULL);
}
