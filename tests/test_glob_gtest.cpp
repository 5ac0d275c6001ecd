#include <gtest/gtest.h>
#include "pcregex.h"

#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

using namespace pcregex;
namespace fs = std::filesystem;

// Test suite for glob translation and filesystem walking

TEST(GlobTest, RecursiveGlobPattern) {
    Regexp re = compileGlob("/**/bin");
    EXPECT_TRUE(re.match("/bin"));
    EXPECT_TRUE(re.match("/usr/bin"));
    EXPECT_TRUE(re.match("/usr/local/bin"));
    EXPECT_FALSE(re.match("/usr"));
    EXPECT_FALSE(re.match("/usr/local"));
    EXPECT_FALSE(re.match("/home"));
}

TEST(GlobTest, StarMatchesName) {
    Regexp re = compileGlob("src/*.cpp");
    EXPECT_TRUE(re.match("src/main.cpp"));
    EXPECT_FALSE(re.match("src/main.h"));
    EXPECT_FALSE(re.match("lib/main.cpp"));
}

TEST(GlobTest, QuestionMarkAndClass) {
    Regexp re = compileGlob("file[12].t?t");
    EXPECT_TRUE(re.match("file1.txt"));
    EXPECT_TRUE(re.match("file2.tat"));
    EXPECT_FALSE(re.match("file3.txt"));
}

TEST(GlobTest, ConvertProducesPattern) {
    std::string pattern = convertGlob("*.txt");
    EXPECT_FALSE(pattern.empty());
    EXPECT_NO_THROW(Regexp::compile(pattern));
}

TEST(GlobTest, ConvertErrorOnUnterminatedClass) {
    EXPECT_THROW(convertGlob("file[12"), ConvertError);
}

class GlobWalkTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / "pcregex_globtest";
        fs::remove_all(root);
        fs::create_directories(root / "dir1");
        fs::create_directories(root / "dir2");
        fs::create_directories(root / "test1" / "dir4");
        std::ofstream(root / "test1" / "dir4" / "text.txt") << "text";
        std::ofstream(root / "file1") << "one";
        std::ofstream(root / "file2") << "two";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    std::string path(const std::string& rel) const {
        return (root / rel).string();
    }
};

TEST_F(GlobWalkTest, EmptyGlob) {
    EXPECT_TRUE(glob("").empty());
}

TEST_F(GlobWalkTest, ExistingPathMatchesItself) {
    std::vector<std::string> result = glob(path("file1"));
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], path("file1"));
}

TEST_F(GlobWalkTest, MissingPathWithoutWildcards) {
    EXPECT_TRUE(glob(path("nothing_here")).empty());
}

TEST_F(GlobWalkTest, FlatDirectories) {
    std::vector<std::string> result = glob(path("dir*"));
    std::vector<std::string> expected = {path("dir1"), path("dir2")};
    EXPECT_EQ(result, expected);
}

TEST_F(GlobWalkTest, FlatFiles) {
    std::vector<std::string> result = glob(path("file*"));
    std::vector<std::string> expected = {path("file1"), path("file2")};
    EXPECT_EQ(result, expected);
}

TEST_F(GlobWalkTest, FlatDoesNotDescend) {
    EXPECT_TRUE(glob(path("*.txt")).empty());
}

TEST_F(GlobWalkTest, RecursiveWalk) {
    std::vector<std::string> result = glob(path("**/*.txt"));
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], path("test1/dir4/text.txt"));
}

TEST_F(GlobWalkTest, RecursiveWalkIsLexical) {
    std::vector<std::string> result = glob(path("**/dir[0-9]"));
    std::vector<std::string> expected = {path("dir1"), path("dir2"), path("test1/dir4")};
    EXPECT_EQ(result, expected);
}

TEST_F(GlobWalkTest, NestedBaseDirectory) {
    std::vector<std::string> result = glob(path("test1/*"));
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0], path("test1/dir4"));
}

TEST_F(GlobWalkTest, MissingBaseDirectory) {
    try {
        glob(path("missing/*"));
        FAIL() << "expected NotFoundError";
    } catch (const NotFoundError& e) {
        EXPECT_EQ(e.path, path("missing"));
    }
}

TEST_F(GlobWalkTest, BaseIsAFile) {
    EXPECT_THROW(glob(path("file1/*")), WalkError);
}
