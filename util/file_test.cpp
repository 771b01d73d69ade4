#include "util/file.hpp"
#include <sys/stat.h>
#include <fstream>
#include <memory>
#include <string>
#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::EndsWith;
using ::testing::IsEmpty;
using ::testing::StartsWith;

const std::string test_tmpdir = "/tmp/uncertainty_eval_testdir";

void writeFile(const std::string& path, const std::string& content) {
  std::ofstream of(path);
  of << content;
}

std::string readFile(const std::string& path) {
  std::ifstream t(path);
  std::string str((std::istreambuf_iterator<char>(t)),
                  std::istreambuf_iterator<char>());
  return str;
}

bool dirExists(const std::string& path) {
  struct stat info {};
  return stat(path.c_str(), &info) == 0 && S_ISDIR(info.st_mode);
}

class FileTest : public ::testing::Test {
 protected:
  void SetUp() override {
    util::File::MakeDirs(test_tmpdir);
    tmpdir_.reset(new util::TempDir(test_tmpdir));
  }
  std::string Path(const std::string& name) const {
    return util::File::JoinPath(tmpdir_->Path(), name);
  }
  std::unique_ptr<util::TempDir> tmpdir_;
};

// NOLINTNEXTLINE
TEST_F(FileTest, Read) {
  writeFile(Path("file"), "contents\n");
  EXPECT_EQ(util::File::Read(Path("file")), "contents\n");
}

// NOLINTNEXTLINE
TEST_F(FileTest, ReadNoSuchFile) {
  EXPECT_THROW(util::File::Read(Path("missing")),  // NOLINT
               util::file_not_found);
}

// NOLINTNEXTLINE
TEST_F(FileTest, TailShortFile) {
  writeFile(Path("file"), "short");
  EXPECT_EQ(util::File::Tail(Path("file"), 1024), "short");
}

// NOLINTNEXTLINE
TEST_F(FileTest, TailKeepsLastBytes) {
  writeFile(Path("file"), std::string(5000, 'a') + "the end");
  std::string tail = util::File::Tail(Path("file"), 100);
  EXPECT_EQ(tail.size(), 100u);
  EXPECT_THAT(tail, EndsWith("the end"));
}

// NOLINTNEXTLINE
TEST_F(FileTest, TailNoSuchFile) {
  EXPECT_THAT(util::File::Tail(Path("missing"), 100), IsEmpty());
}

// NOLINTNEXTLINE
TEST_F(FileTest, Write) {
  util::File::Write(Path("dir/file"), "data");
  EXPECT_EQ(readFile(Path("dir/file")), "data");
}

// NOLINTNEXTLINE
TEST_F(FileTest, WriteExistsNotOk) {
  writeFile(Path("file"), "old");
  EXPECT_THROW(util::File::Write(Path("file"), "new"),  // NOLINT
               util::file_exists);
  EXPECT_EQ(readFile(Path("file")), "old");
}

// NOLINTNEXTLINE
TEST_F(FileTest, WriteOverwrite) {
  writeFile(Path("file"), "old");
  util::File::Write(Path("file"), "new", /*overwrite=*/true);
  EXPECT_EQ(readFile(Path("file")), "new");
}

// NOLINTNEXTLINE
TEST_F(FileTest, MakeDirs) {
  EXPECT_FALSE(dirExists(Path("a/b/c")));
  util::File::MakeDirs(Path("a/b/c"));
  EXPECT_TRUE(dirExists(Path("a/b/c")));
}

// NOLINTNEXTLINE
TEST_F(FileTest, Size) {
  writeFile(Path("file"), "12345");
  EXPECT_EQ(util::File::Size(Path("file")), 5);
  EXPECT_LT(util::File::Size(Path("missing")), 0);
}

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(util::File::JoinPath("", "b"), "b");
}

// NOLINTNEXTLINE
TEST(File, BaseDir) {
  EXPECT_EQ(util::File::BaseDir("/a/b/c"), "/a/b");
  EXPECT_EQ(util::File::BaseDir("/c"), "/");
  EXPECT_EQ(util::File::BaseDir("c"), ".");
}

// NOLINTNEXTLINE
TEST(File, Absolute) {
  EXPECT_EQ(util::File::Absolute("/a/b"), "/a/b");
  EXPECT_THAT(util::File::Absolute("a/b"), StartsWith("/"));
  EXPECT_THAT(util::File::Absolute("a/b"), EndsWith("/a/b"));
}

// NOLINTNEXTLINE
TEST(TempDir, RemovedWithContents) {
  util::File::MakeDirs(test_tmpdir);
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    EXPECT_THAT(path, StartsWith(test_tmpdir + "/"));
    util::File::Write(util::File::JoinPath(path, "x/y"), "data");
    EXPECT_TRUE(dirExists(path));
  }
  EXPECT_FALSE(dirExists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, Keep) {
  util::File::MakeDirs(test_tmpdir);
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    tmp.Keep();
  }
  EXPECT_TRUE(dirExists(path));
  util::File::RemoveTree(path);
}

// NOLINTNEXTLINE
TEST(TempDir, Unique) {
  util::File::MakeDirs(test_tmpdir);
  util::TempDir a(test_tmpdir);
  util::TempDir b(test_tmpdir);
  EXPECT_NE(a.Path(), b.Path());
}

// NOLINTNEXTLINE
TEST(TempDir, MissingBase) {
  EXPECT_THROW(util::TempDir("/nonexistent/uncertainty_eval"),  // NOLINT
               std::system_error);
}

}  // namespace
