#include "util/file.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::ElementsAre;
using ::testing::Field;
using ::testing::IsEmpty;

const std::string test_tmpdir = "/tmp/agent_eval_testdir";

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

/*
 * Read and Write
 */

// NOLINTNEXTLINE
TEST(File, Read) {
  util::TempDir tmp(test_tmpdir);
  std::string path = util::File::JoinPath(tmp.Path(), "file");
  writeFile(path, "lallabalalla\n");
  EXPECT_EQ(util::File::Read(path), "lallabalalla\n");
}

// NOLINTNEXTLINE
TEST(File, ReadNotFound) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THROW(util::File::Read(tmp.Path() + "/nope"),  // NOLINT
               util::file_not_found);
}

// NOLINTNEXTLINE
TEST(File, WriteCreatesParents) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/a/b/c/file";
  util::File::Write(path, "content");
  EXPECT_EQ(readFile(path), "content");
  util::File::Write(path, "other");
  EXPECT_EQ(readFile(path), "other");
}

// NOLINTNEXTLINE
TEST(File, WriteNoOverwrite) {
  util::TempDir tmp(test_tmpdir);
  std::string path = tmp.Path() + "/file";
  util::File::Write(path, "content");
  EXPECT_THROW(util::File::Write(path, "other", false),  // NOLINT
               util::file_exists);
  EXPECT_EQ(readFile(path), "content");
}

/*
 * Trees
 */

// NOLINTNEXTLINE
TEST(File, ListTreeSortedSkipsSymlinks) {
  util::TempDir tmp(test_tmpdir);
  util::File::Write(tmp.Path() + "/b/x.txt", "x");
  util::File::Write(tmp.Path() + "/a.txt", "a");
  util::File::Write(tmp.Path() + "/.hidden", "h");
  ASSERT_EQ(symlink("/etc", (tmp.Path() + "/link").c_str()), 0);
  auto entries = util::File::ListTree(tmp.Path());
  EXPECT_THAT(entries,
              ElementsAre(Field(&util::File::Entry::path, ".hidden"),
                          Field(&util::File::Entry::path, "a.txt"),
                          Field(&util::File::Entry::path, "b"),
                          Field(&util::File::Entry::path, "b/x.txt")));
  EXPECT_TRUE(entries[2].is_directory);
  EXPECT_FALSE(entries[3].is_directory);
}

// NOLINTNEXTLINE
TEST(File, ListTreeEmpty) {
  util::TempDir tmp(test_tmpdir);
  EXPECT_THAT(util::File::ListTree(tmp.Path()), IsEmpty());
}

// NOLINTNEXTLINE
TEST(File, CopyTree) {
  util::TempDir from(test_tmpdir);
  util::TempDir to(test_tmpdir);
  util::File::Write(from.Path() + "/project/tests/test_x.py", "def test(): pass");
  util::File::MakeDirs(from.Path() + "/empty");
  util::File::CopyTree(from.Path(), to.Path() + "/copy");
  EXPECT_EQ(readFile(to.Path() + "/copy/project/tests/test_x.py"),
            "def test(): pass");
  EXPECT_TRUE(util::File::IsDirectory(to.Path() + "/copy/empty"));
}

// NOLINTNEXTLINE
TEST(File, RemoveTree) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    tmp.Keep();
    path = tmp.Path();
  }
  util::File::Write(path + "/deep/file", "x");
  util::File::RemoveTree(path);
  EXPECT_FALSE(util::File::Exists(path));
}

/*
 * Paths
 */

// NOLINTNEXTLINE
TEST(File, JoinPath) {
  EXPECT_EQ(util::File::JoinPath("a", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a/", "b"), "a/b");
  EXPECT_EQ(util::File::JoinPath("a", "/b"), "/b");
  EXPECT_EQ(util::File::JoinPath("", "b"), "b");
}

// NOLINTNEXTLINE
TEST(File, BaseDirAndName) {
  EXPECT_EQ(util::File::BaseDir("/a/b/c"), "/a/b");
  EXPECT_EQ(util::File::BaseDir("/c"), "/");
  EXPECT_EQ(util::File::BaseDir("c"), ".");
  EXPECT_EQ(util::File::BaseName("/a/b/c.txt"), "c.txt");
  EXPECT_EQ(util::File::BaseName("c.txt"), "c.txt");
}

// NOLINTNEXTLINE
TEST(File, Size) {
  util::TempDir tmp(test_tmpdir);
  util::File::Write(tmp.Path() + "/file", "12345");
  EXPECT_EQ(util::File::Size(tmp.Path() + "/file"), 5);
  EXPECT_LT(util::File::Size(tmp.Path() + "/nope"), 0);
}

/*
 * TempDir
 */

// NOLINTNEXTLINE
TEST(TempDir, RemovedOnDestruction) {
  std::string path;
  {
    util::TempDir tmp(test_tmpdir);
    path = tmp.Path();
    util::File::Write(path + "/some/file", "x");
    EXPECT_TRUE(util::File::IsDirectory(path));
  }
  EXPECT_FALSE(util::File::Exists(path));
}

// NOLINTNEXTLINE
TEST(TempDir, MovedFromDoesNotRemove) {
  util::TempDir first(test_tmpdir);
  std::string path = first.Path();
  {
    util::TempDir second(std::move(first));
    EXPECT_EQ(second.Path(), path);
  }
  EXPECT_FALSE(util::File::Exists(path));
}

}  // namespace
