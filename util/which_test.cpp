#include "util/which.hpp"

#include <sys/stat.h>

#include <cstdlib>
#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

const std::string test_tmpdir = "/tmp/codebox_testdir";

void createExecutable(const std::string& path) {
  { std::ofstream os(path); }
  chmod(path.c_str(), S_IRWXU);
}

class WhichTest : public ::testing::Test {
 protected:
  void SetUp() override {
    const char* path = std::getenv("PATH");
    if (path != nullptr) old_path_ = path;
  }
  void TearDown() override { setenv("PATH", old_path_.c_str(), 1); }

 private:
  std::string old_path_;
};

TEST_F(WhichTest, FindsFirstMatchInPathOrder) {
  util::TempDir tmpdir1(test_tmpdir + "/which");
  util::TempDir tmpdir2(test_tmpdir + "/which");
  createExecutable(tmpdir1.Path() + "/first_cmd");
  createExecutable(tmpdir2.Path() + "/first_cmd");
  createExecutable(tmpdir2.Path() + "/second_cmd");
  std::string path = tmpdir1.Path() + ":" + tmpdir2.Path();
  setenv("PATH", path.c_str(), 1);

  EXPECT_EQ(util::which("first_cmd"), tmpdir1.Path() + "/first_cmd");
  EXPECT_EQ(util::which("second_cmd"), tmpdir2.Path() + "/second_cmd");
}

TEST_F(WhichTest, SkipsNonExecutableFiles) {
  util::TempDir tmpdir(test_tmpdir + "/which");
  { std::ofstream os(tmpdir.Path() + "/plain_file"); }
  setenv("PATH", tmpdir.Path().c_str(), 1);
  EXPECT_EQ(util::which("plain_file", false), "");
}

TEST_F(WhichTest, ThrowsWithoutPath) {
  unsetenv("PATH");
  EXPECT_THROW(util::which("any_cmd"), std::exception);  // NOLINT
}

TEST_F(WhichTest, UsesCache) {
  std::string path;
  {
    util::TempDir tmpdir(test_tmpdir + "/which");
    createExecutable(tmpdir.Path() + "/cached_cmd");
    setenv("PATH", tmpdir.Path().c_str(), 1);
    path = util::which("cached_cmd");
    EXPECT_EQ(path, tmpdir.Path() + "/cached_cmd");
  }
  EXPECT_EQ(util::which("cached_cmd"), path);
  EXPECT_EQ(util::which("cached_cmd", false), "");
}

}  // namespace
