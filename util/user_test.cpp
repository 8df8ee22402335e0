#include "util/user.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <stdexcept>

#include "gflags/gflags.h"
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"
#include "util/flags.hpp"

namespace {

const std::string test_tmpdir = "/tmp/sessionbox_testdir";

// NOLINTNEXTLINE
TEST(User, LookupRoot) {
  util::User user = util::LookupUser("root");
  EXPECT_TRUE(user.IsSet());
  EXPECT_EQ(user.uid, 0u);
  EXPECT_EQ(user.gid, 0u);
}

// NOLINTNEXTLINE
TEST(User, LookupUnknown) {
  EXPECT_THROW(util::LookupUser("sessionbox-no-such-user"),  // NOLINT
               std::runtime_error);
}

// NOLINTNEXTLINE
TEST(User, SandboxUserUnsetByDefault) {
  gflags::FlagSaver saver;
  FLAGS_sandbox_user = "";
  EXPECT_FALSE(util::SandboxUser().IsSet());
}

// NOLINTNEXTLINE
TEST(User, SandboxUserIgnoredWithoutRoot) {
  if (geteuid() == 0) GTEST_SKIP() << "Running as root";
  gflags::FlagSaver saver;
  FLAGS_sandbox_user = "root";
  EXPECT_FALSE(util::SandboxUser().IsSet());
}

// NOLINTNEXTLINE
TEST(User, ChownUnsetDoesNothing) {
  util::TempDir tmp(test_tmpdir);
  util::Chown(util::File::JoinPath(tmp.Path(), "missing"), util::User());
  util::ChownTree(tmp.Path(), util::User());
  struct stat st {};
  ASSERT_EQ(stat(tmp.Path().c_str(), &st), 0);
  EXPECT_EQ(st.st_uid, geteuid());
}

// NOLINTNEXTLINE
TEST(User, ChownTree) {
  if (geteuid() != 0) GTEST_SKIP() << "Needs root";
  util::User nobody;
  try {
    nobody = util::LookupUser("nobody");
  } catch (const std::runtime_error& exc) {
    GTEST_SKIP() << exc.what();
  }
  util::TempDir tmp(test_tmpdir);
  util::File::Write(util::File::JoinPath(tmp.Path(), "a/b/c"), "x");
  ASSERT_EQ(symlink("/etc/passwd", (tmp.Path() + "/link").c_str()), 0);
  util::ChownTree(tmp.Path(), nobody);
  for (const std::string& path :
       {tmp.Path(), tmp.Path() + "/a", tmp.Path() + "/a/b",
        tmp.Path() + "/a/b/c", tmp.Path() + "/link"}) {
    struct stat st {};
    ASSERT_EQ(lstat(path.c_str(), &st), 0) << path;
    EXPECT_EQ(st.st_uid, nobody.uid) << path;
  }
  struct stat st {};
  ASSERT_EQ(stat("/etc/passwd", &st), 0);
  EXPECT_EQ(st.st_uid, 0u);
}

}  // namespace
