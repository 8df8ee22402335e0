#include "session/path_resolver.hpp"

#include <sys/stat.h>
#include <unistd.h>

#include <fstream>

#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "util/file.hpp"

namespace {

using session::FinalComponent;
using session::PathResolver;
using session::path_traversal;

const std::string test_tmpdir = "/tmp/sessionbox_testdir";

class PathResolverTest : public ::testing::Test {
 protected:
  void SetUp() override {
    tmp_ = std::make_unique<util::TempDir>(test_tmpdir, "resolver");
    root_ = util::File::JoinPath(tmp_->Path(), "root");
    outside_ = util::File::JoinPath(tmp_->Path(), "outside");
    util::File::MakeDirs(root_ + "/dir");
    util::File::MakeDirs(outside_);
    std::ofstream(root_ + "/dir/file") << "data";
    std::ofstream(outside_ + "/secret") << "secret";
  }

  std::string Resolve(const std::string& path,
                      FinalComponent final_component = FinalComponent::kFollow) {
    return PathResolver::Resolve(root_, path, final_component);
  }

  std::unique_ptr<util::TempDir> tmp_;
  std::string root_;
  std::string outside_;
};

// NOLINTNEXTLINE
TEST_F(PathResolverTest, PlainPaths) {
  EXPECT_EQ(Resolve("dir/file"), root_ + "/dir/file");
  EXPECT_EQ(Resolve("./dir/./file"), root_ + "/dir/file");
  EXPECT_EQ(Resolve("dir"), root_ + "/dir");
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, MissingComponentsAreAppended) {
  EXPECT_EQ(Resolve("new/sub/file"), root_ + "/new/sub/file");
  EXPECT_EQ(Resolve("dir/new"), root_ + "/dir/new");
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, RejectsMalformedPaths) {
  for (const std::string& path :
       {std::string(""), std::string("/etc/passwd"), std::string("a//b"),
        std::string("dir/"), std::string("."), std::string("./."),
        std::string("a\0b", 3)}) {
    EXPECT_THROW(Resolve(path), path_traversal) << path;  // NOLINT
  }
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, RejectsParentSegments) {
  for (const std::string& path :
       {"..", "../outside/secret", "dir/../file", "dir/..", "a/../../b"}) {
    EXPECT_THROW(Resolve(path), path_traversal) << path;  // NOLINT
  }
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, SymlinkInside) {
  ASSERT_EQ(symlink("dir/file", (root_ + "/link").c_str()), 0);
  ASSERT_EQ(symlink("dir", (root_ + "/dirlink").c_str()), 0);
  EXPECT_EQ(Resolve("link"), root_ + "/dir/file");
  EXPECT_EQ(Resolve("dirlink/file"), root_ + "/dir/file");
  EXPECT_EQ(Resolve("link", FinalComponent::kNoFollow), root_ + "/link");
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, SymlinkEscape) {
  ASSERT_EQ(symlink(outside_.c_str(), (root_ + "/out").c_str()), 0);
  ASSERT_EQ(symlink("../outside/secret", (root_ + "/dir/rel").c_str()), 0);
  EXPECT_THROW(Resolve("out/secret"), path_traversal);  // NOLINT
  EXPECT_THROW(Resolve("out"), path_traversal);         // NOLINT
  EXPECT_THROW(Resolve("dir/rel"), path_traversal);     // NOLINT
  EXPECT_THROW(Resolve("out/secret", FinalComponent::kNoFollow),  // NOLINT
               path_traversal);
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, FinalSymlinkNotFollowedCanPointAnywhere) {
  ASSERT_EQ(symlink(outside_.c_str(), (root_ + "/out").c_str()), 0);
  EXPECT_EQ(Resolve("out", FinalComponent::kNoFollow), root_ + "/out");
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, DanglingSymlink) {
  ASSERT_EQ(symlink("missing", (root_ + "/dangling").c_str()), 0);
  EXPECT_THROW(Resolve("dangling"), path_traversal);         // NOLINT
  EXPECT_THROW(Resolve("dangling/file"), path_traversal);    // NOLINT
  EXPECT_EQ(Resolve("dangling", FinalComponent::kNoFollow),  // NOLINT
            root_ + "/dangling");
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, SymlinkToRoot) {
  ASSERT_EQ(symlink(".", (root_ + "/self").c_str()), 0);
  EXPECT_EQ(Resolve("self/dir/file"), root_ + "/dir/file");
  EXPECT_THROW(Resolve("self"), path_traversal);  // NOLINT
}

// NOLINTNEXTLINE
TEST_F(PathResolverTest, NoSideEffects) {
  EXPECT_THROW(Resolve("../outside/new"), path_traversal);  // NOLINT
  Resolve("a/b/c");
  struct stat st {};
  EXPECT_EQ(lstat((root_ + "/a").c_str(), &st), -1);
  EXPECT_EQ(lstat((outside_ + "/new").c_str(), &st), -1);
}

// NOLINTNEXTLINE
TEST(IsContained, Prefixes) {
  EXPECT_TRUE(PathResolver::IsContained("/a/b", "/a/b"));
  EXPECT_TRUE(PathResolver::IsContained("/a/b", "/a/b/c"));
  EXPECT_FALSE(PathResolver::IsContained("/a/b", "/a/bc"));
  EXPECT_FALSE(PathResolver::IsContained("/a/b", "/a"));
  EXPECT_TRUE(PathResolver::IsContained("/", "/a"));
}

}  // namespace
