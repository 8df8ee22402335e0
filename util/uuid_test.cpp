#include "util/uuid.hpp"

#include <set>

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using ::testing::MatchesRegex;

// NOLINTNEXTLINE
TEST(UUID, Format) {
  std::string uuid = util::NewUUID();
  EXPECT_EQ(uuid.size(), 36);
  EXPECT_THAT(uuid, MatchesRegex("[0-9a-f]{8}-[0-9a-f]{4}-4[0-9a-f]{3}-"
                                 "[89ab][0-9a-f]{3}-[0-9a-f]{12}"));
}

// NOLINTNEXTLINE
TEST(UUID, Unique) {
  std::set<std::string> seen;
  for (int i = 0; i < 1000; i++) seen.insert(util::NewUUID());
  EXPECT_EQ(seen.size(), 1000);
}

}  // namespace
