#include "evaluator/harness.hpp"

#include "gmock/gmock.h"
#include "gtest/gtest.h"

namespace {

using evaluator::Harness;
using evaluator::ParseArguments;
using ::testing::ElementsAre;
using ::testing::HasSubstr;

// NOLINTNEXTLINE
TEST(Harness, EncodeKeywordArguments) {
  EXPECT_EQ(Harness::EncodeArguments(ParseArguments("a=1, b='hi'")),
            "('kw',[('a',('i','1')),('b',('s','6869')),])");
}

// NOLINTNEXTLINE
TEST(Harness, EncodePositionalArguments) {
  EXPECT_EQ(Harness::EncodeArguments(ParseArguments("[None, True, {1: ()}]")),
            "('pos',[('l',[('n',),('b',True),('d',[(('i','1'),('t',[])),]),"
            "]),])");
  EXPECT_EQ(Harness::EncodeArguments(ParseArguments("")), "('pos',[])");
}

// NOLINTNEXTLINE
TEST(Harness, EncodeFloats) {
  EXPECT_EQ(Harness::EncodeArguments(ParseArguments("0.5")),
            "('pos',[('f','0.5'),])");
  EXPECT_EQ(Harness::EncodeArguments(ParseArguments("-inf")),
            "('pos',[('f','-inf'),])");
}

// NOLINTNEXTLINE
TEST(Harness, Commands) {
  EXPECT_THAT(Harness::CheckCommand("python3", "/r/m.py", "f"),
              ElementsAre("python3", "-I", "-B", "-c", Harness::Script(),
                          "check", "/r/m.py", "f"));
  std::vector<std::string> call =
      Harness::CallCommand("python3", "/r/m.py", "Solution().f", "/r/a");
  ASSERT_EQ(call.size(), 9);
  EXPECT_EQ(call[5], "call");
  EXPECT_EQ(call[7], "Solution().f");
  EXPECT_EQ(call[8], "/r/a");
  EXPECT_THAT(Harness::Script(), HasSubstr("importlib.util"));
}

}  // namespace
