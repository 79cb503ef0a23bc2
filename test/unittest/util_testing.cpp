#include <gtest/gtest.h>
#include <set>
#include <sstream>
#include <string_view>
#include <utils/util.h>

testing::AssertionResult
SetContains(std::set<std::string_view> expected_set, std::string_view test)
{
  if (expected_set.contains(test))
    return testing::AssertionSuccess();
  else {
    std::stringstream ss{};
    ss << "Set [";
    auto i = 0u;
    for (const auto item : expected_set) {
      ss << item << ((++i != expected_set.size()) ? ", " : "]");
    }
    return testing::AssertionFailure() << ss.str() << " does not contain '" << test << "'";
  }
}

TEST(StringSplit, CommaSeparated)
{
  std::string foo = "attach,transport,session,";
  std::set<std::string_view> expected{"attach", "transport", "session"};
  auto res = ldb::SplitString(foo, ',');
  EXPECT_EQ(res.size(), expected.size());
  std::set<std::string_view> res_set{res.begin(), res.end()};
  for (const auto item : res_set) {
    EXPECT_TRUE(SetContains(expected, item));
  }
}

TEST(StringSplit, RepeatedDelimitersYieldNoEmptyParts)
{
  auto res = ldb::SplitString("b  main.lua:10   x", ' ');
  ASSERT_EQ(res.size(), 3u);
  EXPECT_EQ(res[0], "b");
  EXPECT_EQ(res[1], "main.lua:10");
  EXPECT_EQ(res[2], "x");
  EXPECT_TRUE(ldb::SplitString("", ',').empty());
}

TEST(Trim, Whitespace)
{
  EXPECT_EQ(ldb::TrimWhitespace("  4242\r\n"), "4242");
  EXPECT_EQ(ldb::TrimWhitespace("\t\t"), "");
  EXPECT_EQ(ldb::TrimWhitespace("a b"), "a b");
}

TEST(ParseInteger, RejectsTrailingGarbage)
{
  EXPECT_EQ(ldb::ParseInteger<int>("8818"), 8818);
  EXPECT_EQ(ldb::ParseInteger<int>("ff", 16), 255);
  EXPECT_FALSE(ldb::ParseInteger<int>("12abc"));
  EXPECT_FALSE(ldb::ParseInteger<int>(""));
  EXPECT_FALSE(ldb::StrToPid("pid"));
}

TEST(ToLower, Ascii)
{
  EXPECT_EQ(ldb::ToLower("LuaPanda-Client"), "luapanda-client");
  EXPECT_EQ(ldb::ToLower("LUA51.DLL"), "lua51.dll");
}
