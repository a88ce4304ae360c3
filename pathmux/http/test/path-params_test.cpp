#include "pathmux/path-params.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <iterator>
#include <optional>
#include <string_view>

namespace pathmux {

TEST(PathParamsTest, Empty) {
  PathParams params;
  EXPECT_TRUE(params.empty());
  EXPECT_EQ(params.size(), 0U);
  EXPECT_EQ(params.find("id"), std::nullopt);
  EXPECT_FALSE(params.contains("id"));
  EXPECT_TRUE(params.valueOrEmpty("id").empty());
}

TEST(PathParamsTest, SetAndFind) {
  PathParams params;
  params.set("user", "alice");
  params.set("post", "17");

  EXPECT_EQ(params.size(), 2U);
  EXPECT_EQ(params.find("user"), std::optional<std::string_view>("alice"));
  EXPECT_EQ(params.valueOrEmpty("post"), "17");
  EXPECT_TRUE(params.contains("post"));
  EXPECT_FALSE(params.contains("POST"));
}

TEST(PathParamsTest, EmptyValueIsCaptured) {
  PathParams params;
  params.set("name", "");
  EXPECT_TRUE(params.contains("name"));
  EXPECT_EQ(params.find("name"), std::optional<std::string_view>(""));
}

TEST(PathParamsTest, SetReplacesExistingKey) {
  PathParams params;
  params.set("id", "1");
  params.set("other", "x");
  params.set("id", "2");

  ASSERT_EQ(params.size(), 2U);
  EXPECT_EQ(params.valueOrEmpty("id"), "2");
  EXPECT_EQ(params.begin()->key, "id");
}

TEST(PathParamsTest, IterationOrder) {
  PathParams params;
  params.set("a", "1");
  params.set("b", "2");
  params.set("c", "3");

  std::string_view keys[] = {"a", "b", "c"};
  std::size_t pos = 0;
  for (const PathParamCapture &capture : params) {
    ASSERT_LT(pos, std::size(keys));
    EXPECT_EQ(capture.key, keys[pos]);
    ++pos;
  }
  EXPECT_EQ(pos, 3U);

  params.clear();
  EXPECT_TRUE(params.empty());
}

}  // namespace pathmux
