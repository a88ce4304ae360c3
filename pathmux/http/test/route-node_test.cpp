#include "pathmux/route-node.hpp"

#include <gtest/gtest.h>

#include "pathmux/http-method-set.hpp"
#include "pathmux/http-method.hpp"

namespace pathmux {

TEST(RouteNodeTest, Root) {
  RouteNode root;
  EXPECT_EQ(root.kind(), RouteNode::Kind::Root);
  EXPECT_FALSE(root.isParam());
  EXPECT_EQ(root.parent(), nullptr);
  EXPECT_TRUE(root.name().empty());
  EXPECT_TRUE(root.allowedMethods().empty());
  EXPECT_EQ(root.patternString(), "/");

  // the root is its own directory node
  EXPECT_EQ(root.directoryNode(), &root);
  EXPECT_EQ(root.literalChild("a"), nullptr);
  EXPECT_EQ(root.literalChild(""), nullptr);
  EXPECT_EQ(root.paramChild(), nullptr);
  EXPECT_EQ(root.handler(http::MethodGet), nullptr);
  EXPECT_EQ(root.catchAllHandler(http::MethodGet), nullptr);
}

TEST(RouteNodeTest, ChildNodes) {
  RouteNode root;
  RouteNode users(RouteNode::Kind::Literal, "users", &root, http::MethodSet::Get());
  RouteNode id(RouteNode::Kind::Param, "id", &users, http::MethodSet{"GET", "DELETE"});
  RouteNode dir(RouteNode::Kind::Slash, "", &id, http::MethodSet::Get());

  EXPECT_FALSE(users.isParam());
  EXPECT_TRUE(id.isParam());
  EXPECT_FALSE(dir.isParam());

  EXPECT_EQ(id.parent(), &users);
  EXPECT_EQ(id.name(), "id");
  EXPECT_EQ(id.allowedMethods(), (http::MethodSet{"DELETE", "GET"}));

  EXPECT_EQ(users.patternString(), "/users");
  EXPECT_EQ(id.patternString(), "/users/{id}");
  EXPECT_EQ(dir.patternString(), "/users/{id}/");

  // a non root node without slash child has no directory node
  EXPECT_EQ(users.directoryNode(), nullptr);
  EXPECT_EQ(users.slashChild(), nullptr);
}

}  // namespace pathmux
