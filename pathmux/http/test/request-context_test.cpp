#include "pathmux/request-context.hpp"

#include <gtest/gtest.h>

#include "pathmux/http-response.hpp"
#include "pathmux/http-status-code.hpp"
#include "pathmux/path-params.hpp"

namespace pathmux {

class RequestContextTest : public ::testing::Test {
 protected:
  RequestContextTest() { params.set("id", "42"); }

  PathParams params;
  HttpResponse response;
  RequestContext ctx{"PUT", "/items/42", "{\"name\":\"x\"}", params, response};
};

TEST_F(RequestContextTest, RequestAccessors) {
  EXPECT_EQ(ctx.method(), "PUT");
  EXPECT_EQ(ctx.path(), "/items/42");
  EXPECT_EQ(ctx.body(), "{\"name\":\"x\"}");
  EXPECT_EQ(ctx.pathParams().size(), 1U);
  EXPECT_EQ(ctx.param("id"), "42");
  EXPECT_TRUE(ctx.param("missing").empty());
}

TEST_F(RequestContextTest, WriteString) {
  ctx.writeString("hello");
  ctx.writeString(", world");

  EXPECT_EQ(response.status(), http::StatusCodeOK);
  EXPECT_EQ(response.body(), "hello, world");
  EXPECT_EQ(response.contentType(), http::ContentTypeTextPlain);
}

TEST_F(RequestContextTest, WriteStringKeepsContentType) {
  ctx.response().contentType(http::ContentTypeApplicationJson);
  ctx.writeString("{}");

  EXPECT_EQ(response.contentType(), http::ContentTypeApplicationJson);
  EXPECT_EQ(response.body(), "{}");
}

TEST_F(RequestContextTest, WriteStatus) {
  ctx.writeStatus(http::StatusCodeNoContent);
  EXPECT_EQ(response.status(), http::StatusCodeNoContent);
  EXPECT_TRUE(response.body().empty());
}

TEST_F(RequestContextTest, WriteErrorReplacesBody) {
  ctx.response().contentType(http::ContentTypeApplicationJson);
  ctx.writeString("partial");
  ctx.writeError(http::StatusCodeBadRequest, "bad item");

  EXPECT_EQ(response.status(), http::StatusCodeBadRequest);
  EXPECT_EQ(response.body(), "bad item\n");
  EXPECT_EQ(response.contentType(), http::ContentTypeTextPlain);
}

TEST_F(RequestContextTest, WriteErrorWithEmptyMessage) {
  ctx.writeError(http::StatusCodeNotFound, "");
  EXPECT_EQ(response.status(), http::StatusCodeNotFound);
  EXPECT_EQ(response.body(), "\n");
}

}  // namespace pathmux
