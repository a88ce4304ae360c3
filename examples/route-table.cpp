#include <pathmux/http-method-set.hpp>
#include <pathmux/http-status-code.hpp>
#include <pathmux/log.hpp>
#include <pathmux/request-context.hpp>
#include <pathmux/router-config.hpp>
#include <pathmux/router.hpp>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>

using namespace pathmux;

namespace {

void Usage(const char *prog) {
  std::cerr << "Usage: " << prog << " METHOD PATH [METHOD PATH]...\n"
            << "Dispatches each request against a small demo route table and prints the response.\n";
}

void RegisterRoutes(Router &router) {
  router.get("/", [](RequestContext &ctx) { ctx.writeString("Welcome to the pathmux demo"); })
      .catchAll(http::MethodSet::Any(),
                [](RequestContext &ctx) { ctx.writeError(http::StatusCodeBadRequest, "unknown resource"); });

  router.get("/users", [](RequestContext &ctx) { ctx.writeString("user list"); });
  router.post("/users", [](RequestContext &ctx) {
    ctx.writeStatus(http::StatusCodeCreated);
    ctx.writeString("created user from ");
    ctx.writeString(ctx.body());
  });
  router.get("/users/{id}", [](RequestContext &ctx) {
    ctx.writeString("user ");
    ctx.writeString(ctx.param("id"));
  });
  router.del("/users/{id}", [](RequestContext &ctx) { ctx.writeStatus(http::StatusCodeNoContent); });
  router.get("/users/{id}/posts/{post}", [](RequestContext &ctx) {
    ctx.writeString("post ");
    ctx.writeString(ctx.param("post"));
    ctx.writeString(" of user ");
    ctx.writeString(ctx.param("id"));
  });

  // everything under /static/ is served by the directory listing
  router.get("/static/", [](RequestContext &ctx) {
        ctx.writeString("static file ");
        ctx.writeString(ctx.path());
      })
      .catchAll(http::MethodSet::Get());

  router.any("/echo", [](RequestContext &ctx) {
    ctx.writeString(ctx.method());
    ctx.writeString(" ");
    ctx.writeString(ctx.body());
  });

  router.setDefault(http::MethodSet{"POST", "PUT", "DELETE", "PATCH"}, [](RequestContext &ctx) {
    ctx.writeError(http::StatusCodeMethodNotAllowed, "method not allowed");
  });
}

}  // namespace

int main(int argc, char **argv) {
  if (argc < 3 || argc % 2 == 0) {
    Usage(argv[0]);
    return EXIT_FAILURE;
  }

  log::set_level(log::level::warn);

  try {
    Router router(RouterConfig{}.withNotFoundBody("not found"));
    RegisterRoutes(router);

    for (int argPos = 1; argPos + 1 < argc; argPos += 2) {
      const std::string_view method = argv[argPos];
      const std::string_view path = argv[argPos + 1];

      HttpResponse resp = router.serve(method, path);
      std::cout << method << ' ' << path << " -> " << resp.status() << ' ' << resp.body() << '\n';
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << '\n';
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
