// Router benchmarks measuring route matching performance under
// various configurations:
//  - Literal-only paths (static routes)
//  - Routes with parameters, trailing slashes and catch-alls
//  - Routes with similar prefixes
//  - Full serve() round trip including the handler call

#include <benchmark/benchmark.h>

#include <cstddef>
#include <random>
#include <string_view>

#include "pathmux/http-method-set.hpp"
#include "pathmux/http-method.hpp"
#include "pathmux/request-context.hpp"
#include "pathmux/route-entry.hpp"
#include "pathmux/router.hpp"
#include "pathmux/vector.hpp"

namespace pathmux {

namespace {

std::mt19937_64 gen;

void OkHandler(RequestContext& ctx) { ctx.writeString("OK"); }

struct MethodAndPath {
  std::string_view method;
  std::string_view path;
};

struct RouterWithRoutes {
  RouteEntry set(std::string_view method, std::string_view path) {
    paths.emplace_back(method, path);
    return router.setPath(http::MethodKey(method), path, OkHandler);
  }

  void setMissing(std::string_view method, std::string_view path) {
    // not registered, to measure failing lookups
    paths.emplace_back(method, path);
  }

  const MethodAndPath& pickRandomPath() {
    std::uniform_int_distribution<std::size_t> dist(0, paths.size() - 1);
    return paths[dist(gen)];
  }

  auto match(std::string_view method, std::string_view path) const { return router.match(method, path); }

  vector<MethodAndPath> paths;
  Router router;
};

}  // namespace

class LiteralRoutesFixture : public benchmark::Fixture {
 public:
  void SetUp(const benchmark::State& /* state */) override {
    router.set(http::MethodGet, "/");
    router.set(http::MethodGet, "/health");
    router.set(http::MethodGet, "/metrics");
    router.set(http::MethodGet, "/api/v1/users");
    router.set(http::MethodPost, "/api/v1/users");
    router.set(http::MethodGet, "/api/v1/orders");
    router.set(http::MethodPost, "/api/v1/orders");
    router.set(http::MethodGet, "/api/v1/products");
    router.set(http::MethodGet, "/api/v1/categories");
    router.set(http::MethodGet, "/api/v2/users");
    router.set(http::MethodPost, "/api/v2/users");
    router.set(http::MethodGet, "/api/v2/orders");
    router.set(http::MethodGet, "/admin/dashboard");
    router.set(http::MethodGet, "/admin/settings");
    router.set(http::MethodPost, "/admin/settings");

    router.setMissing(http::MethodDelete, "/api/v1/users");
    router.setMissing(http::MethodPut, "/api/v1/orders");
    router.setMissing(http::MethodGet, "/api/v20/users");
  }

  void TearDown(const benchmark::State& /* state */) override { router = {}; }

  RouterWithRoutes router;
};

BENCHMARK_F(LiteralRoutesFixture, MatchRoot)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(LiteralRoutesFixture, MatchShortPath)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/health");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(LiteralRoutesFixture, MatchDeepPath)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/api/v1/categories");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(LiteralRoutesFixture, MatchNonExistent)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/api/v20/users");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(LiteralRoutesFixture, MatchRandomPaths)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    const auto& [method, path] = router.pickRandomPath();
    auto result = router.match(method, path);
    benchmark::DoNotOptimize(result);
  }
}

class PatternedRoutesFixture : public benchmark::Fixture {
 public:
  void SetUp(const benchmark::State& /* state */) override {
    router.set(http::MethodGet, "/users/{id}");
    router.set(http::MethodPut, "/users/{id}");
    router.set(http::MethodDelete, "/users/{id}");
    router.set(http::MethodGet, "/users/{id}/posts");
    router.set(http::MethodGet, "/users/{id}/posts/{postId}");
    router.set(http::MethodPut, "/users/{id}/posts/{postId}");
    router.set(http::MethodGet, "/users/{id}/posts/{postId}/comments");
    router.set(http::MethodGet, "/users/{id}/posts/{postId}/comments/{commentId}");

    router.set(http::MethodGet, "/static/").catchAll(http::MethodSet::Get());
    router.set(http::MethodGet, "/assets/images/").catchAll(http::MethodSet::Get());
    router.set(http::MethodGet, "/").catchAll(http::MethodSet::Any(), OkHandler);

    router.setMissing(http::MethodPost, "/users/123");
    router.setMissing(http::MethodGet, "/users/123/unknown");
  }

  void TearDown(const benchmark::State& /* state */) override { router = {}; }

  RouterWithRoutes router;
};

BENCHMARK_F(PatternedRoutesFixture, MatchSingleParam)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/users/12345");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, MatchMultipleParams)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/users/12345/posts/67890/comments/42");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, MatchSlashRouteCatchAll)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/static/css/main/site.css");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, MatchRootCatchAll)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/users/12345/posts/67890/comments/42/likes");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, MatchRandomPaths)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    const auto& [method, path] = router.pickRandomPath();
    auto result = router.match(method, path);
    benchmark::DoNotOptimize(result);
  }
}

class SimilarPrefixesFixture : public benchmark::Fixture {
 public:
  void SetUp(const benchmark::State& /* state */) override {
    router.set(http::MethodGet, "/api/users");
    router.set(http::MethodGet, "/api/user");
    router.set(http::MethodGet, "/api/user-settings");
    router.set(http::MethodGet, "/api/user-profile");
    router.set(http::MethodGet, "/api/user-preferences");
    router.set(http::MethodGet, "/api/users-list");
    router.set(http::MethodGet, "/api/users-active");
    router.set(http::MethodGet, "/api/users-inactive");
    router.set(http::MethodGet, "/api/users/{id}");
    router.set(http::MethodGet, "/api/users/{id}/profile");
    router.set(http::MethodGet, "/api/users/{id}/settings");
    router.set(http::MethodGet, "/api/orders");
    router.set(http::MethodGet, "/api/order");
    router.set(http::MethodGet, "/api/order-items");
    router.set(http::MethodGet, "/api/orders-pending");
  }

  void TearDown(const benchmark::State& /* state */) override { router = {}; }

  RouterWithRoutes router;
};

BENCHMARK_F(SimilarPrefixesFixture, MatchSuffixVariant)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/api/user-preferences");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SimilarPrefixesFixture, MatchParameterized)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto result = router.match(http::MethodGet, "/api/users/42/settings");
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(SimilarPrefixesFixture, MatchRandomPaths)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    const auto& [method, path] = router.pickRandomPath();
    auto result = router.match(method, path);
    benchmark::DoNotOptimize(result);
  }
}

BENCHMARK_F(PatternedRoutesFixture, ServeWithParams)(benchmark::State& st) {
  for ([[maybe_unused]] auto iter : st) {
    auto response = router.router.serve(http::MethodGet, "/users/12345/posts/67890");
    benchmark::DoNotOptimize(response);
  }
}

}  // namespace pathmux

BENCHMARK_MAIN();
