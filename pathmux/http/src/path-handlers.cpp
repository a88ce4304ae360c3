#include "pathmux/path-handlers.hpp"

#include <span>
#include <string_view>
#include <utility>

#include "pathmux/http-method.hpp"
#include "pathmux/vector.hpp"

namespace pathmux {

const RequestHandler* FindMethodHandler(std::span<const MethodHandler> handlers, std::string_view method) noexcept {
  const RequestHandler* pAnyHandler = nullptr;
  for (const MethodHandler& entry : handlers) {
    if (entry.method.is(method)) {
      return &entry.handler;
    }
    if (entry.method.isAny()) {
      pAnyHandler = &entry.handler;
    }
  }
  return pAnyHandler;
}

bool AssignMethodHandler(vector<MethodHandler>& handlers, const http::MethodKey& method, RequestHandler handler) {
  for (MethodHandler& entry : handlers) {
    if (entry.method == method) {
      entry.handler = std::move(handler);
      return true;
    }
  }
  handlers.emplace_back(method, std::move(handler));
  return false;
}

}  // namespace pathmux
