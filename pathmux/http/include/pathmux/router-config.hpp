#pragma once

#include <string>
#include <string_view>

#include "pathmux/http-status-code.hpp"

namespace pathmux {

struct RouterConfig {
  // Checks the consistency of the configuration.
  // Throws std::invalid_argument if it is not valid.
  void validate() const;

  // Status of the built-in response served when a request matches no route, no catch-all and no default handler.
  // Default: 404
  http::StatusCode notFoundStatusCode{http::StatusCodeNotFound};

  // Body of the built-in not found response. Default: empty.
  std::string notFoundBody;

  // Emit a warning log when a registration replaces an existing handler or catch-all.
  bool warnOnOverwrite{true};

  RouterConfig& withNotFoundStatusCode(http::StatusCode statusCode);

  RouterConfig& withNotFoundBody(std::string_view body);

  RouterConfig& withWarnOnOverwrite(bool enable = true);
};

}  // namespace pathmux
