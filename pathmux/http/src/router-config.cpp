#include "pathmux/router-config.hpp"

#include <stdexcept>
#include <string_view>

#include "pathmux/http-status-code.hpp"
#include "pathmux/log.hpp"

namespace pathmux {

void RouterConfig::validate() const {
  if (notFoundStatusCode < http::kMinStatusCode || notFoundStatusCode > http::kMaxStatusCode) {
    log::critical("Invalid not found status code {}", notFoundStatusCode);
    throw std::invalid_argument("Invalid not found status code");
  }
}

RouterConfig& RouterConfig::withNotFoundStatusCode(http::StatusCode statusCode) {
  notFoundStatusCode = statusCode;
  return *this;
}

RouterConfig& RouterConfig::withNotFoundBody(std::string_view body) {
  notFoundBody.assign(body);
  return *this;
}

RouterConfig& RouterConfig::withWarnOnOverwrite(bool enable) {
  warnOnOverwrite = enable;
  return *this;
}

}  // namespace pathmux
