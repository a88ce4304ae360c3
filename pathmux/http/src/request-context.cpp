#include "pathmux/request-context.hpp"

#include <string_view>

#include "pathmux/http-response.hpp"
#include "pathmux/http-status-code.hpp"

namespace pathmux {

void RequestContext::writeString(std::string_view text) {
  if (_response.contentType().empty()) {
    _response.contentType(http::ContentTypeTextPlain);
  }
  _response.appendBody(text);
}

void RequestContext::writeError(http::StatusCode statusCode, std::string_view message) {
  _response.status(statusCode).contentType(http::ContentTypeTextPlain).body(message).appendBody("\n");
}

}  // namespace pathmux
