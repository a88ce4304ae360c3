#pragma once

#include <string_view>

#include "pathmux/http-response.hpp"
#include "pathmux/http-status-code.hpp"
#include "pathmux/path-params.hpp"

namespace pathmux {

// Context handed to the handler resolved by the router for one request.
// It gives access to the request method, path, body and path captures, and to the response being built.
// The context and all the views it returns are only valid for the duration of the handler call.
class RequestContext {
 public:
  RequestContext(std::string_view method, std::string_view path, std::string_view body, const PathParams& pathParams,
                 HttpResponse& response) noexcept
      : _method(method), _path(path), _body(body), _pathParams(pathParams), _response(response) {}

  [[nodiscard]] std::string_view method() const noexcept { return _method; }

  [[nodiscard]] std::string_view path() const noexcept { return _path; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Captures of the matched pattern. Empty when the request was served by a default handler.
  [[nodiscard]] const PathParams& pathParams() const noexcept { return _pathParams; }

  // Value captured for the given parameter name, or an empty string_view if there is none.
  [[nodiscard]] std::string_view param(std::string_view name) const noexcept { return _pathParams.valueOrEmpty(name); }

  [[nodiscard]] HttpResponse& response() noexcept { return _response; }
  [[nodiscard]] const HttpResponse& response() const noexcept { return _response; }

  void writeStatus(http::StatusCode statusCode) noexcept { _response.status(statusCode); }

  // Appends text to the response body. Sets a plain text content type if none was set yet.
  void writeString(std::string_view text);

  // Replies with the given error status and message, replacing any body written so far.
  // The message is sent as plain text, followed by a new line.
  void writeError(http::StatusCode statusCode, std::string_view message);

 private:
  std::string_view _method;
  std::string_view _path;
  std::string_view _body;
  const PathParams& _pathParams;
  HttpResponse& _response;
};

}  // namespace pathmux
