#pragma once

#include <string>
#include <string_view>

#include "pathmux/http-status-code.hpp"

namespace pathmux {

namespace http {

inline constexpr std::string_view ContentTypeTextPlain = "text/plain; charset=utf-8";
inline constexpr std::string_view ContentTypeApplicationJson = "application/json";

}  // namespace http

// Response produced by a handler: a status code, an optional content type and a body.
class HttpResponse {
 public:
  // Creates an empty response with status 200.
  HttpResponse() noexcept = default;

  explicit HttpResponse(http::StatusCode statusCode) noexcept : _statusCode(statusCode) {}

  HttpResponse(http::StatusCode statusCode, std::string_view body,
               std::string_view contentType = http::ContentTypeTextPlain)
      : _body(body), _contentType(contentType), _statusCode(statusCode) {}

  [[nodiscard]] http::StatusCode status() const noexcept { return _statusCode; }

  [[nodiscard]] std::string_view body() const noexcept { return _body; }

  // Empty when no content type has been set.
  [[nodiscard]] std::string_view contentType() const noexcept { return _contentType; }

  HttpResponse &status(http::StatusCode statusCode) noexcept {
    _statusCode = statusCode;
    return *this;
  }

  // Replaces the body.
  HttpResponse &body(std::string_view body) {
    _body.assign(body);
    return *this;
  }

  HttpResponse &appendBody(std::string_view data) {
    _body.append(data);
    return *this;
  }

  HttpResponse &contentType(std::string_view contentType) {
    _contentType.assign(contentType);
    return *this;
  }

  bool operator==(const HttpResponse &) const noexcept = default;

 private:
  std::string _body;
  std::string _contentType;
  http::StatusCode _statusCode{http::StatusCodeOK};
};

}  // namespace pathmux
