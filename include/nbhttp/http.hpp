/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_HTTP_HPP_
#define NBHTTP_HTTP_HPP_

#include "vocabulary.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace nbhttp {

using HttpHeader = std::pair<std::string, std::string>;

// Standard reason phrase for a status code ("Unknown" if not listed)
std::string_view reason_phrase(int status_code) noexcept;

// ============================================================================
// HttpRequest (start line + headers + body of a single request)
// ============================================================================

struct HttpRequest {
  std::string method;
  std::string target;
  std::string version;
  std::vector<HttpHeader> headers;
  std::string body;

  // Case-insensitive header lookup; empty view if absent
  std::string_view header(std::string_view name) const;

  // Parses the text delivered in one read. Requires the header block to be
  // complete (terminated by an empty line); the body is whatever follows.
  static expected<HttpRequest, ErrorCode> parse(std::string_view text);
};

// ============================================================================
// HttpResponse
// ============================================================================

class HttpResponse {
 public:
  HttpResponse() = default;
  explicit HttpResponse(int status_code) { set_status(status_code); }

  HttpResponse& set_status(int status_code, std::string reason = "");
  HttpResponse& set_header(std::string name, std::string value);
  HttpResponse& set_body(std::string body, std::string content_type = "text/plain; charset=utf-8");

  int status_code() const { return status_code_; }
  const std::string& reason() const { return reason_; }
  const std::string& body() const { return body_; }
  const std::vector<HttpHeader>& headers() const { return headers_; }

  // Exact bytes sent on the wire: status line, headers, blank line, body.
  // Content-Length and "Connection: close" are added unless set explicitly.
  std::string raw_response() const;

  static HttpResponse text(int status_code, std::string body) {
    HttpResponse response(status_code);
    response.set_body(std::move(body));
    return response;
  }

 private:
  int status_code_ = 200;
  std::string reason_ = "OK";
  std::vector<HttpHeader> headers_;
  std::string body_;
};

// Computes the response for one request; runs on a processing-pool thread.
using RequestHandler = std::function<HttpResponse(const HttpRequest&)>;

}  // namespace nbhttp

#endif  // NBHTTP_HTTP_HPP_
