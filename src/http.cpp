/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "nbhttp/http.hpp"

#include <cctype>

namespace nbhttp {

namespace {

bool iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size())
    return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (std::tolower(static_cast<unsigned char>(a[i])) != std::tolower(static_cast<unsigned char>(b[i])))
      return false;
  }
  return true;
}

std::string_view trim(std::string_view s) {
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t'))
    s.remove_prefix(1);
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t'))
    s.remove_suffix(1);
  return s;
}

bool has_header(const std::vector<HttpHeader>& headers, std::string_view name) {
  for (const auto& h : headers) {
    if (iequals(h.first, name))
      return true;
  }
  return false;
}

}  // namespace

std::string_view reason_phrase(int status_code) noexcept {
  switch (status_code) {
    case 200:
      return "OK";
    case 201:
      return "Created";
    case 204:
      return "No Content";
    case 301:
      return "Moved Permanently";
    case 304:
      return "Not Modified";
    case 400:
      return "Bad Request";
    case 403:
      return "Forbidden";
    case 404:
      return "Not Found";
    case 405:
      return "Method Not Allowed";
    case 413:
      return "Payload Too Large";
    case 500:
      return "Internal Server Error";
    case 501:
      return "Not Implemented";
    case 503:
      return "Service Unavailable";
    default:
      return "Unknown";
  }
}

// ============================================================================
// HttpRequest
// ============================================================================

std::string_view HttpRequest::header(std::string_view name) const {
  for (const auto& h : headers) {
    if (iequals(h.first, name))
      return h.second;
  }
  return {};
}

expected<HttpRequest, ErrorCode> HttpRequest::parse(std::string_view text) {
  size_t head_end = text.find("\r\n\r\n");
  size_t sep_len = 4;
  if (head_end == std::string_view::npos) {
    head_end = text.find("\n\n");
    sep_len = 2;
  }
  if (head_end == std::string_view::npos) {
    return expected<HttpRequest, ErrorCode>::error(ErrorCode::kParseError);
  }

  HttpRequest request;
  std::string_view head = text.substr(0, head_end);
  request.body = std::string(text.substr(head_end + sep_len));

  // Request line: METHOD SP TARGET SP VERSION
  size_t line_end = head.find('\n');
  std::string_view line = head.substr(0, line_end);
  if (!line.empty() && line.back() == '\r')
    line.remove_suffix(1);

  size_t sp1 = line.find(' ');
  size_t sp2 = sp1 == std::string_view::npos ? sp1 : line.find(' ', sp1 + 1);
  if (sp1 == std::string_view::npos || sp2 == std::string_view::npos || sp1 == 0 || sp2 == sp1 + 1) {
    return expected<HttpRequest, ErrorCode>::error(ErrorCode::kParseError);
  }
  request.method = std::string(line.substr(0, sp1));
  request.target = std::string(line.substr(sp1 + 1, sp2 - sp1 - 1));
  request.version = std::string(line.substr(sp2 + 1));
  if (request.version.compare(0, 5, "HTTP/") != 0) {
    return expected<HttpRequest, ErrorCode>::error(ErrorCode::kParseError);
  }

  while (line_end != std::string_view::npos) {
    size_t start = line_end + 1;
    line_end = head.find('\n', start);
    std::string_view h = head.substr(start, line_end == std::string_view::npos ? std::string_view::npos : line_end - start);
    if (!h.empty() && h.back() == '\r')
      h.remove_suffix(1);
    if (h.empty())
      continue;

    size_t colon = h.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return expected<HttpRequest, ErrorCode>::error(ErrorCode::kParseError);
    }
    request.headers.emplace_back(std::string(trim(h.substr(0, colon))), std::string(trim(h.substr(colon + 1))));
  }

  return expected<HttpRequest, ErrorCode>::success(std::move(request));
}

// ============================================================================
// HttpResponse
// ============================================================================

HttpResponse& HttpResponse::set_status(int status_code, std::string reason) {
  status_code_ = status_code;
  reason_ = reason.empty() ? std::string(reason_phrase(status_code)) : std::move(reason);
  return *this;
}

HttpResponse& HttpResponse::set_header(std::string name, std::string value) {
  for (auto& h : headers_) {
    if (iequals(h.first, name)) {
      h.second = std::move(value);
      return *this;
    }
  }
  headers_.emplace_back(std::move(name), std::move(value));
  return *this;
}

HttpResponse& HttpResponse::set_body(std::string body, std::string content_type) {
  body_ = std::move(body);
  if (!content_type.empty())
    set_header("Content-Type", std::move(content_type));
  return *this;
}

std::string HttpResponse::raw_response() const {
  std::string out;
  out.reserve(64 + body_.size() + headers_.size() * 32);

  out += "HTTP/1.1 ";
  out += std::to_string(status_code_);
  out += ' ';
  out += reason_;
  out += "\r\n";

  for (const auto& h : headers_) {
    out += h.first;
    out += ": ";
    out += h.second;
    out += "\r\n";
  }
  if (!has_header(headers_, "Content-Length")) {
    out += "Content-Length: ";
    out += std::to_string(body_.size());
    out += "\r\n";
  }
  // The worker closes every connection after one response
  if (!has_header(headers_, "Connection")) {
    out += "Connection: close\r\n";
  }
  out += "\r\n";
  out += body_;
  return out;
}

}  // namespace nbhttp
