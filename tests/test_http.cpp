#include "nbhttp/http.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace nbhttp;

// ============================================================================
// HttpRequest::parse
// ============================================================================

TEST_CASE("HttpRequest - parse GET with headers", "[http]") {
  auto result = HttpRequest::parse(
      "GET /index.html?x=1 HTTP/1.1\r\n"
      "Host: localhost:8080\r\n"
      "User-Agent:  curl/8.0 \r\n"
      "\r\n");
  REQUIRE(result.has_value());

  const HttpRequest& req = result.value();
  REQUIRE(req.method == "GET");
  REQUIRE(req.target == "/index.html?x=1");
  REQUIRE(req.version == "HTTP/1.1");
  REQUIRE(req.headers.size() == 2);
  REQUIRE(req.header("host") == "localhost:8080");
  REQUIRE(req.header("USER-AGENT") == "curl/8.0");
  REQUIRE(req.header("Accept").empty());
  REQUIRE(req.body.empty());
}

TEST_CASE("HttpRequest - body follows the blank line", "[http]") {
  auto result = HttpRequest::parse("POST /submit HTTP/1.0\r\nContent-Length: 5\r\n\r\nhello");
  REQUIRE(result.has_value());
  REQUIRE(result.value().method == "POST");
  REQUIRE(result.value().body == "hello");
}

TEST_CASE("HttpRequest - bare LF line endings", "[http]") {
  auto result = HttpRequest::parse("GET / HTTP/1.1\nHost: a\n\n");
  REQUIRE(result.has_value());
  REQUIRE(result.value().target == "/");
  REQUIRE(result.value().header("Host") == "a");
}

TEST_CASE("HttpRequest - malformed input", "[http]") {
  SECTION("incomplete header block") {
    REQUIRE_FALSE(HttpRequest::parse("GET / HTTP/1.1\r\nHost: a\r\n").has_value());
  }
  SECTION("missing target") {
    REQUIRE_FALSE(HttpRequest::parse("GET HTTP/1.1\r\n\r\n").has_value());
  }
  SECTION("not an HTTP version") {
    REQUIRE_FALSE(HttpRequest::parse("GET / FTP/1.0\r\n\r\n").has_value());
  }
  SECTION("header without colon") {
    auto result = HttpRequest::parse("GET / HTTP/1.1\r\nBroken header\r\n\r\n");
    REQUIRE_FALSE(result.has_value());
    REQUIRE(result.get_error() == ErrorCode::kParseError);
  }
  SECTION("empty text") {
    REQUIRE_FALSE(HttpRequest::parse("").has_value());
  }
}

// ============================================================================
// HttpResponse
// ============================================================================

TEST_CASE("HttpResponse - reason phrases", "[http]") {
  REQUIRE(reason_phrase(200) == "OK");
  REQUIRE(reason_phrase(404) == "Not Found");
  REQUIRE(reason_phrase(599) == "Unknown");
  REQUIRE(HttpResponse(500).reason() == "Internal Server Error");
  REQUIRE(HttpResponse().set_status(299, "Custom").reason() == "Custom");
}

TEST_CASE("HttpResponse - raw_response adds length and close", "[http]") {
  std::string raw = HttpResponse::text(200, "hi\n").raw_response();
  REQUIRE(raw ==
          "HTTP/1.1 200 OK\r\n"
          "Content-Type: text/plain; charset=utf-8\r\n"
          "Content-Length: 3\r\n"
          "Connection: close\r\n"
          "\r\n"
          "hi\n");
}

TEST_CASE("HttpResponse - explicit headers are not duplicated", "[http]") {
  HttpResponse response(204);
  response.set_header("content-length", "0").set_header("Connection", "keep-alive");
  response.set_header("Content-Length", "0");

  REQUIRE(response.headers().size() == 2);
  std::string raw = response.raw_response();
  REQUIRE(raw == "HTTP/1.1 204 No Content\r\ncontent-length: 0\r\nConnection: keep-alive\r\n\r\n");
}

TEST_CASE("HttpResponse - set_body with content type", "[http]") {
  HttpResponse response(200);
  response.set_body("{}", "application/json");
  REQUIRE(response.body() == "{}");
  REQUIRE(response.headers().size() == 1);
  REQUIRE(response.headers()[0].second == "application/json");
}
