#include "nbhttp/utf8.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using namespace nbhttp;

namespace {

auto decode_str(const std::string& s) {
  return utf8::decode(reinterpret_cast<const uint8_t*>(s.data()), s.size());
}

}  // namespace

TEST_CASE("utf8 - ASCII request text", "[utf8]") {
  std::string text = "GET /index.html HTTP/1.1\r\nHost: localhost\r\n\r\n";
  auto result = decode_str(text);
  REQUIRE(result.has_value());
  REQUIRE(result.value() == text);
}

TEST_CASE("utf8 - multi-byte sequences", "[utf8]") {
  REQUIRE(utf8::is_valid("caf\xC3\xA9"));                // U+00E9
  REQUIRE(utf8::is_valid("\xE2\x82\xAC"));               // U+20AC
  REQUIRE(utf8::is_valid("\xF0\x9F\x98\x80"));           // U+1F600
  REQUIRE(utf8::is_valid("\xF4\x8F\xBF\xBF"));           // U+10FFFF
  REQUIRE(utf8::is_valid(""));
}

TEST_CASE("utf8 - empty input decodes to empty text", "[utf8]") {
  auto result = utf8::decode(nullptr, 0);
  REQUIRE(result.has_value());
  REQUIRE(result.value().empty());
}

TEST_CASE("utf8 - invalid lead and continuation bytes", "[utf8]") {
  REQUIRE(utf8::find_invalid("ab\x80") == 2);
  REQUIRE(utf8::find_invalid("a\xFF") == 1);
  REQUIRE(utf8::find_invalid("\xF8\x88\x80\x80\x80") == 0);
  REQUIRE_FALSE(utf8::is_valid("\xC3\x28"));
}

TEST_CASE("utf8 - overlong encodings rejected", "[utf8]") {
  REQUIRE_FALSE(utf8::is_valid("\xC0\xAF"));
  REQUIRE_FALSE(utf8::is_valid("\xC1\xBF"));
  REQUIRE_FALSE(utf8::is_valid("\xE0\x80\xAF"));
  REQUIRE_FALSE(utf8::is_valid("\xF0\x80\x80\xAF"));
}

TEST_CASE("utf8 - surrogates and out-of-range code points rejected", "[utf8]") {
  REQUIRE_FALSE(utf8::is_valid("\xED\xA0\x80"));      // U+D800
  REQUIRE_FALSE(utf8::is_valid("\xED\xBF\xBF"));      // U+DFFF
  REQUIRE_FALSE(utf8::is_valid("\xF4\x90\x80\x80"));  // U+110000
}

TEST_CASE("utf8 - sequence truncated at end of input", "[utf8]") {
  REQUIRE(utf8::find_invalid("ok\xE2\x82") == 2);
  auto result = decode_str("GET /\xF0\x9F\x98");
  REQUIRE_FALSE(result.has_value());
  REQUIRE(result.get_error() == ErrorCode::kDecodeError);
}
