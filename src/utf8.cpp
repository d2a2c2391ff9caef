/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#include "nbhttp/utf8.hpp"

namespace nbhttp {
namespace utf8 {

size_t find_invalid(std::string_view data) noexcept {
  const auto* p = reinterpret_cast<const uint8_t*>(data.data());
  const size_t n = data.size();
  size_t i = 0;

  while (i < n) {
    uint8_t b0 = p[i];

    if (b0 < 0x80) {
      ++i;
      continue;
    }

    size_t len = 0;
    uint32_t cp = 0;
    uint32_t min_cp = 0;

    if ((b0 & 0xE0) == 0xC0) {
      len = 2;
      cp = b0 & 0x1F;
      min_cp = 0x80;
    } else if ((b0 & 0xF0) == 0xE0) {
      len = 3;
      cp = b0 & 0x0F;
      min_cp = 0x800;
    } else if ((b0 & 0xF8) == 0xF0) {
      len = 4;
      cp = b0 & 0x07;
      min_cp = 0x10000;
    } else {
      // Stray continuation byte or 0xF8..0xFF
      return i;
    }

    if (i + len > n)
      return i;

    for (size_t k = 1; k < len; ++k) {
      uint8_t b = p[i + k];
      if ((b & 0xC0) != 0x80)
        return i;
      cp = (cp << 6) | (b & 0x3F);
    }

    if (cp < min_cp || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))
      return i;

    i += len;
  }
  return n;
}

expected<std::string, ErrorCode> decode(const uint8_t* data, size_t len) {
  if (len == 0)
    return expected<std::string, ErrorCode>::success(std::string());

  std::string_view view(reinterpret_cast<const char*>(data), len);
  if (find_invalid(view) != len) {
    return expected<std::string, ErrorCode>::error(ErrorCode::kDecodeError);
  }
  return expected<std::string, ErrorCode>::success(std::string(view));
}

}  // namespace utf8
}  // namespace nbhttp
