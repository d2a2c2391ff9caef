/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 */

#ifndef NBHTTP_UTF8_HPP_
#define NBHTTP_UTF8_HPP_

#include "vocabulary.hpp"

#include <cstddef>
#include <cstdint>

#include <string>
#include <string_view>

namespace nbhttp {
namespace utf8 {

// Strict validation: rejects overlong forms, UTF-16 surrogates, code points
// above U+10FFFF and sequences truncated at the end of the input.
// Returns the offset of the first invalid byte, or data.size() if valid.
size_t find_invalid(std::string_view data) noexcept;

inline bool is_valid(std::string_view data) noexcept {
  return find_invalid(data) == data.size();
}

// Decodes bytes read from a socket into text.
// Returns error(kDecodeError) on any malformed sequence.
expected<std::string, ErrorCode> decode(const uint8_t* data, size_t len);

}  // namespace utf8
}  // namespace nbhttp

#endif  // NBHTTP_UTF8_HPP_
