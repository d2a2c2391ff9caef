/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * @file vocabulary.hpp
 * @brief Vocabulary types for nbhttp: ErrorCode and expected<V, E>.
 */

#ifndef NBHTTP_VOCABULARY_HPP_
#define NBHTTP_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>
#include <new>
#include <type_traits>
#include <utility>

// Exception support for -fno-exceptions builds
#if defined(__cpp_exceptions) || defined(__EXCEPTIONS)
#define NBHTTP_THROW(ex) throw(ex)
#else
#include <cstdio>
#include <cstdlib>
#define NBHTTP_THROW(ex)          \
  do {                            \
    std::fputs(#ex "\n", stderr); \
    std::abort();                 \
  } while (0)
#endif

#ifndef NBHTTP_ASSERT
#define NBHTTP_ASSERT(cond) ((void)(cond))
#endif

namespace nbhttp {

// ============================================================================
// Error Types
// ============================================================================

enum class ErrorCode : uint8_t {
  kOk = 0,
  kConnectionClosed = 1,
  kSocketError = 2,
  kWouldBlock = 3,
  kDecodeError = 4,
  kParseError = 5,
  kQueueFull = 6,
  kQueueClosed = 7,
  kMissingResponse = 8,
  kNoCapacity = 9,
  kPollError = 10,
  kInvalidState = 11,
  kInvalidArgument = 12,
  kInternalError = 255
};

inline const char* error_code_to_string(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk:
      return "ok";
    case ErrorCode::kConnectionClosed:
      return "connection closed";
    case ErrorCode::kSocketError:
      return "socket error";
    case ErrorCode::kWouldBlock:
      return "would block";
    case ErrorCode::kDecodeError:
      return "decode error";
    case ErrorCode::kParseError:
      return "parse error";
    case ErrorCode::kQueueFull:
      return "queue full";
    case ErrorCode::kQueueClosed:
      return "queue closed";
    case ErrorCode::kMissingResponse:
      return "missing response";
    case ErrorCode::kNoCapacity:
      return "no capacity";
    case ErrorCode::kPollError:
      return "poll error";
    case ErrorCode::kInvalidState:
      return "invalid state";
    case ErrorCode::kInvalidArgument:
      return "invalid argument";
    case ErrorCode::kInternalError:
      return "internal error";
  }
  return "unknown";
}

// ============================================================================
// expected<V, E> - Lightweight error-or-value type
// ============================================================================

/**
 * @brief Holds either a success value of type V or an error of type E.
 *
 * Use static factory methods success() and error() to construct.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(std::move(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_), has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(std::move(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      destroy();
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(std::move(other.value()));
      }
    }
    return *this;
  }

  ~expected() { destroy(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }

  V& value() & noexcept {
    NBHTTP_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    NBHTTP_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    NBHTTP_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

  void destroy() noexcept {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
      has_value_ = false;
    }
  }

  typename std::aligned_storage<sizeof(V), alignof(V)>::type storage_{};
  E err_{};
  bool has_value_{false};
};

/**
 * @brief Void specialization - represents success or error with no value.
 */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() noexcept {
    expected e;
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }

  E get_error() const noexcept {
    NBHTTP_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

}  // namespace nbhttp

#endif  // NBHTTP_VOCABULARY_HPP_
