/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in
 * all copies or substantial portions of the Software.
 *
 * THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
 * IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
 * FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
 * AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
 * LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
 * OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
 * SOFTWARE.
 */

/**
 * @file vocabulary.hpp
 * @brief Vocabulary types for wscore: ErrorCode, expected, optional,
 *        ScopeGuard.
 */

#ifndef WSCORE_VOCABULARY_HPP_
#define WSCORE_VOCABULARY_HPP_

#include <cstddef>
#include <cstdint>

#include <functional>
#include <new>
#include <type_traits>
#include <utility>

#ifndef WSCORE_ASSERT
#define WSCORE_ASSERT(cond) ((void)(cond))
#endif

namespace wscore {

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error kinds surfaced by every layer of the engine.
 *
 * close_code_for() in message.hpp maps the fatal ones to the close code that
 * goes on the wire.
 */
enum class ErrorCode : uint8_t {
  kOk = 0,
  kProtocolViolation = 2,
  kMessageTooLarge = 3,
  kInvalidPayload = 4,
  kCompressionError = 5,
  kHandshakeFailed = 6,
  kHandshakeTimeout = 7,
  kCloseTimeout = 8,
  kIdleTimeout = 9,
  kRateLimited = 10,
  kBackpressureExceeded = 11,
  kTransportError = 12,
  kConnectionClosed = 13,
  kInvalidState = 14,
  kInvalidConfig = 15,
  kInvalidArgument = 16,
  kTimeout = 17,
  kMaxConnectionsExceeded = 18,
  kInternalError = 255
};

inline const char* error_name(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kOk: return "ok";
    case ErrorCode::kProtocolViolation: return "protocol violation";
    case ErrorCode::kMessageTooLarge: return "message too large";
    case ErrorCode::kInvalidPayload: return "invalid payload";
    case ErrorCode::kCompressionError: return "compression error";
    case ErrorCode::kHandshakeFailed: return "handshake failed";
    case ErrorCode::kHandshakeTimeout: return "handshake timeout";
    case ErrorCode::kCloseTimeout: return "close timeout";
    case ErrorCode::kIdleTimeout: return "idle timeout";
    case ErrorCode::kRateLimited: return "rate limited";
    case ErrorCode::kBackpressureExceeded: return "backpressure exceeded";
    case ErrorCode::kTransportError: return "transport error";
    case ErrorCode::kConnectionClosed: return "connection closed";
    case ErrorCode::kInvalidState: return "invalid state";
    case ErrorCode::kInvalidConfig: return "invalid config";
    case ErrorCode::kInvalidArgument: return "invalid argument";
    case ErrorCode::kTimeout: return "timeout";
    case ErrorCode::kMaxConnectionsExceeded: return "max connections exceeded";
    case ErrorCode::kInternalError: return "internal error";
  }
  return "unknown";
}

/// Errors after which the connection cannot continue.
inline bool is_fatal(ErrorCode code) noexcept {
  switch (code) {
    case ErrorCode::kProtocolViolation:
    case ErrorCode::kMessageTooLarge:
    case ErrorCode::kInvalidPayload:
    case ErrorCode::kCompressionError:
    case ErrorCode::kHandshakeFailed:
    case ErrorCode::kHandshakeTimeout:
    case ErrorCode::kCloseTimeout:
    case ErrorCode::kIdleTimeout:
    case ErrorCode::kTransportError:
    case ErrorCode::kInternalError:
      return true;
    default:
      return false;
  }
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
  static expected success(const V& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(val);
    return e;
  }

  static expected success(V&& val) noexcept {
    expected e;
    e.has_value_ = true;
    ::new (&e.storage_) V(static_cast<V&&>(val));
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.has_value_ = false;
    e.err_ = err;
    return e;
  }

  expected(const expected& other) noexcept : storage_{}, err_(other.err_),
                                             has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(other.value());
    }
  }

  expected& operator=(const expected& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(other.value());
      }
    }
    return *this;
  }

  expected(expected&& other) noexcept : storage_{}, err_(other.err_),
                                        has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) V(static_cast<V&&>(other.value()));
    }
  }

  expected& operator=(expected&& other) noexcept {
    if (this != &other) {
      if (has_value_) {
        reinterpret_cast<V*>(&storage_)->~V();
      }
      has_value_ = other.has_value_;
      err_ = other.err_;
      if (has_value_) {
        ::new (&storage_) V(static_cast<V&&>(other.value()));
      }
    }
    return *this;
  }

  ~expected() {
    if (has_value_) {
      reinterpret_cast<V*>(&storage_)->~V();
    }
  }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    WSCORE_ASSERT(has_value_);
    return *reinterpret_cast<V*>(&storage_);
  }

  const V& value() const& noexcept {
    WSCORE_ASSERT(has_value_);
    return *reinterpret_cast<const V*>(&storage_);
  }

  E get_error() const noexcept {
    WSCORE_ASSERT(!has_value_);
    return err_;
  }

  V value_or(const V& default_val) const noexcept {
    return has_value_ ? value() : default_val;
  }

 private:
  expected() noexcept : storage_{}, err_{}, has_value_(false) {}

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
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    WSCORE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept : err_{}, has_value_(false) {}

  E err_{};
  bool has_value_{false};
};

// ============================================================================
// optional<T> - Lightweight nullable value
// ============================================================================

/**
 * @brief Holds either a value of type T or nothing.
 */
template <typename T>
class optional final {
 public:
  optional() noexcept : has_value_(false) {}

  optional(const T& val) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(val);
  }

  optional(T&& val) noexcept : has_value_(true) {  // NOLINT
    ::new (&storage_) T(static_cast<T&&>(val));
  }

  optional(const optional& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(other.value());
    }
  }

  optional& operator=(const optional& other) noexcept {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(other.value());
      }
    }
    return *this;
  }

  optional(optional&& other) noexcept : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_) T(static_cast<T&&>(other.value()));
    }
  }

  optional& operator=(optional&& other) noexcept {
    if (this != &other) {
      reset();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_) T(static_cast<T&&>(other.value()));
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  [[nodiscard]] bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() noexcept {
    WSCORE_ASSERT(has_value_);
    return *reinterpret_cast<T*>(&storage_);
  }

  const T& value() const noexcept {
    WSCORE_ASSERT(has_value_);
    return *reinterpret_cast<const T*>(&storage_);
  }

  T value_or(const T& default_val) const noexcept {
    return has_value_ ? value() : default_val;
  }

  void reset() noexcept {
    if (has_value_) {
      reinterpret_cast<T*>(&storage_)->~T();
      has_value_ = false;
    }
  }

 private:
  typename std::aligned_storage<sizeof(T), alignof(T)>::type storage_;
  bool has_value_;
};

// ============================================================================
// ScopeGuard - RAII cleanup guard
// ============================================================================

/**
 * @brief Executes a cleanup callback on scope exit unless released.
 */
class ScopeGuard final {
 public:
  explicit ScopeGuard(std::function<void()> cleanup) noexcept
      : cleanup_(std::move(cleanup)) {}

  ~ScopeGuard() {
    if (active_ && cleanup_) {
      cleanup_();
    }
  }

  void release() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;

  ScopeGuard(ScopeGuard&& other) noexcept
      : cleanup_(std::move(other.cleanup_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  std::function<void()> cleanup_;
  bool active_{true};
};

}  // namespace wscore

#endif  // WSCORE_VOCABULARY_HPP_
