/**
 * @file vocabulary.hpp
 * @brief Result and error vocabulary shared by every recon module.
 *
 * expected<V, E> carries either a value or an error without exceptions.
 * All fallible operations in recon return expected<..., Error>; nothing
 * throws. Compatible with -fno-exceptions -fno-rtti.
 */

#ifndef RECON_VOCABULARY_HPP_
#define RECON_VOCABULARY_HPP_

#include "recon/platform.hpp"

#include <cstdint>
#include <new>
#include <string>
#include <type_traits>
#include <utility>

namespace recon {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error holder.
 *
 * Construct through success() / error(). Accessing value() on an error (or
 * get_error() on a value) is a programming error and asserts in debug.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(V v) { return expected(ValueTag{}, std::move(v)); }
  static expected error(E e) { return expected(ErrorTag{}, std::move(e)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      ::new (&storage_.err) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      ::new (&storage_.err) E(std::move(other.storage_.err));
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      expected tmp(other);
      Destroy();
      MoveFrom(std::move(tmp));
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      MoveFrom(std::move(other));
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    RECON_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    RECON_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    RECON_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  const E& get_error() const& {
    RECON_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(V fallback) const& {
    return has_value_ ? storage_.value : std::move(fallback);
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};

  expected(ValueTag, V&& v) : has_value_(true) {
    ::new (&storage_.value) V(std::move(v));
  }
  expected(ErrorTag, E&& e) : has_value_(false) {
    ::new (&storage_.err) E(std::move(e));
  }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
  }

  void MoveFrom(expected&& other) {
    has_value_ = other.has_value_;
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      ::new (&storage_.err) E(std::move(other.storage_.err));
    }
  }

  union Storage {
    Storage() noexcept {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/** void specialization: success carries nothing. */
template <typename E>
class expected<void, E> final {
 public:
  static expected success() { return expected(true, E{}); }
  static expected error(E e) { return expected(false, std::move(e)); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const& {
    RECON_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected(bool ok, E e) : has_value_(ok), err_(std::move(e)) {}

  bool has_value_;
  E err_;
};

// ============================================================================
// Functional helpers
// ============================================================================

/** Chain a fallible step after a successful result; errors pass through. */
template <typename V, typename E, typename F>
auto and_then(const expected<V, E>& r, F&& f) -> decltype(f(r.value())) {
  using R = decltype(f(r.value()));
  if (!r.has_value()) return R::error(r.get_error());
  return f(r.value());
}

/** Invoke @p f with the error when @p r failed; returns @p r unchanged. */
template <typename V, typename E, typename F>
const expected<V, E>& or_else(const expected<V, E>& r, F&& f) {
  if (!r.has_value()) f(r.get_error());
  return r;
}

// ============================================================================
// Error taxonomy
// ============================================================================

enum class ErrorKind : uint8_t {
  kNotFound = 0,  ///< Instance does not exist (non-fatal on fetch).
  kTransport,     ///< Connect, TLS, socket I/O or malformed response.
  kApi,           ///< Control plane rejected the request.
  kTimeout,       ///< Address wait deadline elapsed.
  kCancelled,     ///< Interrupted by the process (signal).
  kInvalidSpec,   ///< Desired specification failed validation.
  kSettings,      ///< Settings file missing or unparsable.
};

inline const char* ErrorKindName(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::kNotFound:    return "not_found";
    case ErrorKind::kTransport:   return "transport";
    case ErrorKind::kApi:         return "api";
    case ErrorKind::kTimeout:     return "timeout";
    case ErrorKind::kCancelled:   return "cancelled";
    case ErrorKind::kInvalidSpec: return "invalid_spec";
    case ErrorKind::kSettings:    return "settings";
  }
  return "unknown";
}

/**
 * @brief Error value carried by every fallible recon operation.
 *
 * status_code holds the HTTP / API status when one was available (0
 * otherwise).
 */
struct Error {
  ErrorKind kind = ErrorKind::kTransport;
  std::string message;
  int32_t status_code = 0;
};

inline Error MakeError(ErrorKind kind, std::string message,
                       int32_t status_code = 0) {
  Error e;
  e.kind = kind;
  e.message = std::move(message);
  e.status_code = status_code;
  return e;
}

template <typename V>
using Result = expected<V, Error>;

using Status = expected<void, Error>;

inline Status Ok() { return Status::success(); }

}  // namespace recon

#endif  // RECON_VOCABULARY_HPP_
