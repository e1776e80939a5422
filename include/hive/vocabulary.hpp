/**
 * @file vocabulary.hpp
 * @brief Vocabulary types shared by every hive module.
 *
 * expected<V, E> for error returns, optional, FixedString for bounded
 * identifiers, NewType for strong ids, and ScopeGuard for RAII cleanup.
 * Errors are plain enum class codes; nothing here throws.
 */

#ifndef HIVE_VOCABULARY_HPP_
#define HIVE_VOCABULARY_HPP_

#include "hive/platform.hpp"

#include <cstdint>
#include <cstring>
#include <new>
#include <optional>
#include <type_traits>
#include <utility>

namespace hive {

// ============================================================================
// Shared error enums
// ============================================================================

enum class ConfigError : uint8_t {
  kFileNotFound = 0,
  kParseError,
  kFormatNotSupported,
  kBufferFull,
  kInvalidValue
};

inline const char* ConfigErrorName(ConfigError e) noexcept {
  switch (e) {
    case ConfigError::kFileNotFound:       return "FileNotFound";
    case ConfigError::kParseError:         return "ParseError";
    case ConfigError::kFormatNotSupported: return "FormatNotSupported";
    case ConfigError::kBufferFull:         return "BufferFull";
    case ConfigError::kInvalidValue:       return "InvalidValue";
    default:                               return "Unknown";
  }
}

// ============================================================================
// optional
// ============================================================================

template <typename T>
using optional = std::optional<T>;

using std::nullopt;

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result.
 *
 * Constructed only through success() / error(). Accessing value() on an
 * error (or get_error() on a value) is a programming error and is caught
 * by HIVE_ASSERT in debug builds.
 */
template <typename V, typename E>
class expected final {
 public:
  static expected success(const V& v) {
    expected e;
    ::new (&e.storage_.value) V(v);
    e.has_value_ = true;
    return e;
  }

  static expected success(V&& v) {
    expected e;
    ::new (&e.storage_.value) V(std::move(v));
    e.has_value_ = true;
    return e;
  }

  static expected error(E err) noexcept {
    expected e;
    e.storage_.err = err;
    e.has_value_ = false;
    return e;
  }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(other.storage_.value);
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      ::new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      storage_.err = other.storage_.err;
    }
  }

  expected& operator=(const expected& other) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(other.storage_.value);
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value) {
    if (this != &other) {
      Destroy();
      has_value_ = other.has_value_;
      if (has_value_) {
        ::new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        storage_.err = other.storage_.err;
      }
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & noexcept {
    HIVE_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& noexcept {
    HIVE_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && noexcept {
    HIVE_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  E get_error() const noexcept {
    HIVE_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  expected() noexcept : has_value_(false) { storage_.err = E{}; }

  void Destroy() noexcept {
    if (has_value_) {
      storage_.value.~V();
      has_value_ = false;
    }
  }

  union Storage {
    Storage() noexcept : err() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
};

/// @brief void specialization: success carries no value.
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
    e.err_ = err;
    e.has_value_ = false;
    return e;
  }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  E get_error() const noexcept {
    HIVE_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() noexcept = default;

  E err_{};
  bool has_value_ = false;
};

// ============================================================================
// FixedString<N>
// ============================================================================

/// @brief Tag selecting the truncating FixedString constructor.
struct TruncateToCapacity_t {};
static constexpr TruncateToCapacity_t TruncateToCapacity{};

/**
 * @brief Stack-allocated, null-terminated string of at most N characters.
 */
template <uint32_t N>
class FixedString {
 public:
  FixedString() noexcept { buf_[0] = '\0'; }

  template <uint32_t M>
  FixedString(const char (&lit)[M]) noexcept {  // NOLINT
    static_assert(M - 1 <= N, "string literal exceeds FixedString capacity");
    std::memcpy(buf_, lit, M);
    size_ = M - 1;
  }

  FixedString(TruncateToCapacity_t, const char* s) noexcept {
    assign(TruncateToCapacity, s);
  }

  FixedString(TruncateToCapacity_t, const char* s, uint32_t len) noexcept {
    assign(TruncateToCapacity, s, len);
  }

  void assign(TruncateToCapacity_t, const char* s) noexcept {
    assign(TruncateToCapacity, s,
           s != nullptr ? static_cast<uint32_t>(std::strlen(s)) : 0U);
  }

  void assign(TruncateToCapacity_t, const char* s, uint32_t len) noexcept {
    if (s == nullptr) {
      len = 0;
    }
    size_ = (len < N) ? len : N;
    if (size_ > 0) {
      std::memcpy(buf_, s, size_);
    }
    buf_[size_] = '\0';
  }

  const char* c_str() const noexcept { return buf_; }
  uint32_t size() const noexcept { return size_; }
  bool empty() const noexcept { return size_ == 0; }
  static constexpr uint32_t capacity() noexcept { return N; }

  void clear() noexcept {
    size_ = 0;
    buf_[0] = '\0';
  }

  template <uint32_t M>
  bool operator==(const FixedString<M>& rhs) const noexcept {
    return size_ == rhs.size() && std::memcmp(buf_, rhs.c_str(), size_) == 0;
  }

  template <uint32_t M>
  bool operator!=(const FixedString<M>& rhs) const noexcept {
    return !(*this == rhs);
  }

  bool operator==(const char* rhs) const noexcept {
    return rhs != nullptr && std::strcmp(buf_, rhs) == 0;
  }

 private:
  char buf_[N + 1];
  uint32_t size_ = 0;
};

// ============================================================================
// NewType<T, Tag>
// ============================================================================

/**
 * @brief Zero-cost strong typedef; distinct Tag types do not convert.
 */
template <typename T, typename Tag>
class NewType {
 public:
  constexpr NewType() noexcept : val_() {}
  constexpr explicit NewType(T v) noexcept : val_(v) {}

  constexpr T value() const noexcept { return val_; }

  constexpr bool operator==(NewType rhs) const noexcept {
    return val_ == rhs.val_;
  }
  constexpr bool operator!=(NewType rhs) const noexcept {
    return val_ != rhs.val_;
  }
  constexpr bool operator<(NewType rhs) const noexcept {
    return val_ < rhs.val_;
  }

 private:
  T val_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callable on scope exit unless released.
 */
template <typename F>
class ScopeGuard {
 public:
  explicit ScopeGuard(F fn) noexcept : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void release() noexcept { active_ = false; }

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<F> MakeScopeGuard(F fn) noexcept {
  return ScopeGuard<F>(std::move(fn));
}

#define HIVE_SCOPE_EXIT(...)                                           \
  auto HIVE_CONCAT(hive_scope_exit_, __LINE__) =                       \
      ::hive::MakeScopeGuard([&]() { __VA_ARGS__; })

}  // namespace hive

#endif  // HIVE_VOCABULARY_HPP_
