/**
 * @file vocabulary.hpp
 * @brief Vocabulary types: expected, optional, ScopeGuard.
 *
 * expected<V, E> carries either a value or an error without exceptions.
 * ScopeGuard runs a cleanup callable on every scope exit, including stack
 * unwinding, and backs CORRAL_SCOPE_EXIT.
 *
 * Header-only, C++17.
 */

#ifndef CORRAL_VOCABULARY_HPP_
#define CORRAL_VOCABULARY_HPP_

#include "corral/platform.hpp"

#include <new>
#include <type_traits>
#include <utility>

namespace corral {

// ============================================================================
// expected<V, E>
// ============================================================================

/**
 * @brief Value-or-error result type.
 *
 * @code
 *   expected<int, ConfigError> r = expected<int, ConfigError>::success(42);
 *   if (r.has_value()) { use(r.value()); } else { report(r.get_error()); }
 * @endcode
 */
template <typename V, typename E>
class expected {
 public:
  static expected success(const V& v) { return expected(kValueTag, v); }
  static expected success(V&& v) { return expected(kValueTag, std::move(v)); }
  static expected error(const E& e) { return expected(kErrorTag, e); }
  static expected error(E&& e) { return expected(kErrorTag, std::move(e)); }

  expected(const expected& other) : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(other.storage_.value);
    } else {
      new (&storage_.err) E(other.storage_.err);
    }
  }

  expected(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value)
      : has_value_(other.has_value_) {
    if (has_value_) {
      new (&storage_.value) V(std::move(other.storage_.value));
    } else {
      new (&storage_.err) E(std::move(other.storage_.err));
    }
  }

  /// A throwing copy leaves *this untouched.
  expected& operator=(const expected& other) {
    if (this != &other) {
      expected copy(other);
      *this = std::move(copy);
    }
    return *this;
  }

  /// A throwing move leaves *this empty (neither value nor error).
  expected& operator=(expected&& other) noexcept(
      std::is_nothrow_move_constructible<V>::value &&
      std::is_nothrow_move_constructible<E>::value) {
    if (this != &other) {
      Destroy();
      if (other.has_value_) {
        new (&storage_.value) V(std::move(other.storage_.value));
      } else {
        new (&storage_.err) E(std::move(other.storage_.err));
      }
      has_value_ = other.has_value_;
      engaged_ = true;
    }
    return *this;
  }

  ~expected() { Destroy(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  V& value() & {
    CORRAL_ASSERT(has_value_);
    return storage_.value;
  }
  const V& value() const& {
    CORRAL_ASSERT(has_value_);
    return storage_.value;
  }
  V&& value() && {
    CORRAL_ASSERT(has_value_);
    return std::move(storage_.value);
  }

  const E& get_error() const& {
    CORRAL_ASSERT(!has_value_);
    return storage_.err;
  }

  V value_or(const V& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

 private:
  struct ValueTag {};
  struct ErrorTag {};
  static constexpr ValueTag kValueTag{};
  static constexpr ErrorTag kErrorTag{};

  template <typename U>
  expected(ValueTag, U&& v) : has_value_(true) {
    new (&storage_.value) V(std::forward<U>(v));
  }
  template <typename U>
  expected(ErrorTag, U&& e) : has_value_(false) {
    new (&storage_.err) E(std::forward<U>(e));
  }

  void Destroy() noexcept {
    if (!engaged_) {
      return;
    }
    if (has_value_) {
      storage_.value.~V();
    } else {
      storage_.err.~E();
    }
    engaged_ = false;
  }

  union Storage {
    Storage() {}
    ~Storage() {}
    V value;
    E err;
  } storage_;
  bool has_value_;
  bool engaged_{true};  ///< false only after a failed assignment
};

/**
 * @brief expected<void, E>: success carries no value.
 */
template <typename E>
class expected<void, E> {
 public:
  static expected success() { return expected(); }
  static expected error(const E& e) { return expected(e); }
  static expected error(E&& e) { return expected(std::move(e)); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  const E& get_error() const& {
    CORRAL_ASSERT(!has_value_);
    return err_;
  }

 private:
  expected() : err_(), has_value_(true) {}
  explicit expected(const E& e) : err_(e), has_value_(false) {}
  explicit expected(E&& e) : err_(std::move(e)), has_value_(false) {}

  E err_;
  bool has_value_;
};

// ============================================================================
// optional<T>
// ============================================================================

/**
 * @brief Maybe-value with the same surface as the expected type above.
 */
template <typename T>
class optional {
 public:
  optional() noexcept : has_value_(false) {}
  optional(const T& v) : has_value_(true) { new (&storage_.value) T(v); }  // NOLINT
  optional(T&& v) : has_value_(true) {  // NOLINT
    new (&storage_.value) T(std::move(v));
  }

  optional(const optional& other) : has_value_(other.has_value_) {
    if (has_value_) new (&storage_.value) T(other.storage_.value);
  }
  optional(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value)
      : has_value_(other.has_value_) {
    if (has_value_) new (&storage_.value) T(std::move(other.storage_.value));
  }

  optional& operator=(const optional& other) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        new (&storage_.value) T(other.storage_.value);
        has_value_ = true;
      }
    }
    return *this;
  }
  optional& operator=(optional&& other) noexcept(
      std::is_nothrow_move_constructible<T>::value) {
    if (this != &other) {
      reset();
      if (other.has_value_) {
        new (&storage_.value) T(std::move(other.storage_.value));
        has_value_ = true;
      }
    }
    return *this;
  }

  ~optional() { reset(); }

  bool has_value() const noexcept { return has_value_; }
  explicit operator bool() const noexcept { return has_value_; }

  T& value() & {
    CORRAL_ASSERT(has_value_);
    return storage_.value;
  }
  const T& value() const& {
    CORRAL_ASSERT(has_value_);
    return storage_.value;
  }

  T value_or(const T& fallback) const {
    return has_value_ ? storage_.value : fallback;
  }

  void reset() noexcept {
    if (has_value_) {
      storage_.value.~T();
      has_value_ = false;
    }
  }

 private:
  union Storage {
    Storage() {}
    ~Storage() {}
    T value;
  } storage_;
  bool has_value_;
};

// ============================================================================
// ScopeGuard
// ============================================================================

/**
 * @brief Runs a callable when the guard leaves scope, unless dismissed.
 *
 * The callable also runs during stack unwinding, so cleanup registered
 * through a guard is attempted on every exit path.
 */
template <typename F>
class ScopeGuard {
 public:
  explicit ScopeGuard(F&& fn) noexcept(
      std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(fn)), active_(true) {}

  ScopeGuard(ScopeGuard&& other) noexcept(
      std::is_nothrow_move_constructible<F>::value)
      : fn_(std::move(other.fn_)), active_(other.active_) {
    other.active_ = false;
  }

  ~ScopeGuard() {
    if (active_) {
      fn_();
    }
  }

  void Dismiss() noexcept { active_ = false; }

  ScopeGuard(const ScopeGuard&) = delete;
  ScopeGuard& operator=(const ScopeGuard&) = delete;
  ScopeGuard& operator=(ScopeGuard&&) = delete;

 private:
  F fn_;
  bool active_;
};

template <typename F>
ScopeGuard<typename std::decay<F>::type> MakeScopeGuard(F&& fn) {
  return ScopeGuard<typename std::decay<F>::type>(std::forward<F>(fn));
}

#define CORRAL_SCOPE_EXIT(...)                                  \
  auto CORRAL_CONCAT(corral_scope_exit_, __LINE__) =            \
      ::corral::MakeScopeGuard([&]() { __VA_ARGS__; })

}  // namespace corral

#endif  // CORRAL_VOCABULARY_HPP_
