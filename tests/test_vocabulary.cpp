/**
 * @file test_vocabulary.cpp
 * @brief Tests for vocabulary.hpp types
 */

#include "corral/vocabulary.hpp"

#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace {

enum class TestError : uint8_t { kFirst = 0, kSecond };

/// Counts live instances; copying throws while fail_copy is set.
struct Tracked {
  static int live;
  static bool fail_copy;
  int v;

  explicit Tracked(int x) : v(x) { ++live; }
  Tracked(const Tracked& o) : v(o.v) {
    if (fail_copy) throw std::runtime_error("copy failed");
    ++live;
  }
  Tracked(Tracked&& o) noexcept : v(o.v) { ++live; }
  ~Tracked() { --live; }
};

int Tracked::live = 0;
bool Tracked::fail_copy = false;

}  // namespace

// ============================================================================
// expected<V, E> tests
// ============================================================================

TEST_CASE("expected success path", "[vocabulary][expected]") {
  auto r = corral::expected<int, TestError>::success(42);
  REQUIRE(r.has_value());
  REQUIRE(static_cast<bool>(r));
  REQUIRE(r.value() == 42);
}

TEST_CASE("expected error path", "[vocabulary][expected]") {
  auto r = corral::expected<int, TestError>::error(TestError::kSecond);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == TestError::kSecond);
  REQUIRE(r.value_or(99) == 99);
}

TEST_CASE("expected void specialization", "[vocabulary][expected]") {
  auto ok = corral::expected<void, TestError>::success();
  REQUIRE(ok.has_value());

  auto err = corral::expected<void, TestError>::error(TestError::kFirst);
  REQUIRE(!err.has_value());
  REQUIRE(err.get_error() == TestError::kFirst);
}

TEST_CASE("expected holds non-trivial values", "[vocabulary][expected]") {
  using R = corral::expected<std::vector<std::string>, std::string>;
  R r = R::success(std::vector<std::string>{"a", "b"});
  R copy = r;
  REQUIRE(copy.value().size() == 2U);

  std::vector<std::string> moved = std::move(r).value();
  REQUIRE(moved[1] == "b");

  R e = R::error(std::string("boom"));
  copy = e;
  REQUIRE(!copy.has_value());
  REQUIRE(copy.get_error() == "boom");
}

TEST_CASE("expected copy assignment that throws keeps the old value",
          "[vocabulary][expected]") {
  using E = corral::expected<Tracked, TestError>;
  {
    E target = E::success(Tracked(1));
    const E source = E::success(Tracked(2));
    REQUIRE(Tracked::live == 2);

    Tracked::fail_copy = true;
    REQUIRE_THROWS_AS(target = source, std::runtime_error);
    Tracked::fail_copy = false;

    REQUIRE(target.has_value());
    REQUIRE(target.value().v == 1);
    REQUIRE(Tracked::live == 2);

    target = source;
    REQUIRE(target.value().v == 2);
    target = E::error(TestError::kFirst);
    REQUIRE(target.get_error() == TestError::kFirst);
    REQUIRE(Tracked::live == 1);
  }
  REQUIRE(Tracked::live == 0);
}

// ============================================================================
// optional<T> tests
// ============================================================================

TEST_CASE("optional empty and engaged", "[vocabulary][optional]") {
  corral::optional<std::string> none;
  REQUIRE(!none.has_value());
  REQUIRE(none.value_or("fallback") == "fallback");

  corral::optional<std::string> some(std::string("value"));
  REQUIRE(some.has_value());
  REQUIRE(some.value() == "value");

  some.reset();
  REQUIRE(!some.has_value());
}

TEST_CASE("optional copy and move assignment", "[vocabulary][optional]") {
  corral::optional<int> a(5);
  corral::optional<int> b;
  b = a;
  REQUIRE(b.value() == 5);
  corral::optional<int> c;
  c = std::move(b);
  REQUIRE(c.value() == 5);
  a = corral::optional<int>();
  REQUIRE(!a.has_value());
}

// ============================================================================
// ScopeGuard tests
// ============================================================================

TEST_CASE("ScopeGuard runs on scope exit", "[vocabulary][scope_guard]") {
  int count = 0;
  {
    CORRAL_SCOPE_EXIT(++count);
    REQUIRE(count == 0);
  }
  REQUIRE(count == 1);
}

TEST_CASE("ScopeGuard Dismiss cancels", "[vocabulary][scope_guard]") {
  int count = 0;
  {
    auto guard = corral::MakeScopeGuard([&count]() { ++count; });
    guard.Dismiss();
  }
  REQUIRE(count == 0);
}

TEST_CASE("ScopeGuard runs during unwinding", "[vocabulary][scope_guard]") {
  bool released = false;
  try {
    CORRAL_SCOPE_EXIT(released = true);
    throw std::runtime_error("body failed");
  } catch (const std::runtime_error&) {
    REQUIRE(released);
  }
  REQUIRE(released);
}
