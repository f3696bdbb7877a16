/**
 * @file test_fan_out.cpp
 * @brief Tests for fan_out.hpp
 */

#include "corral/fan_out.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace {

using UnitResult = corral::expected<void, corral::RemoteCommandError>;

std::vector<std::string> Units(int n) {
  std::vector<std::string> out;
  for (int i = 0; i < n; ++i) out.push_back("node-" + std::to_string(i));
  return out;
}

}  // namespace

TEST_CASE("FanOut with no units returns immediately", "[fan_out]") {
  int calls = 0;
  auto results = corral::FanOut(std::vector<std::string>(), 0U,
                                [&calls](const std::string&) {
                                  ++calls;
                                  return UnitResult::success();
                                });
  REQUIRE(results.empty());
  REQUIRE(calls == 0);
}

TEST_CASE("FanOut runs every unit exactly once in input order", "[fan_out]") {
  const auto units = Units(12);
  std::mutex mtx;
  std::multiset<std::string> seen;
  auto results = corral::FanOut(units, 0U, [&](const std::string& u) {
    std::lock_guard<std::mutex> lk(mtx);
    seen.insert(u);
    return UnitResult::success();
  });
  REQUIRE(results.size() == units.size());
  for (size_t i = 0; i < units.size(); ++i) {
    REQUIRE(results[i].unit_id == units[i]);
    REQUIRE(results[i].ok);
    REQUIRE(seen.count(units[i]) == 1U);
  }
}

TEST_CASE("FanOut isolates failures", "[fan_out]") {
  const auto units = Units(5);
  auto results = corral::FanOut(units, 0U, [](const std::string& u) {
    if (u == "node-1" || u == "node-3") {
      return UnitResult::error(corral::RemoteCommandError{u, 2, "exit 2"});
    }
    return UnitResult::success();
  });
  auto counts = corral::CountOutcomes(results);
  REQUIRE(counts.successes == 3U);
  REQUIRE(counts.failures == 2U);
  REQUIRE(!results[1].ok);
  REQUIRE(results[1].error.exit_code == 2);
  REQUIRE(results[3].error.unit_id == "node-3");
  REQUIRE(results[4].ok);
}

TEST_CASE("FanOut records exceptions as unit failures", "[fan_out]") {
  const auto units = Units(3);
  auto results = corral::FanOut(units, 0U, [](const std::string& u) {
    if (u == "node-2") throw std::runtime_error("ssh: connection refused");
    return UnitResult::success();
  });
  REQUIRE(corral::CountOutcomes(results).failures == 1U);
  REQUIRE(!results[2].ok);
  REQUIRE(results[2].error.unit_id == "node-2");
  REQUIRE(results[2].error.message == "ssh: connection refused");
}

TEST_CASE("FanOut fills in a missing unit id", "[fan_out]") {
  auto results = corral::FanOut(Units(1), 0U, [](const std::string&) {
    return UnitResult::error(corral::RemoteCommandError{"", 1, "failed"});
  });
  REQUIRE(results[0].error.unit_id == "node-0");
}

TEST_CASE("FanOut unbounded runs units concurrently", "[fan_out]") {
  const auto units = Units(6);
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  auto results = corral::FanOut(units, 0U, [&](const std::string&) {
    int now = ++active;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    --active;
    return UnitResult::success();
  });
  REQUIRE(corral::CountOutcomes(results).successes == 6U);
  REQUIRE(peak.load() > 1);
}

TEST_CASE("FanOut respects the concurrency bound", "[fan_out]") {
  const auto units = Units(10);
  std::atomic<int> active{0};
  std::atomic<int> peak{0};
  auto results = corral::FanOut(units, 2U, [&](const std::string&) {
    int now = ++active;
    int prev = peak.load();
    while (now > prev && !peak.compare_exchange_weak(prev, now)) {
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    --active;
    return UnitResult::success();
  });
  REQUIRE(results.size() == 10U);
  REQUIRE(corral::CountOutcomes(results).successes == 10U);
  REQUIRE(peak.load() <= 2);
}
