/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "corral/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

TEST_CASE("ShutdownManager registers and runs callbacks LIFO", "[shutdown]") {
  corral::ShutdownManager mgr;
  REQUIRE(mgr.IsValid());

  std::vector<int> order;
  int seen_signo = -1;
  REQUIRE(mgr.Register([&order](int) { order.push_back(1); }).has_value());
  REQUIRE(mgr.Register([&order](int) { order.push_back(2); }).has_value());
  REQUIRE(mgr.Register([&order, &seen_signo](int signo) {
                order.push_back(3);
                seen_signo = signo;
              }).has_value());

  REQUIRE(!mgr.IsShutdownRequested());
  mgr.Quit(15);
  REQUIRE(mgr.IsShutdownRequested());
  mgr.WaitForShutdown();

  REQUIRE(order.size() == 3U);
  REQUIRE(order[0] == 3);
  REQUIRE(order[1] == 2);
  REQUIRE(order[2] == 1);
  REQUIRE(seen_signo == 15);
}

TEST_CASE("ShutdownManager rejects a full callback list", "[shutdown]") {
  corral::ShutdownManager mgr;
  for (uint32_t i = 0U; i < corral::ShutdownManager::kMaxCallbacks; ++i) {
    REQUIRE(mgr.Register([](int) {}).has_value());
  }
  auto r = mgr.Register([](int) {});
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == corral::ShutdownError::kCallbacksFull);
  REQUIRE(mgr.Register(corral::ShutdownFn()).get_error() ==
          corral::ShutdownError::kCallbacksFull);
  REQUIRE(std::string(corral::ShutdownErrorName(r.get_error())) ==
          "callbacks full");
}

TEST_CASE("Only one ShutdownManager is active", "[shutdown]") {
  corral::ShutdownManager first;
  REQUIRE(first.IsValid());
  {
    corral::ShutdownManager second;
    REQUIRE(!second.IsValid());
    REQUIRE(second.Register([](int) {}).get_error() ==
            corral::ShutdownError::kAlreadyInstantiated);
    REQUIRE(second.InstallSignalHandlers().get_error() ==
            corral::ShutdownError::kAlreadyInstantiated);
  }
  // The invalid instance must not release the slot on destruction.
  corral::ShutdownManager third;
  REQUIRE(!third.IsValid());
}

TEST_CASE("WaitForShutdown unblocks on Quit from another thread",
          "[shutdown]") {
  corral::ShutdownManager mgr;
  bool ran = false;
  REQUIRE(mgr.Register([&ran](int) { ran = true; }).has_value());
  std::thread quitter([&mgr]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    mgr.Quit();
  });
  mgr.WaitForShutdown();
  quitter.join();
  REQUIRE(ran);
}

TEST_CASE("A failing step does not stop later steps", "[shutdown]") {
  corral::ShutdownManager mgr;
  bool flushed = false;
  REQUIRE(mgr.Register("flush log", [&flushed](int) { flushed = true; })
              .has_value());
  REQUIRE(mgr.Register("stop orchestrator",
                       [](int) { throw std::runtime_error("join failed"); })
              .has_value());
  mgr.Quit();
  mgr.WaitForShutdown();
  REQUIRE(flushed);
}

TEST_CASE("SIGTERM requests shutdown", "[shutdown]") {
  corral::ShutdownManager mgr;
  int seen = -1;
  REQUIRE(mgr.Register([&seen](int signo) { seen = signo; }).has_value());
  REQUIRE(mgr.InstallSignalHandlers().has_value());
  REQUIRE(::raise(SIGTERM) == 0);
  REQUIRE(mgr.IsShutdownRequested());
  mgr.WaitForShutdown();
  REQUIRE(seen == SIGTERM);
}

TEST_CASE("Quit is idempotent", "[shutdown]") {
  corral::ShutdownManager mgr;
  int calls = 0;
  REQUIRE(mgr.Register([&calls](int) { ++calls; }).has_value());
  mgr.Quit(2);
  mgr.Quit(15);
  mgr.WaitForShutdown();
  REQUIRE(calls == 1);
}
