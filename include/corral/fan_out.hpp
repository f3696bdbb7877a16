/**
 * MIT License
 *
 * Copyright (c) 2024 liudegui
 *
 * Permission is hereby granted, free of charge, to any person obtaining a copy
 * of this software and associated documentation files (the "Software"), to deal
 * in the Software without restriction, including without limitation the rights
 * to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
 * copies of the Software, and to permit persons to whom the Software is
 * furnished to do so, subject to the following conditions:
 *
 * The above copyright notice and this permission notice shall be included in all
 * copies or substantial portions of the Software.
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
 * @file fan_out.hpp
 * @brief Structured fan-out/join of per-unit operations.
 *
 *   FanOut(units, bound, fn)
 *        |
 *        +-- worker 0 (caller thread) --+
 *        +-- worker 1 ------------------+-- each pulls the next unit index
 *        +-- worker k-1 ----------------+   from a shared atomic cursor
 *        |
 *      join all --> one NodeResult per unit, in input order
 *
 * k = number of units when bound == 0 (one task per unit, no rate limit),
 * otherwise min(bound, units). The calling thread is one of the workers, so
 * if the system refuses to create more threads the remaining units still
 * run. Nothing outlives the call.
 *
 * Outcomes are independent: a failing unit never cancels or alters its
 * siblings. An exception escaping fn is recorded as that unit's failure.
 */

#ifndef CORRAL_FAN_OUT_HPP_
#define CORRAL_FAN_OUT_HPP_

#include "corral/log.hpp"
#include "corral/unit_executor.hpp"
#include "corral/vocabulary.hpp"

#include <atomic>
#include <cstdint>
#include <exception>
#include <string>
#include <system_error>
#include <thread>
#include <utility>
#include <vector>

namespace corral {

struct NodeResult {
  std::string unit_id;
  bool ok{false};
  RemoteCommandError error;  ///< Valid when !ok
};

struct OutcomeCounts {
  uint32_t successes{0U};
  uint32_t failures{0U};
};

inline OutcomeCounts CountOutcomes(const std::vector<NodeResult>& results) {
  OutcomeCounts c;
  for (const auto& r : results) {
    if (r.ok) {
      ++c.successes;
    } else {
      ++c.failures;
    }
  }
  return c;
}

/**
 * @brief Run @p fn once per unit concurrently and join before returning.
 *
 * @param units           Unit ids; one task each.
 * @param max_concurrency Upper bound on simultaneous tasks (0 = unbounded).
 * @param fn              Callable: expected<void, RemoteCommandError>(const std::string&).
 */
template <typename Fn>
std::vector<NodeResult> FanOut(const std::vector<std::string>& units,
                               uint32_t max_concurrency, Fn&& fn) {
  const uint32_t n = static_cast<uint32_t>(units.size());
  std::vector<NodeResult> results(n);
  if (n == 0U) {
    return results;
  }

  std::atomic<uint32_t> cursor{0U};
  auto worker = [&]() {
    for (;;) {
      const uint32_t idx = cursor.fetch_add(1U, std::memory_order_relaxed);
      if (idx >= n) {
        return;
      }
      NodeResult& slot = results[idx];
      slot.unit_id = units[idx];
      try {
        auto r = fn(units[idx]);
        if (r.has_value()) {
          slot.ok = true;
        } else {
          slot.error = r.get_error();
        }
      } catch (const std::exception& ex) {
        slot.error = RemoteCommandError{units[idx], -1, ex.what()};
      }
      if (!slot.ok && slot.error.unit_id.empty()) {
        slot.error.unit_id = units[idx];
      }
    }
  };

  const uint32_t width =
      (max_concurrency == 0U || max_concurrency > n) ? n : max_concurrency;
  std::vector<std::thread> threads;
  threads.reserve(width - 1U);
  for (uint32_t i = 1U; i < width; ++i) {
    try {
      threads.emplace_back(worker);
    } catch (const std::system_error& ex) {
      CORRAL_LOG_WARN("FanOut", "spawned %u of %u workers: %s", i, width,
                      ex.what());
      break;
    }
  }

  worker();

  for (auto& t : threads) {
    t.join();
  }
  return results;
}

}  // namespace corral

#endif  // CORRAL_FAN_OUT_HPP_
