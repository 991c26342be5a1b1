#include <atomic>
#include <cassert>
#include <chrono>
#include <iostream>
#include <stdexcept>
#include <string>
#include <thread>

#include "cancellation.hpp"
#include "notify/var.hpp"
#include "watch.hpp"

using namespace notify;
using namespace std::chrono_literals;

// =============================================================================
// Test Counters
// =============================================================================

static int tests_passed = 0;
static int tests_failed = 0;

#define TEST(name)                                                             \
  std::cout << "Testing " << name << "... ";                                   \
  try

#define PASS()                                                                 \
  std::cout << "PASSED" << std::endl;                                          \
  ++tests_passed

#define FAIL(msg)                                                              \
  std::cout << "FAILED: " << msg << std::endl;                                 \
  ++tests_failed

// =============================================================================
// wait_for_change / wait_for_value Tests
// =============================================================================

void test_waits() {
  TEST("wait_for_change returns the new value") {
    var<int> v;
    cancellation_source stop;

    std::thread writer([&]() {
      std::this_thread::sleep_for(10ms);
      v.set(0); // equal value, must not satisfy
      v.set(5);
    });

    auto result = wait_for_change(stop.token(), 0, v);
    writer.join();

    assert(result);
    assert(result.status == wait_status::satisfied);
    assert(result.value == 5);
    assert(!result.changed.is_fired());

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("wait_for_change returns at once on a stale value") {
    var<int> v(3);
    cancellation_source stop;

    auto result = wait_for_change(stop.token(), 1, v);
    assert(result.status == wait_status::satisfied);
    assert(result.value == 3);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("wait_for_change reports cancellation") {
    var<int> v;
    cancellation_source stop;

    std::thread canceller([&]() {
      std::this_thread::sleep_for(10ms);
      stop.cancel();
    });

    auto result = wait_for_change(stop.token(), 0, v);
    canceller.join();

    assert(!result);
    assert(result.status == wait_status::cancelled);
    assert(result.value == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("wait_for_change_for times out") {
    var<std::string> v("idle");
    cancellation_source stop;

    auto start = std::chrono::steady_clock::now();
    auto result = wait_for_change_for(stop.token(), std::string("idle"), v, 20ms);
    auto elapsed = std::chrono::steady_clock::now() - start;

    assert(result.status == wait_status::timed_out);
    assert(result.value == "idle");
    assert(elapsed >= 20ms);
    // The subscription on the var was dropped on the way out
    assert(v.changed().state()->callback_count() == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("wait_for_value") {
    var<int> v;
    cancellation_source stop;
    std::atomic<bool> called{false};

    std::thread waiter([&]() {
      if (wait_for_value(stop.token(), 1, v) == wait_status::satisfied)
        called.store(true);
    });

    v.set(2);
    v.set(1);
    waiter.join();
    assert(called.load());

    // Cancelled before the value ever shows up
    stop.cancel();
    assert(wait_for_value(stop.token(), 42, v) == wait_status::cancelled);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Callback Loop Tests
// =============================================================================

void test_loops() {
  TEST("do_when_changed") {
    var<int> v;
    cancellation_source stop;
    std::atomic<bool> called{false};
    std::atomic<bool> bad_transition{false};

    loop_result<int> result{0, nullptr};
    std::thread watcher([&]() {
      result = do_when_changed(
          stop.token(), -1, v,
          [&](const cancellation_token &, const int &old_value,
              const int &new_value) {
            switch (new_value) {
            case 0:
              // Seen before set(1) below
              if (old_value != -1)
                bad_transition.store(true);
              break;
            case 1:
              if (old_value == -1 || old_value == 0)
                v.set(2); // loops around
              else
                bad_transition.store(true);
              break;
            case 2:
              if (old_value != 1)
                bad_transition.store(true);
              called.store(true);
              stop.cancel();
              break;
            default:
              bad_transition.store(true);
            }
          });
    });

    v.set(1);
    watcher.join();

    assert(called.load());
    assert(!bad_transition.load());
    assert(result);
    assert(result.last == 2);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("do_when_changed_or_interval") {
    var<int> v;
    cancellation_source stop;
    cancellation_source saw_minus_one;
    std::atomic<bool> called{false};
    std::atomic<bool> bad_transition{false};
    std::atomic<int> ticks{0};

    loop_result<int> result{0, nullptr};
    std::thread watcher([&]() {
      result = do_when_changed_or_interval(
          stop.token(), -1, v, 1ms,
          [&](const cancellation_token &, const int &old_value,
              const int &new_value) {
            // Expected sequence: (-1,0) (0,0)... (0,1) (1,1)... (1,2)
            if (old_value == new_value) {
              ticks.fetch_add(1);
            } else if (old_value == -1 && new_value == 0) {
              saw_minus_one.cancel();
            } else if (old_value == 0 && new_value == 1) {
              v.set(2);
            } else if (old_value == 1 && new_value == 2) {
              called.store(true);
              stop.cancel();
            } else {
              bad_transition.store(true);
            }
          });
    });

    saw_minus_one.token().cancelled().wait();
    // Let at least one interval tick go by on the unchanged value
    while (ticks.load() == 0)
      std::this_thread::sleep_for(1ms);
    v.set(1);
    watcher.join();

    assert(called.load());
    assert(!bad_transition.load());
    assert(result);
    assert(result.last == 2);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("throwing callback ends the loop with change_error") {
    var<int> v(7);
    cancellation_source stop;

    auto result = do_when_changed(
        stop.token(), 0, v,
        [](const cancellation_token &, const int &, const int &new_value) {
          throw std::runtime_error("rejected " + std::to_string(new_value));
        });

    assert(!result);
    assert(result.last == 0);

    bool caught_outer = false;
    bool caught_inner = false;
    try {
      result.rethrow_if_failed();
    } catch (const change_error &e) {
      caught_outer = true;
      assert(std::string(e.what()) == "changed [0 -> 7]");
      try {
        std::rethrow_if_nested(e);
      } catch (const std::runtime_error &inner) {
        caught_inner = std::string(inner.what()) == "rejected 7";
      }
    }
    assert(caught_outer);
    assert(caught_inner);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("loop returns at once on a cancelled token") {
    var<int> v;
    cancellation_source stop;
    stop.cancel();

    int calls = 0;
    auto result = do_when_changed(
        stop.token(), 0, v,
        [&](const cancellation_token &, const int &, const int &) { ++calls; });

    assert(result);
    assert(result.last == 0);
    assert(calls == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("cancelled token wins over a pending change") {
    var<int> v(5);
    cancellation_source stop;
    stop.cancel();

    int calls = 0;
    auto result = do_when_changed(
        stop.token(), 0, v,
        [&](const cancellation_token &, const int &, const int &) { ++calls; });
    assert(result);
    assert(result.last == 0);
    assert(calls == 0);

    auto ticked = do_when_changed_or_interval(
        stop.token(), 0, v, 1ms,
        [&](const cancellation_token &, const int &, const int &) { ++calls; });
    assert(ticked);
    assert(ticked.last == 0);
    assert(calls == 0);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }

  TEST("loop stops after cancel while the var keeps changing") {
    var<int> v(1);
    cancellation_source stop;

    int calls = 0;
    auto result = do_when_changed(
        stop.token(), 0, v,
        [&](const cancellation_token &, const int &, const int &new_value) {
          ++calls;
          v.set(new_value + 1); // always leaves a change pending
          if (calls == 3)
            stop.cancel();
        });

    assert(result);
    assert(calls == 3);
    assert(result.last == 3);
    assert(v.get().value == 4);

    PASS();
  } catch (const std::exception &e) {
    FAIL(e.what());
  }
}

// =============================================================================
// Main
// =============================================================================

int main() {
  std::cout << "=== Watch Tests ===" << std::endl << std::endl;

  std::cout << "--- Waits ---" << std::endl;
  test_waits();
  std::cout << std::endl;

  std::cout << "--- Callback Loops ---" << std::endl;
  test_loops();
  std::cout << std::endl;

  std::cout << "=== Results ===" << std::endl;
  std::cout << "Passed: " << tests_passed << std::endl;
  std::cout << "Failed: " << tests_failed << std::endl;

  return tests_failed > 0 ? 1 : 0;
}
