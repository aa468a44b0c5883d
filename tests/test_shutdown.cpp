/**
 * @file test_shutdown.cpp
 * @brief Tests for shutdown.hpp
 */

#include "tsched/shutdown.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <csignal>
#include <thread>
#include <vector>

using namespace std::chrono_literals;

namespace {

void PushOne(int /*signo*/, void* user) { static_cast<std::vector<int>*>(user)->push_back(1); }
void PushTwo(int /*signo*/, void* user) { static_cast<std::vector<int>*>(user)->push_back(2); }

void Noop(int /*signo*/, void* /*user*/) {}

int g_seen_signo = -1;
void SaveSigno(int signo, void* /*user*/) { g_seen_signo = signo; }

}  // namespace

TEST_CASE("ShutdownManager Register callbacks", "[shutdown]") {
  tsched::ShutdownManager mgr;
  REQUIRE(mgr.IsValid());

  for (uint32_t i = 0; i < tsched::ShutdownManager::kMaxCallbacks; ++i) {
    REQUIRE(mgr.Register(&Noop).has_value());
  }
  auto full = mgr.Register(&Noop);
  REQUIRE(!full.has_value());
  REQUIRE(full.get_error() == tsched::ShutdownError::kCallbacksFull);
}

TEST_CASE("ShutdownManager null callback rejected", "[shutdown]") {
  tsched::ShutdownManager mgr;
  auto r = mgr.Register(nullptr);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == tsched::ShutdownError::kInvalidCallback);
}

TEST_CASE("ShutdownManager only one instance is active", "[shutdown]") {
  tsched::ShutdownManager first;
  tsched::ShutdownManager second;
  REQUIRE(first.IsValid());
  REQUIRE(!second.IsValid());
  auto r = second.Register(&Noop);
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == tsched::ShutdownError::kAlreadyInstantiated);
}

TEST_CASE("ShutdownManager runs callbacks LIFO after cancelling contexts", "[shutdown]") {
  tsched::ShutdownManager mgr;
  auto ctx = tsched::Context::WithCancel(tsched::Context::Background());
  mgr.Watch(ctx);

  std::vector<int> order;
  (void)mgr.Register(&PushOne, &order);
  (void)mgr.Register(&PushTwo, &order);

  mgr.Quit(0);
  REQUIRE(mgr.IsShutdownRequested());
  mgr.WaitForShutdown();

  REQUIRE(ctx.State() == tsched::ContextState::kCancelled);
  REQUIRE(order == std::vector<int>{2, 1});

  // A second wait does not run callbacks again.
  mgr.WaitForShutdown();
  REQUIRE(order.size() == 2U);
}

TEST_CASE("ShutdownManager WaitForShutdownFor times out", "[shutdown]") {
  tsched::ShutdownManager mgr;
  REQUIRE(!mgr.WaitForShutdownFor(5));
  REQUIRE(!mgr.IsShutdownRequested());
}

TEST_CASE("ShutdownManager Quit from another thread wakes the waiter", "[shutdown]") {
  tsched::ShutdownManager mgr;
  g_seen_signo = -1;
  (void)mgr.Register(&SaveSigno);

  std::thread t([&mgr] {
    std::this_thread::sleep_for(10ms);
    mgr.Quit(7);
  });
  REQUIRE(mgr.WaitForShutdownFor(5000));
  t.join();
  REQUIRE(g_seen_signo == 7);
  REQUIRE(mgr.Signal() == 7);
}

TEST_CASE("ShutdownManager handles SIGTERM", "[shutdown]") {
  tsched::ShutdownManager mgr;
  REQUIRE(mgr.InstallSignalHandlers().has_value());
  g_seen_signo = -1;
  (void)mgr.Register(&SaveSigno);

  REQUIRE(std::raise(SIGTERM) == 0);
  REQUIRE(mgr.WaitForShutdownFor(1000));
  REQUIRE(g_seen_signo == SIGTERM);
}
