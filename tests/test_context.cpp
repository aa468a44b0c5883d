/**
 * @file test_context.cpp
 * @brief Tests for context.hpp
 */

#include "tsched/context.hpp"

#include <catch2/catch_test_macros.hpp>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>

using namespace std::chrono_literals;

TEST_CASE("Background context is never done", "[context]") {
  auto bg = tsched::Context::Background();
  REQUIRE(bg.State() == tsched::ContextState::kActive);
  REQUIRE(!bg.IsDone());
  REQUIRE(!bg.HasDeadline());
  bg.Cancel();
  REQUIRE(!bg.IsDone());
  REQUIRE(!bg.WaitFor(1ms));
}

TEST_CASE("WithCancel is cancelled independently of its parent", "[context]") {
  auto parent = tsched::Context::WithCancel(tsched::Context::Background());
  auto child = tsched::Context::WithCancel(parent);

  child.Cancel();
  REQUIRE(child.State() == tsched::ContextState::kCancelled);
  REQUIRE(!parent.IsDone());
}

TEST_CASE("Cancelling a parent cancels every descendant", "[context]") {
  auto root = tsched::Context::WithCancel(tsched::Context::Background());
  auto mid = tsched::Context::WithCancel(root);
  auto leaf = tsched::Context::WithTimeout(mid, 10s);

  root.Cancel();
  REQUIRE(mid.State() == tsched::ContextState::kCancelled);
  REQUIRE(leaf.State() == tsched::ContextState::kCancelled);
}

TEST_CASE("Child of a cancelled parent starts cancelled", "[context]") {
  auto root = tsched::Context::WithCancel(tsched::Context::Background());
  root.Cancel();
  auto child = tsched::Context::WithCancel(root);
  REQUIRE(child.IsDone());
}

TEST_CASE("WithTimeout expires at its deadline", "[context]") {
  auto ctx = tsched::Context::WithTimeout(tsched::Context::Background(), 20ms);
  REQUIRE(ctx.HasDeadline());
  REQUIRE(!ctx.IsDone());

  REQUIRE(ctx.WaitFor(2s));
  REQUIRE(ctx.State() == tsched::ContextState::kDeadlineExceeded);
}

TEST_CASE("Child deadline never exceeds the parent's", "[context]") {
  auto parent = tsched::Context::WithTimeout(tsched::Context::Background(), 50ms);
  auto child = tsched::Context::WithTimeout(parent, 10s);
  REQUIRE(child.Deadline() == parent.Deadline());

  auto tighter = tsched::Context::WithTimeout(parent, 1ms);
  REQUIRE(tighter.Deadline() < parent.Deadline());
}

TEST_CASE("WaitFor wakes early on cancel", "[context]") {
  auto ctx = tsched::Context::WithCancel(tsched::Context::Background());
  std::thread canceller([ctx] {
    std::this_thread::sleep_for(20ms);
    ctx.Cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  REQUIRE(ctx.WaitFor(5s));
  const auto elapsed = std::chrono::steady_clock::now() - start;
  canceller.join();

  REQUIRE(elapsed < 2s);
  REQUIRE(ctx.State() == tsched::ContextState::kCancelled);
}

TEST_CASE("WaitFor returns false when the wait elapses", "[context]") {
  auto ctx = tsched::Context::WithCancel(tsched::Context::Background());
  REQUIRE(!ctx.WaitFor(5ms));
}

TEST_CASE("ContextStateToString names", "[context]") {
  REQUIRE(std::string(tsched::ContextStateToString(tsched::ContextState::kActive)) == "active");
  REQUIRE(std::string(tsched::ContextStateToString(tsched::ContextState::kCancelled)) ==
          "cancelled");
  REQUIRE(std::string(tsched::ContextStateToString(tsched::ContextState::kDeadlineExceeded)) ==
          "deadline exceeded");
}
