/**
 * @file test_module.cpp
 * @brief Tests for module.hpp
 */

#include "tsched/module.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <utility>
#include <vector>

namespace {

std::vector<std::string> g_events;

class FakeModule final : public tsched::Module {
 public:
  FakeModule(std::string name, bool start_ok = true, bool stop_ok = true)
      : name_(std::move(name)), start_ok_(start_ok), stop_ok_(stop_ok) {}

  bool StartModule(const tsched::Context& ctx) override {
    saw_done_ctx_ = ctx.IsDone();
    g_events.push_back("start:" + name_);
    return start_ok_;
  }

  bool StopModule() override {
    g_events.push_back("stop:" + name_);
    return stop_ok_;
  }

  bool saw_done_ctx_{false};

 private:
  std::string name_;
  bool start_ok_;
  bool stop_ok_;
};

}  // namespace

TEST_CASE("ModuleManager starts in order and stops in reverse", "[module]") {
  g_events.clear();
  FakeModule a("a");
  FakeModule b("b");
  tsched::ModuleManager mgr;
  REQUIRE(mgr.Register("a", &a).has_value());
  REQUIRE(mgr.Register("b", &b).has_value());
  REQUIRE(mgr.Count() == 2U);

  REQUIRE(mgr.StartAll(tsched::Context::Background()).has_value());
  REQUIRE(mgr.IsStarted("a"));
  REQUIRE(mgr.IsStarted("b"));
  REQUIRE(mgr.StopAll().has_value());
  REQUIRE(!mgr.IsStarted("a"));

  REQUIRE(g_events == std::vector<std::string>{"start:a", "start:b", "stop:b", "stop:a"});
}

TEST_CASE("ModuleManager rejects invalid and duplicate registrations", "[module]") {
  FakeModule a("a");
  tsched::ModuleManager mgr;
  REQUIRE(mgr.Register("a", &a).has_value());

  auto dup = mgr.Register("a", &a);
  REQUIRE(!dup.has_value());
  REQUIRE(dup.get_error() == tsched::ModuleError::kDuplicateName);

  auto null_mod = mgr.Register("b", nullptr);
  REQUIRE(!null_mod.has_value());
  REQUIRE(null_mod.get_error() == tsched::ModuleError::kInvalidModule);

  auto unnamed = mgr.Register("", &a);
  REQUIRE(!unnamed.has_value());
  REQUIRE(unnamed.get_error() == tsched::ModuleError::kInvalidModule);
}

TEST_CASE("ModuleManager stops at the first start failure", "[module]") {
  g_events.clear();
  FakeModule a("a");
  FakeModule broken("broken", false);
  FakeModule c("c");
  tsched::ModuleManager mgr;
  (void)mgr.Register("a", &a);
  (void)mgr.Register("broken", &broken);
  (void)mgr.Register("c", &c);

  auto r = mgr.StartAll(tsched::Context::Background());
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == tsched::ModuleError::kStartFailed);
  REQUIRE(mgr.IsStarted("a"));
  REQUIRE(!mgr.IsStarted("c"));

  REQUIRE(mgr.StopAll().has_value());
  REQUIRE(g_events == std::vector<std::string>{"start:a", "start:broken", "stop:a"});
}

TEST_CASE("ModuleManager StopAll reports failure but stops everyone", "[module]") {
  g_events.clear();
  FakeModule a("a");
  FakeModule sticky("sticky", true, false);
  tsched::ModuleManager mgr;
  (void)mgr.Register("a", &a);
  (void)mgr.Register("sticky", &sticky);
  REQUIRE(mgr.StartAll(tsched::Context::Background()).has_value());

  auto r = mgr.StopAll();
  REQUIRE(!r.has_value());
  REQUIRE(r.get_error() == tsched::ModuleError::kStopFailed);
  REQUIRE(g_events.back() == "stop:a");
}

TEST_CASE("ModuleManager passes the context through", "[module]") {
  FakeModule a("a");
  tsched::ModuleManager mgr;
  (void)mgr.Register("a", &a);
  auto ctx = tsched::Context::WithCancel(tsched::Context::Background());
  ctx.Cancel();
  REQUIRE(mgr.StartAll(ctx).has_value());
  REQUIRE(a.saw_done_ctx_);
}
