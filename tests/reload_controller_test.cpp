#include "sqlrpc/project/reload_controller.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <latch>
#include <mutex>

#include <signal.h>
#include <unistd.h>

#include "gtest/gtest.h"

using namespace sqlrpc;
using namespace std::chrono_literals;

namespace {

auto empty_project(std::string name) -> ProjectSnapshot {
  auto project =
      std::make_shared<CompiledProject>(std::move(name), ".", "main");
  project->finalize();
  return project;
}

auto load_error(std::string message)
    -> std::expected<ProjectSnapshot, ProjectError> {
  return std::unexpected(ProjectError{std::move(message)});
}

}  // namespace

TEST(ReloadControllerTest, StartsCompilingWithoutSnapshot) {
  ReloadController reload([] { return empty_project("p"); });
  EXPECT_EQ(reload.status().state, ServerState::Compiling);
  EXPECT_EQ(reload.current(), nullptr);
  EXPECT_EQ(server_state_name(ServerState::Ready), "ready");
}

TEST(ReloadControllerTest, InitialLoadPublishesSnapshot) {
  ReloadController reload([] { return empty_project("p"); });
  ASSERT_TRUE(reload.initial_load());

  auto status = reload.status();
  EXPECT_EQ(status.state, ServerState::Ready);
  EXPECT_EQ(status.generation, 1u);
  EXPECT_TRUE(status.error.empty());
  ASSERT_NE(reload.current(), nullptr);
  EXPECT_EQ(reload.current()->name(), "p");
}

TEST(ReloadControllerTest, FailedLoadRecordsError) {
  ReloadController reload([] { return load_error("Compilation Error x"); });
  EXPECT_FALSE(reload.initial_load());

  auto status = reload.status();
  EXPECT_EQ(status.state, ServerState::Error);
  EXPECT_EQ(status.error, "Compilation Error x");
  EXPECT_EQ(status.generation, 0u);
  EXPECT_EQ(reload.current(), nullptr);
}

TEST(ReloadControllerTest, ReloadReplacesSnapshotAndRecoversFromError) {
  std::atomic<int> calls{0};
  ReloadController reload(
      [&]() -> std::expected<ProjectSnapshot, ProjectError> {
        auto n = ++calls;
        if (n == 2) {
          return load_error("broken");
        }
        return empty_project("gen" + std::to_string(n));
      });
  ASSERT_TRUE(reload.initial_load());
  auto first = reload.current();
  reload.start();

  reload.request_reload();
  ASSERT_TRUE(test::wait_until([&] { return calls.load() == 2; }));
  ASSERT_TRUE(reload.wait_idle(5s));
  EXPECT_EQ(reload.status().state, ServerState::Error);
  EXPECT_EQ(reload.status().error, "broken");
  // The last good snapshot stays published for tasks already holding it.
  EXPECT_EQ(reload.current(), first);

  reload.request_reload();
  ASSERT_TRUE(test::wait_until([&] { return calls.load() == 3; }));
  ASSERT_TRUE(reload.wait_idle(5s));
  EXPECT_EQ(reload.status().state, ServerState::Ready);
  EXPECT_EQ(reload.status().generation, 2u);
  EXPECT_EQ(reload.current()->name(), "gen3");
  reload.stop();
}

TEST(ReloadControllerTest, RequestsWhileBusyCollapse) {
  std::atomic<int> calls{0};
  std::latch entered{1};
  std::latch release{1};
  ReloadController reload([&]() -> std::expected<ProjectSnapshot,
                                                 ProjectError> {
    if (++calls == 1) {
      entered.count_down();
      release.wait();
    }
    return empty_project("p");
  });
  reload.start();

  reload.request_reload();
  entered.wait();
  for (int i = 0; i < 10; ++i) {
    reload.request_reload();
  }
  release.count_down();

  ASSERT_TRUE(test::wait_until([&] { return calls.load() >= 2; }));
  ASSERT_TRUE(reload.wait_idle(5s));
  EXPECT_EQ(calls.load(), 2);
  reload.stop();
}

TEST(ReloadControllerTest, StopWithoutStartIsNoOp) {
  ReloadController reload([] { return empty_project("p"); });
  reload.stop();
  EXPECT_TRUE(reload.wait_idle(10ms));
}

TEST(ReloadControllerTest, ProjectLoaderPicksUpChanges) {
  test::TempDir dir;
  test::write_file(dir / "project.yml", "name: live\n");
  test::write_file(dir / "models/a.sql", "select 1");

  ReloadController reload(make_project_loader({.root = dir.path()}));
  ASSERT_TRUE(reload.initial_load());
  EXPECT_EQ(reload.current()->nodes_of(ResourceType::Model).size(), 1u);
  reload.start();

  test::write_file(dir / "models/b.sql", "select * from {{ ref('a') }}");
  reload.request_reload();
  ASSERT_TRUE(test::wait_until(
      [&] { return reload.status().generation == 2; }));
  EXPECT_EQ(reload.current()->nodes_of(ResourceType::Model).size(), 2u);
  reload.stop();
}

TEST(ReloadControllerTest, SighupTriggersReload) {
  // Every thread created from here on inherits the blocked mask, so the
  // signal can only be consumed through the signalfd.
  ASSERT_TRUE(ReloadController::block_reload_signal());

  std::atomic<int> calls{0};
  ReloadController reload([&] {
    ++calls;
    return empty_project("p");
  });
  Runtime runtime;
  runtime.start();
  ASSERT_TRUE(reload.initial_load());
  reload.start();
  ASSERT_TRUE(reload.watch_sighup(runtime).has_value());
  EXPECT_FALSE(reload.watch_sighup(runtime).has_value());

  ASSERT_EQ(::kill(::getpid(), SIGHUP), 0);
  EXPECT_TRUE(test::wait_until([&] { return calls.load() == 2; }));

  runtime.stop();
  reload.stop();
}
