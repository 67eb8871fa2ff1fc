#include "sqlrpc/task/task.hpp"
#include "sqlrpc/task/task_registry.hpp"

#include "test_utils.hpp"

#include "gtest/gtest.h"

#include <atomic>
#include <optional>
#include <string>
#include <thread>
#include <vector>

using namespace sqlrpc;

namespace {

auto spec(nlohmann::json request_id,
          TaskMethod method = TaskMethod::Compile) -> TaskSpec {
  return TaskSpec{.method = method, .request_id = std::move(request_id)};
}

}  // namespace

TEST(TaskNamesTest, MethodNamesRoundTrip) {
  EXPECT_EQ(task_method_name(TaskMethod::RunProject), "run_project");
  EXPECT_EQ(parse_task_method("seed_project"), TaskMethod::SeedProject);
  EXPECT_EQ(parse_task_method("compile"), TaskMethod::Compile);
  EXPECT_FALSE(parse_task_method("deploy").has_value());
  EXPECT_EQ(task_state_name(TaskState::Killed), "killed");
}

TEST(TaskTest, StartsPendingAndRuns) {
  Task task(TaskId("t1"), spec(1));
  EXPECT_EQ(task.state(), TaskState::Pending);
  EXPECT_FALSE(task.is_terminal());
  EXPECT_EQ(task.snapshot().elapsed(), 0.0);

  EXPECT_EQ(task.mark_running(1234), TerminationReason::None);
  auto snap = task.snapshot();
  EXPECT_EQ(snap.state, TaskState::Running);
  EXPECT_EQ(snap.pid, 1234);
  EXPECT_TRUE(snap.started_at.has_value());
  EXPECT_FALSE(snap.ended_at.has_value());
}

TEST(TaskTest, SucceedAttachesLogs) {
  Task task(TaskId("t1"), spec(1));
  task.mark_running(10);
  task.append_log(log::make_record(log::Level::Info, "first"));
  task.append_log(log::make_record(log::Level::Warn, "second"));

  ASSERT_TRUE(task.succeed({{"compiled_sql", "select 1"}}));
  EXPECT_EQ(task.state(), TaskState::Finished);
  EXPECT_EQ(task.snapshot().pid, 0);

  auto result = task.result();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ((*result)["compiled_sql"], "select 1");
  ASSERT_EQ((*result)["logs"].size(), 2u);
  EXPECT_EQ((*result)["logs"][1]["message"], "second");
  EXPECT_EQ((*result)["logs"][1]["levelname"], "WARNING");
  EXPECT_EQ((*result)["logs"][1]["level"], 30);
}

TEST(TaskTest, OnlyOneTerminalTransition) {
  Task task(TaskId("t1"), spec(1));
  task.mark_running(10);
  ASSERT_TRUE(task.fail(TaskState::Error, rpc_error::runtime_error("boom")));
  EXPECT_FALSE(task.succeed(nlohmann::json::object()));
  EXPECT_FALSE(task.fail(TaskState::Killed, rpc_error::killed(2)));

  EXPECT_EQ(task.state(), TaskState::Error);
  auto error = task.error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, rpc_code::kRuntimeError);
  EXPECT_TRUE(error->data["logs"].is_array());
  EXPECT_FALSE(task.result().has_value());
}

TEST(TaskTest, FailRejectsNonTerminalTargetState) {
  Task task(TaskId("t1"), spec(1));
  EXPECT_FALSE(task.fail(TaskState::Running, rpc_error::runtime_error("x")));
  EXPECT_FALSE(task.fail(TaskState::Finished, rpc_error::runtime_error("x")));
  EXPECT_EQ(task.state(), TaskState::Pending);
}

TEST(TaskTest, FirstTerminationRequestWins) {
  Task task(TaskId("t1"), spec(1));
  task.mark_running(10);

  auto first = task.request_termination(TerminationReason::Timeout);
  EXPECT_TRUE(first.recorded);
  EXPECT_EQ(first.pid, 10);
  auto second = task.request_termination(TerminationReason::Killed);
  EXPECT_FALSE(second.recorded);
  EXPECT_EQ(task.termination_reason(), TerminationReason::Timeout);
  EXPECT_TRUE(task.termination_requested_at().has_value());
}

TEST(TaskTest, TerminationBeforeStartIsReportedByMarkRunning) {
  Task task(TaskId("t1"), spec(1));
  ASSERT_TRUE(task.request_termination(TerminationReason::Killed).recorded);
  EXPECT_EQ(task.mark_running(10), TerminationReason::Killed);
}

TEST(TaskTest, TerminationIgnoredOnceTerminal) {
  Task task(TaskId("t1"), spec(1));
  ASSERT_TRUE(task.succeed(nlohmann::json::object()));
  auto req = task.request_termination(TerminationReason::Killed);
  EXPECT_FALSE(req.recorded);
  EXPECT_EQ(req.state, TaskState::Finished);
}

TEST(TaskTest, LogsFromOffset) {
  Task task(TaskId("t1"), spec(1));
  for (int i = 0; i < 5; ++i) {
    task.append_log(log::make_record(log::Level::Info, std::to_string(i)));
  }
  auto tail = task.logs_json(3);
  ASSERT_EQ(tail.size(), 2u);
  EXPECT_EQ(tail[0]["message"], "3");
  EXPECT_TRUE(task.logs_json(10).empty());
  EXPECT_EQ(task.logs(4).size(), 1u);
}

TEST(TaskTest, WaitForWakesOnCompletion) {
  Task task(TaskId("t1"), spec(1));
  EXPECT_FALSE(task.wait_for(std::chrono::milliseconds(10)));

  std::thread finisher([&task] {
    test::sleep_ms(std::chrono::milliseconds(20));
    (void)task.succeed(nlohmann::json::object());
  });
  EXPECT_TRUE(task.wait_for(std::chrono::milliseconds(2000)));
  finisher.join();
}

TEST(TaskTest, TerminalCallbackSeesFinalState) {
  Task task(TaskId("t1"), spec(1));
  task.mark_running(10);
  task.append_log(log::make_record(log::Level::Info, "working"));

  int calls = 0;
  std::optional<RpcError> seen;
  task.on_terminal([&](const Task& t) {
    ++calls;
    seen = t.error();
  });
  EXPECT_EQ(calls, 0);

  ASSERT_TRUE(task.fail(TaskState::Killed, rpc_error::killed(2)));
  EXPECT_FALSE(task.succeed(nlohmann::json::object()));
  EXPECT_EQ(calls, 1);
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ(seen->code, rpc_code::kKilled);
  EXPECT_EQ(seen->data["logs"].size(), 1u);
}

TEST(TaskTest, TerminalCallbackRunsInlineWhenAlreadyDone) {
  Task task(TaskId("t1"), spec(1));
  ASSERT_TRUE(task.succeed({{"compiled_sql", "select 1"}}));

  std::optional<nlohmann::json> seen;
  task.on_terminal([&](const Task& t) { seen = t.result(); });
  ASSERT_TRUE(seen.has_value());
  EXPECT_EQ((*seen)["compiled_sql"], "select 1");
}

TEST(LogRecordTest, JsonRoundTripKeepsLevel) {
  auto record = log::make_record(log::Level::Error, "bad");
  auto back = log_record_from_json(log_record_to_json(record));
  EXPECT_EQ(back.message, "bad");
  EXPECT_EQ(back.level, log::Level::Error);
  EXPECT_EQ(back.timestamp, record.timestamp);
}

class TaskRegistryTest : public ::testing::Test {
protected:
  TaskRegistry registry_;
};

TEST_F(TaskRegistryTest, CreateAndGet) {
  auto task = registry_.create(spec("a"));
  ASSERT_TRUE(task.has_value());
  EXPECT_EQ(registry_.size(), 1u);
  EXPECT_EQ(registry_.get((*task)->id()), *task);
  EXPECT_EQ(registry_.get(TaskId("missing")), nullptr);
}

TEST_F(TaskRegistryTest, DuplicateRequestIdWhileActive) {
  auto first = registry_.create(spec("same"));
  ASSERT_TRUE(first.has_value());

  auto second = registry_.create(spec("same"));
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), make_error_code(Error::DuplicateRequest));

  ASSERT_TRUE((*first)->succeed(nlohmann::json::object()));
  auto third = registry_.create(spec("same"));
  ASSERT_TRUE(third.has_value());
  EXPECT_EQ(registry_.find_by_request_id("same"), *third);
}

TEST_F(TaskRegistryTest, RequestIdTypesAreDistinct) {
  ASSERT_TRUE(registry_.create(spec(1)).has_value());
  EXPECT_TRUE(registry_.create(spec("1")).has_value());
}

TEST_F(TaskRegistryTest, IntegralFloatIdMatchesInteger) {
  auto first = registry_.create(spec(1));
  ASSERT_TRUE(first.has_value());

  auto second = registry_.create(spec(1.0));
  ASSERT_FALSE(second.has_value());
  EXPECT_EQ(second.error(), make_error_code(Error::DuplicateRequest));
  EXPECT_EQ(registry_.find_by_request_id(1.0), *first);

  EXPECT_TRUE(registry_.create(spec(1.5)).has_value());
  EXPECT_EQ(request_key(1.0), request_key(1));
  EXPECT_NE(request_key(1.5), request_key(1));
}

TEST_F(TaskRegistryTest, FinishedTasksLeaveTheLiveSet) {
  constexpr int kTasks = 50;
  for (int i = 0; i < kTasks; ++i) {
    auto task = registry_.create(spec(1));
    ASSERT_TRUE(task.has_value()) << i;
    (*task)->mark_running(100 + i);
    ASSERT_TRUE((*task)->succeed(nlohmann::json::object()));
  }
  auto open = *registry_.create(spec(1));
  open->mark_running(7);

  EXPECT_EQ(registry_.size(), static_cast<std::size_t>(kTasks + 1));
  EXPECT_EQ(registry_.live(), 1u);
  auto running = registry_.running();
  ASSERT_EQ(running.size(), 1u);
  EXPECT_EQ(running[0], open);

  ASSERT_TRUE(open->fail(TaskState::Killed, rpc_error::killed(2)));
  EXPECT_TRUE(registry_.running().empty());
  EXPECT_EQ(registry_.live(), 0u);
  EXPECT_EQ(registry_.find_by_request_id(1), open);
}

TEST_F(TaskRegistryTest, NullRequestIdsNeverCollide) {
  ASSERT_TRUE(registry_.create(spec(nullptr)).has_value());
  EXPECT_TRUE(registry_.create(spec(nullptr)).has_value());
  EXPECT_EQ(registry_.size(), 2u);
}

TEST_F(TaskRegistryTest, ListFiltersAndKeepsCreationOrder) {
  auto a = *registry_.create(spec(1));
  auto b = *registry_.create(spec(2));
  auto c = *registry_.create(spec(3));
  b->mark_running(100);
  ASSERT_TRUE(c->fail(TaskState::Killed, rpc_error::killed(2)));

  auto all = registry_.list({});
  ASSERT_EQ(all.size(), 3u);
  EXPECT_EQ(all[0], a);
  EXPECT_EQ(all[2], c);

  auto active = registry_.list({.include_running = true,
                                .include_completed = false});
  ASSERT_EQ(active.size(), 2u);
  EXPECT_EQ(active[0], a);
  EXPECT_EQ(active[1], b);

  auto done = registry_.list({.include_running = false,
                              .include_completed = true});
  ASSERT_EQ(done.size(), 1u);
  EXPECT_EQ(done[0], c);

  EXPECT_TRUE(registry_.list({.include_running = false,
                              .include_completed = false})
                  .empty());

  auto running = registry_.running();
  ASSERT_EQ(running.size(), 1u);
  EXPECT_EQ(running[0], b);
}

TEST_F(TaskRegistryTest, ConcurrentCreateAllowsOneActivePerRequestId) {
  constexpr int kThreads = 8;
  std::atomic<int> created{0};
  std::vector<std::thread> threads;
  for (int i = 0; i < kThreads; ++i) {
    threads.emplace_back([&] {
      if (registry_.create(spec("contended"))) {
        created.fetch_add(1);
      }
    });
  }
  for (auto& t : threads) {
    t.join();
  }
  EXPECT_EQ(created.load(), 1);
}
