#include "sqlrpc/executor/executor.hpp"
#include "sqlrpc/core/runtime.hpp"
#include "sqlrpc/project/project_loader.hpp"

#include "test_utils.hpp"

#include <chrono>
#include <stdexcept>
#include <string>

#include <csignal>
#include <unistd.h>

#include "gtest/gtest.h"

using namespace sqlrpc;
using namespace std::chrono_literals;

namespace {

constexpr auto kTaskTimeout = std::chrono::milliseconds(10000);

[[noreturn]] void block_forever() {
  while (true) {
    pause();
  }
}

}  // namespace

class ExecutorTest : public ::testing::Test {
protected:
  void SetUp() override {
    runtime_.start();
  }

  void TearDown() override {
    runtime_.stop();
  }

  void use_worker(WorkerFn worker, ExecutorOptions options = {}) {
    executor_ = std::make_unique<Executor>(runtime_, options, std::move(worker));
  }

  auto make_task(nlohmann::json timeout_value = nullptr)
      -> std::shared_ptr<Task> {
    TaskSpec spec{.method = TaskMethod::Compile, .request_id = next_id_++};
    if (timeout_value.is_number()) {
      spec.timeout = timeout_value.get<double>();
    }
    spec.timeout_value = std::move(timeout_value);
    return std::make_shared<Task>(generate_task_id(), std::move(spec));
  }

  auto execute(const std::shared_ptr<Task>& task) -> void {
    ASSERT_TRUE(executor_->execute(task, WorkRequest{}).has_value());
  }

  Runtime runtime_;
  std::unique_ptr<Executor> executor_;
  int next_id_ = 1;
};

TEST_F(ExecutorTest, ResultAndLogsAreCollected) {
  use_worker([](const Task&, const WorkRequest&, int fd) {
    MessageWriter out(fd);
    out.log(log::Level::Info, "hello");
    out.result({{"answer", 42}});
    return 0;
  });
  auto task = make_task();
  execute(task);

  ASSERT_TRUE(task->wait_for(kTaskTimeout));
  EXPECT_EQ(task->state(), TaskState::Finished);
  auto result = task->result();
  ASSERT_TRUE(result.has_value());
  EXPECT_EQ((*result)["answer"], 42);
  ASSERT_EQ((*result)["logs"].size(), 1u);
  EXPECT_EQ((*result)["logs"][0]["message"], "hello");
  EXPECT_TRUE(test::wait_until([&] { return executor_->active() == 0; }));
}

TEST_F(ExecutorTest, ReportedErrorFailsTask) {
  use_worker([](const Task&, const WorkRequest&, int fd) {
    MessageWriter out(fd);
    out.error(rpc_error::compilation_error("request", "'x' is undefined",
                                           "select {{ x }}"));
    return 1;
  });
  auto task = make_task();
  execute(task);

  ASSERT_TRUE(task->wait_for(kTaskTimeout));
  EXPECT_EQ(task->state(), TaskState::Error);
  auto error = task->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, rpc_code::kCompilationError);
  EXPECT_EQ(error->data["raw_sql"], "select {{ x }}");
}

TEST_F(ExecutorTest, SilentExitIsRuntimeError) {
  use_worker([](const Task&, const WorkRequest&, int) { return 3; });
  auto task = make_task();
  execute(task);

  ASSERT_TRUE(task->wait_for(kTaskTimeout));
  auto error = task->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, rpc_code::kRuntimeError);
  EXPECT_EQ(error->data["message"],
            "Worker process exited with status 3 without reporting a result");
}

TEST_F(ExecutorTest, WorkerExceptionIsReported) {
  use_worker([](const Task&, const WorkRequest&, int) -> int {
    throw std::runtime_error("boom");
  });
  auto task = make_task();
  execute(task);

  ASSERT_TRUE(task->wait_for(kTaskTimeout));
  auto error = task->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, rpc_code::kRuntimeError);
  EXPECT_EQ(error->data["message"], "boom");
}

TEST_F(ExecutorTest, KillInterruptsWorker) {
  use_worker([](const Task&, const WorkRequest&, int) -> int {
    block_forever();
  });
  auto task = make_task();
  execute(task);
  EXPECT_EQ(task->state(), TaskState::Running);
  EXPECT_GT(task->snapshot().pid, 0);

  EXPECT_TRUE(executor_->terminate(*task, TerminationReason::Killed));
  EXPECT_FALSE(executor_->terminate(*task, TerminationReason::Timeout));

  ASSERT_TRUE(task->wait_for(kTaskTimeout));
  EXPECT_EQ(task->state(), TaskState::Killed);
  auto error = task->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, rpc_code::kKilled);
  EXPECT_EQ(error->data["signum"], SIGINT);
}

TEST_F(ExecutorTest, TimeoutEchoesClientValue) {
  use_worker([](const Task&, const WorkRequest&, int) -> int {
    block_forever();
  });
  auto task = make_task(1.5);
  execute(task);

  EXPECT_TRUE(executor_->terminate(*task, TerminationReason::Timeout));
  ASSERT_TRUE(task->wait_for(kTaskTimeout));
  EXPECT_EQ(task->state(), TaskState::Error);
  auto error = task->error();
  ASSERT_TRUE(error.has_value());
  EXPECT_EQ(error->code, rpc_code::kTimeout);
  EXPECT_EQ(error->data["timeout"], 1.5);
}

TEST_F(ExecutorTest, StubbornWorkerGetsSigkill) {
  use_worker(
      [](const Task&, const WorkRequest&, int) -> int {
        std::signal(SIGINT, SIG_IGN);
        std::signal(SIGTERM, SIG_IGN);
        block_forever();
      },
      ExecutorOptions{.kill_grace = 100ms});
  auto task = make_task();
  execute(task);

  auto start = std::chrono::steady_clock::now();
  EXPECT_TRUE(executor_->terminate(*task, TerminationReason::Killed));
  ASSERT_TRUE(task->wait_for(kTaskTimeout));
  EXPECT_GE(std::chrono::steady_clock::now() - start, 100ms);
  EXPECT_EQ(task->state(), TaskState::Killed);
}

TEST_F(ExecutorTest, TerminatedBeforeStartNeverSpawns) {
  use_worker([](const Task&, const WorkRequest&, int) { return 0; });
  auto task = make_task();
  EXPECT_TRUE(executor_->terminate(*task, TerminationReason::Killed));
  execute(task);

  EXPECT_EQ(task->state(), TaskState::Killed);
  EXPECT_EQ(executor_->active(), 0u);
  EXPECT_EQ(task->snapshot().pid, 0);
  EXPECT_FALSE(task->snapshot().started_at.has_value());
}

TEST_F(ExecutorTest, KillAllStopsEveryWorker) {
  use_worker([](const Task&, const WorkRequest&, int) -> int {
    block_forever();
  });
  auto a = make_task();
  auto b = make_task();
  execute(a);
  execute(b);
  EXPECT_EQ(executor_->active(), 2u);

  executor_->kill_all();
  ASSERT_TRUE(a->wait_for(kTaskTimeout));
  ASSERT_TRUE(b->wait_for(kTaskTimeout));
  EXPECT_EQ(a->state(), TaskState::Error);
  EXPECT_EQ(a->error()->data["message"],
            "Worker process terminated by signal 9 without reporting a "
            "result");
}

TEST(WaitStatusTest, Describe) {
  EXPECT_EQ(describe_wait_status(0), "exited with status 0");
  EXPECT_EQ(describe_wait_status(-1), "exited with an unknown status");
}

// The real worker against an on-disk project and database.
class WorkerPipelineTest : public ExecutorTest {
protected:
  void SetUp() override {
    ExecutorTest::SetUp();
    test::write_sample_project(dir_.path());
    auto loaded = ProjectLoader({.root = dir_.path()}).load();
    ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
    project_ = *loaded;
    use_worker(run_worker);
  }

  auto run(WorkRequest request) -> std::shared_ptr<Task> {
    request.db_path = (dir_ / "warehouse.db").string();
    auto task = std::make_shared<Task>(
        generate_task_id(), TaskSpec{.method = request.method,
                                     .request_id = next_id_++,
                                     .project = project_});
    EXPECT_TRUE(executor_->execute(task, std::move(request)).has_value());
    EXPECT_TRUE(task->wait_for(kTaskTimeout));
    return task;
  }

  test::TempDir dir_;
  ProjectSnapshot project_;
};

TEST_F(WorkerPipelineTest, CompileReturnsNode) {
  auto task = run({.method = TaskMethod::Compile,
                   .name = "adhoc",
                   .sql = "select * from {{ ref('orders') }}"});
  ASSERT_EQ(task->state(), TaskState::Finished);
  auto result = *task->result();
  EXPECT_EQ(result["compiled_sql"], R"(select * from "main"."orders")");
  EXPECT_EQ(result["node"]["resource_type"], "rpc");
  EXPECT_EQ(result["node"]["unique_id"], "rpc.shop.adhoc");
  EXPECT_EQ(result["node"]["original_file_path"], "from remote system");
  ASSERT_EQ(result["timing"].size(), 2u);
  EXPECT_EQ(result["timing"][0]["name"], "compile");
  EXPECT_FALSE(result.contains("table"));
}

TEST_F(WorkerPipelineTest, CompileErrorIsReported) {
  auto task = run({.method = TaskMethod::Compile, .sql = "select {{ nope }}"});
  ASSERT_EQ(task->state(), TaskState::Error);
  auto error = *task->error();
  EXPECT_EQ(error.code, rpc_code::kCompilationError);
  EXPECT_EQ(error.data["message"],
            "Compilation Error in rpc request (from remote system)\n"
            "  'nope' is undefined");
}

TEST_F(WorkerPipelineTest, RunReturnsTable) {
  auto task = run({.method = TaskMethod::Run,
                   .sql = "select 1 as a, 'x' as b"});
  ASSERT_EQ(task->state(), TaskState::Finished);
  auto table = (*task->result())["table"];
  EXPECT_EQ(table, nlohmann::json::parse(
                       R"({"column_names": ["a", "b"], "rows": [[1, "x"]]})"));
}

TEST_F(WorkerPipelineTest, RunDatabaseErrorIsReported) {
  auto task = run({.method = TaskMethod::Run,
                   .sql = "select * from {{ ref('orders') }}"});
  ASSERT_EQ(task->state(), TaskState::Error);
  auto error = *task->error();
  EXPECT_EQ(error.code, rpc_code::kDatabaseError);
  EXPECT_EQ(error.data["compiled_sql"], R"(select * from "main"."orders")");
}

TEST_F(WorkerPipelineTest, SeedRunTestAndQuery) {
  auto seed = run({.method = TaskMethod::SeedProject, .show = true});
  ASSERT_EQ(seed->state(), TaskState::Finished);
  auto seeded = (*seed->result())["results"];
  ASSERT_EQ(seeded.size(), 1u);
  EXPECT_EQ(seeded[0]["status"], "INSERT 3");
  EXPECT_EQ(seeded[0]["table"]["rows"].size(), 3u);

  auto built = run({.method = TaskMethod::RunProject});
  ASSERT_EQ(built->state(), TaskState::Finished);
  auto models = (*built->result())["results"];
  ASSERT_EQ(models.size(), 2u);
  EXPECT_EQ(models[0]["node"]["name"], "orders");
  EXPECT_EQ(models[0]["status"], "CREATE VIEW");
  EXPECT_EQ(models[1]["node"]["name"], "customer_totals");
  EXPECT_EQ(models[1]["status"], "CREATE TABLE");
  EXPECT_TRUE(models[1]["error"].is_null());

  auto tested = run({.method = TaskMethod::TestProject});
  ASSERT_EQ(tested->state(), TaskState::Finished);
  auto tests = (*tested->result())["results"];
  ASSERT_EQ(tests.size(), 3u);
  for (const auto& t : tests) {
    EXPECT_EQ(t["status"], 0) << t["node"]["name"];
    EXPECT_FALSE(t.contains("fail"));
  }

  auto totals = run({.method = TaskMethod::Run,
                     .sql = "select customer, total_cents from "
                            "{{ ref('customer_totals') }}"});
  ASSERT_EQ(totals->state(), TaskState::Finished);
  EXPECT_EQ((*totals->result())["table"]["rows"],
            nlohmann::json::parse(R"([["alice", 4200]])"));
}

TEST_F(WorkerPipelineTest, FailedModelSkipsDependents) {
  test::write_file(dir_ / "models/broken.sql",
                   "{{ config(materialized='table') }}"
                   "select * from missing_table");
  test::write_file(dir_ / "models/after_broken.sql",
                   "select * from {{ ref('broken') }}");
  auto reloaded = ProjectLoader({.root = dir_.path()}).load();
  ASSERT_TRUE(reloaded.has_value()) << reloaded.error().message;
  project_ = *reloaded;

  auto built = run({.method = TaskMethod::RunProject,
                    .models = {"broken", "after_broken"}});
  ASSERT_EQ(built->state(), TaskState::Finished);
  auto models = (*built->result())["results"];
  ASSERT_EQ(models.size(), 2u);
  EXPECT_EQ(models[0]["node"]["name"], "broken");
  EXPECT_EQ(models[0]["status"], "ERROR");
  EXPECT_TRUE(models[0]["error"].get<std::string>().starts_with(
      "Database Error in model broken (models/broken.sql)"));
  EXPECT_EQ(models[1]["node"]["name"], "after_broken");
  EXPECT_EQ(models[1]["status"], "SKIP");
  EXPECT_EQ(models[1]["skip"], true);
}

TEST_F(WorkerPipelineTest, ModelSelectionAndExclusion) {
  auto compiled = run({.method = TaskMethod::CompileProject,
                       .models = {"orders"}});
  ASSERT_EQ(compiled->state(), TaskState::Finished);
  auto results = (*compiled->result())["results"];
  // orders plus the three tests that read from it.
  ASSERT_EQ(results.size(), 4u);
  EXPECT_EQ(results[0]["node"]["name"], "orders");

  auto excluded = run({.method = TaskMethod::CompileProject,
                       .exclude = {"orders"}});
  ASSERT_EQ(excluded->state(), TaskState::Finished);
  for (const auto& r : (*excluded->result())["results"]) {
    EXPECT_NE(r["node"]["name"], "orders");
  }
}

TEST_F(WorkerPipelineTest, CompileProjectCompilesEachNode) {
  auto compiled = run({.method = TaskMethod::CompileProject,
                       .models = {"customer_totals"}});
  ASSERT_EQ(compiled->state(), TaskState::Finished);
  auto results = (*compiled->result())["results"];
  ASSERT_EQ(results.size(), 1u);
  EXPECT_TRUE(results[0]["error"].is_null());

  auto sql = results[0]["node"]["compiled_sql"].get<std::string>();
  EXPECT_NE(sql.find("__dbt__CTE__big_orders"), std::string::npos) << sql;
  EXPECT_NE(sql.find("(amount * 100)"), std::string::npos) << sql;

  ASSERT_EQ(results[0]["timing"].size(), 1u);
  const auto& timing = results[0]["timing"][0];
  EXPECT_EQ(timing["name"], "compile");
  EXPECT_LE(timing["started_at"].get<std::string>(),
            timing["completed_at"].get<std::string>());
}
