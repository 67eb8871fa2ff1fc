#include "sqlrpc/rpc/dispatcher.hpp"
#include "sqlrpc/core/runtime.hpp"
#include "sqlrpc/util/util.hpp"

#include "test_utils.hpp"

#include <atomic>
#include <chrono>
#include <mutex>
#include <string>
#include <vector>

#include <unistd.h>

#include "gtest/gtest.h"

using namespace sqlrpc;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

// Echoes the decoded request back. "hang" logs once and blocks until
// killed; "broken" reports a compilation error.
auto echo_worker(const Task&, const WorkRequest& req, int fd) -> int {
  MessageWriter out(fd);
  if (req.sql == "hang") {
    out.log(log::Level::Info, "waiting");
    while (true) {
      pause();
    }
  }
  if (req.sql == "broken") {
    out.error(rpc_error::compilation_error(req.name, "bad", req.sql));
    return 1;
  }
  out.log(log::Level::Info, "working");
  out.result({{"method", std::string(task_method_name(req.method))},
              {"sql", req.sql},
              {"name", req.name},
              {"macros", req.macros},
              {"models", req.models},
              {"exclude", req.exclude},
              {"show", req.show},
              {"db_path", req.db_path}});
  return 0;
}

auto sql_param(std::string_view sql) -> std::string {
  return encode_base64(sql);
}

}  // namespace

class DispatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    runtime_.start();
  }

  void TearDown() override {
    executor_.kill_all();
    runtime_.stop();
  }

  auto load(bool succeed = true) -> void {
    load_ok_ = succeed;
    (void)reload_.initial_load();
  }

  auto call(const std::string& method, json params = json::object(),
            json id = nullptr) -> json {
    if (id.is_null()) {
      id = next_id_++;
    }
    json body = {{"jsonrpc", "2.0"},
                 {"method", method},
                 {"id", id},
                 {"params", std::move(params)}};
    return dispatcher_.handle(body.dump());
  }

  auto poll_until_done(const std::string& token) -> json {
    json response;
    test::wait_until([&] {
      response = call("poll", {{"request_token", token}});
      if (response.contains("error")) {
        return true;
      }
      auto state = response["result"]["state"];
      return state != "running" && state != "pending";
    });
    return response;
  }

  Runtime runtime_;
  TaskRegistry registry_;
  Executor executor_{runtime_, ExecutorOptions{.kill_grace = 200ms},
                     echo_worker};
  std::atomic<bool> load_ok_{true};
  ReloadController reload_{
      [this]() -> std::expected<ProjectSnapshot, ProjectError> {
        if (!load_ok_) {
          return std::unexpected(ProjectError{"Compilation Error in model m"});
        }
        auto project =
            std::make_shared<CompiledProject>("shop", ".", "main");
        project->finalize();
        return project;
      }};
  Dispatcher dispatcher_{registry_, executor_, reload_,
                         DispatcherOptions{.db_path = "warehouse.db"}};
  int next_id_ = 1;
};

TEST_F(DispatcherTest, EnvelopeErrorsKeepRecoverableId) {
  auto parse = dispatcher_.handle("{not json");
  EXPECT_EQ(parse["error"]["code"], rpc_code::kParseError);
  EXPECT_TRUE(parse["id"].is_null());

  auto version =
      dispatcher_.handle(R"({"jsonrpc": "1.0", "method": "ps", "id": 9})");
  EXPECT_EQ(version["error"]["code"], rpc_code::kInvalidRequest);
  EXPECT_EQ(version["id"], 9);
}

TEST_F(DispatcherTest, UnknownMethod) {
  auto response = call("deploy", json::object(), "x");
  EXPECT_EQ(response["error"]["code"], rpc_code::kMethodNotFound);
  EXPECT_EQ(response["id"], "x");
}

TEST_F(DispatcherTest, TaskMethodsWaitForFirstCompile) {
  auto status = call("status");
  EXPECT_EQ(status["result"]["status"], "compiling");

  auto response = call("compile", {{"sql", sql_param("select 1")}});
  EXPECT_EQ(response["error"]["code"], rpc_code::kServerCompiling);
  EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(DispatcherTest, FailedCompileRejectsTasks) {
  load(false);
  auto status = call("status");
  EXPECT_EQ(status["result"]["status"], "error");
  EXPECT_EQ(status["result"]["error"]["message"],
            "Compilation Error in model m");
  EXPECT_EQ(status["result"]["pid"], ::getpid());
  EXPECT_TRUE(status["result"]["logs"].is_array());

  auto response = call("run_project");
  EXPECT_EQ(response["error"]["code"], rpc_code::kServerError);
  EXPECT_EQ(response["error"]["data"]["message"],
            "Compilation Error in model m");

  // Introspection keeps working while the project is broken.
  EXPECT_TRUE(call("ps").contains("result"));
}

TEST_F(DispatcherTest, StatusReadyHasNoError) {
  load();
  auto status = call("status");
  EXPECT_EQ(status["result"]["status"], "ready");
  EXPECT_FALSE(status["result"].contains("error"));
}

TEST_F(DispatcherTest, SynchronousCompileReturnsWorkerResult) {
  load();
  auto macros = sql_param("{% macro m() %}1{% endmacro %}");
  auto response = call("compile",
                       {{"sql", sql_param("select {{ 1 + 1 }}")},
                        {"name", "adhoc"},
                        {"macros", macros}},
                       "req-1");
  ASSERT_TRUE(response.contains("result")) << response.dump();
  const auto& result = response["result"];
  EXPECT_EQ(response["id"], "req-1");
  EXPECT_EQ(result["method"], "compile");
  EXPECT_EQ(result["sql"], "select {{ 1 + 1 }}");
  EXPECT_EQ(result["name"], "adhoc");
  EXPECT_EQ(result["macros"], "{% macro m() %}1{% endmacro %}");
  EXPECT_EQ(result["db_path"], "warehouse.db");
  ASSERT_EQ(result["logs"].size(), 1u);
  EXPECT_EQ(result["logs"][0]["message"], "working");
}

TEST_F(DispatcherTest, WorkerErrorBecomesResponseError) {
  load();
  auto response = call("run", {{"sql", sql_param("broken")}}, 5);
  EXPECT_EQ(response["id"], 5);
  EXPECT_EQ(response["error"]["code"], rpc_code::kCompilationError);
  EXPECT_EQ(response["error"]["data"]["raw_sql"], "broken");
  EXPECT_TRUE(response["error"]["data"]["logs"].is_array());
}

struct BadParamsCase {
  std::string name;
  std::string method;
  json params;
  std::string message;
};

auto operator<<(std::ostream& os, const BadParamsCase& c) -> std::ostream& {
  return os << c.name;
}

class DispatcherParamsTest
    : public DispatcherTest,
      public ::testing::WithParamInterface<BadParamsCase> {};

TEST_P(DispatcherParamsTest, RejectsInvalidParams) {
  load();
  const auto& c = GetParam();
  auto response = call(c.method, c.params);
  ASSERT_TRUE(response.contains("error")) << response.dump();
  EXPECT_EQ(response["error"]["code"], rpc_code::kInvalidParams);
  EXPECT_EQ(response["error"]["data"]["message"], c.message);
  EXPECT_EQ(registry_.size(), 0u);
}

INSTANTIATE_TEST_SUITE_P(
    Params, DispatcherParamsTest,
    ::testing::Values(
        BadParamsCase{"MissingSql", "compile", json::object(),
                      "Missing required parameter 'sql'"},
        BadParamsCase{"SqlNotString", "run", {{"sql", 1}},
                      "'sql' must be a string"},
        BadParamsCase{"SqlNotBase64", "compile", {{"sql", "%%%"}},
                      "'sql' is not valid base64"},
        BadParamsCase{"NegativeTimeout", "run_project", {{"timeout", -1}},
                      "'timeout' must not be negative"},
        BadParamsCase{"TimeoutString", "seed_project", {{"timeout", "5"}},
                      "'timeout' must be a number of seconds"},
        BadParamsCase{"ModelsNotNames", "test_project",
                      {{"models", json::array({1})}},
                      "'models' must be a list of names"},
        BadParamsCase{"AsyncNotBool", "compile_project", {{"async", "yes"}},
                      "'async' must be a boolean"},
        BadParamsCase{"KillWithoutId", "kill", json::object(),
                      "Missing required parameter 'task_id'"},
        BadParamsCase{"KillUnknown", "kill", {{"task_id", "nope"}},
                      "No task with id 'nope'"},
        BadParamsCase{"PollUnknown", "poll", {{"request_token", "nope"}},
                      "No task with request token 'nope'"},
        BadParamsCase{"PollNegativeOffset", "poll",
                      {{"request_token", "t"}, {"logs_start", -1}},
                      "'logs_start' must be a non-negative integer"}),
    [](const auto& info) { return info.param.name; });

TEST_F(DispatcherTest, ProjectSelectionParams) {
  load();
  auto response = call("run_project", {{"models", "orders  customers\n"},
                                       {"exclude", json::array({"big"})},
                                       {"show", true}});
  ASSERT_TRUE(response.contains("result")) << response.dump();
  EXPECT_EQ(response["result"]["method"], "run_project");
  EXPECT_EQ(response["result"]["models"],
            json::array({"orders", "customers"}));
  EXPECT_EQ(response["result"]["exclude"], json::array({"big"}));
  EXPECT_EQ(response["result"]["show"], true);
}

TEST_F(DispatcherTest, AsyncTaskIsPolledToCompletion) {
  load();
  auto submitted =
      call("compile", {{"sql", sql_param("select 1")}, {"async", true}});
  ASSERT_TRUE(submitted.contains("result")) << submitted.dump();
  auto token = submitted["result"]["request_token"].get<std::string>();
  EXPECT_TRUE(submitted["result"]["started"].is_string());

  auto done = poll_until_done(token);
  ASSERT_TRUE(done.contains("result")) << done.dump();
  const auto& result = done["result"];
  EXPECT_EQ(result["state"], "finished");
  EXPECT_EQ(result["sql"], "select 1");
  EXPECT_TRUE(result["start"].is_string());
  EXPECT_TRUE(result["end"].is_string());
  EXPECT_GE(result["elapsed"].get<double>(), 0.0);
  ASSERT_EQ(result["logs"].size(), 1u);

  auto tail = call("poll", {{"request_token", token}, {"logs_start", 1}});
  EXPECT_TRUE(tail["result"]["logs"].empty());
  auto quiet = call("poll", {{"request_token", token}, {"logs", false}});
  EXPECT_TRUE(quiet["result"]["logs"].empty());
}

TEST_F(DispatcherTest, KillRunningTask) {
  load();
  auto submitted =
      call("run", {{"sql", sql_param("hang")}, {"async", true}}, "long");
  auto token = submitted["result"]["request_token"].get<std::string>();

  auto killed = call("kill", {{"task_id", token}});
  ASSERT_TRUE(killed.contains("result")) << killed.dump();
  EXPECT_EQ(killed["result"]["state"], "killed");

  auto done = poll_until_done(token);
  ASSERT_TRUE(done.contains("error")) << done.dump();
  EXPECT_EQ(done["error"]["code"], rpc_code::kKilled);
  EXPECT_EQ(done["error"]["data"]["signum"], 2);

  // Killing a finished task reports its final state.
  EXPECT_EQ(call("kill", {{"task_id", token}})["result"]["state"], "killed");
}

TEST_F(DispatcherTest, AsyncHandlerRepliesWhenTaskIsKilled) {
  load();
  std::mutex mu;
  std::vector<json> replies;
  auto collect = [&](json response) {
    std::lock_guard lock(mu);
    replies.push_back(std::move(response));
  };
  auto count = [&] {
    std::lock_guard lock(mu);
    return replies.size();
  };

  json body = {{"jsonrpc", "2.0"},
               {"method", "run"},
               {"id", "sync"},
               {"params", {{"sql", sql_param("hang")}}}};
  dispatcher_.handle_async(body.dump(), collect);
  EXPECT_EQ(count(), 0u);

  auto task = registry_.find_by_request_id("sync");
  ASSERT_NE(task, nullptr);
  ASSERT_TRUE(
      test::wait_until([&] { return task->snapshot().log_count > 0; }));

  // Other methods answer inline while the task holds its caller.
  dispatcher_.handle_async(
      R"({"jsonrpc": "2.0", "method": "status", "id": 2})", collect);
  ASSERT_EQ(count(), 1u);
  EXPECT_EQ(replies[0]["result"]["status"], "ready");

  auto killed = call("kill", {{"task_id", task->id().str()}});
  EXPECT_EQ(killed["result"]["state"], "killed");
  ASSERT_TRUE(test::wait_until([&] { return count() == 2; }));

  std::lock_guard lock(mu);
  const auto& reply = replies[1];
  EXPECT_EQ(reply["id"], "sync");
  ASSERT_TRUE(reply.contains("error")) << reply.dump();
  EXPECT_EQ(reply["error"]["code"], rpc_code::kKilled);
  EXPECT_EQ(reply["error"]["data"]["signum"], 2);
  EXPECT_EQ(reply["error"]["data"]["message"],
            "RPC process killed by signal 2");
  ASSERT_FALSE(reply["error"]["data"]["logs"].empty());
  EXPECT_EQ(reply["error"]["data"]["logs"][0]["message"], "waiting");
}

TEST_F(DispatcherTest, AsyncHandlerDeliversResultOnce) {
  load();
  std::atomic<int> calls{0};
  json last;
  json body = {{"jsonrpc", "2.0"},
               {"method", "compile"},
               {"id", 5},
               {"params", {{"sql", sql_param("select 1")}}}};
  dispatcher_.handle_async(body.dump(), [&](json response) {
    last = std::move(response);
    calls.fetch_add(1);
  });
  ASSERT_TRUE(test::wait_until([&] { return calls.load() == 1; }));
  test::sleep_ms(50ms);
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(last["id"], 5);
  EXPECT_EQ(last["result"]["sql"], "select 1");
  EXPECT_EQ(last["result"]["logs"][0]["message"], "working");
}

TEST_F(DispatcherTest, DuplicateRequestIdWhileRunning) {
  load();
  auto first =
      call("run", {{"sql", sql_param("hang")}, {"async", true}}, "dup");
  ASSERT_TRUE(first.contains("result"));

  auto second = call("run", {{"sql", sql_param("select 1")}}, "dup");
  EXPECT_EQ(second["error"]["code"], rpc_code::kDuplicateRequest);
  EXPECT_EQ(second["error"]["data"]["request_id"], "dup");
  EXPECT_EQ(second["id"], "dup");
}

TEST_F(DispatcherTest, PsListsActiveAndCompleted) {
  load();
  auto finished = call("compile", {{"sql", sql_param("select 1")}}, "a");
  ASSERT_TRUE(finished.contains("result"));
  auto running = call("run",
                      {{"sql", sql_param("hang")},
                       {"async", true},
                       {"timeout", 30}},
                      "b");
  auto token = running["result"]["request_token"].get<std::string>();

  auto active = call("ps");
  ASSERT_EQ(active["result"]["rows"].size(), 1u);
  const auto& row = active["result"]["rows"][0];
  EXPECT_EQ(row["request_id"], "b");
  EXPECT_EQ(row["task_id"], token);
  EXPECT_EQ(row["method"], "run");
  EXPECT_EQ(row["timeout"], 30);
  EXPECT_TRUE(row["end"].is_null());

  auto all = call("ps", {{"completed", true}});
  ASSERT_EQ(all["result"]["rows"].size(), 2u);
  EXPECT_EQ(all["result"]["rows"][0]["request_id"], "a");
  EXPECT_EQ(all["result"]["rows"][0]["state"], "finished");
  EXPECT_TRUE(all["result"]["rows"][0]["timeout"].is_null());

  auto done = call("ps", {{"completed", true}, {"active", false}});
  ASSERT_EQ(done["result"]["rows"].size(), 1u);
  EXPECT_EQ(done["result"]["rows"][0]["request_id"], "a");
}

TEST_F(DispatcherTest, ReloadLeavesRunningTaskOnItsSnapshot) {
  load();
  auto before = reload_.current();
  auto submitted =
      call("run", {{"sql", sql_param("hang")}, {"async", true}}, "old");
  auto token = submitted["result"]["request_token"].get<std::string>();

  reload_.start();
  reload_.request_reload();
  ASSERT_TRUE(test::wait_until(
      [&] { return reload_.status().generation == 2; }));
  auto after = reload_.current();
  ASSERT_NE(before, after);

  EXPECT_EQ(registry_.get(TaskId{token})->project(), before);
  auto fresh =
      call("compile", {{"sql", sql_param("select 1")}, {"async", true}});
  auto fresh_token = fresh["result"]["request_token"].get<std::string>();
  EXPECT_EQ(registry_.get(TaskId{fresh_token})->project(), after);
  reload_.stop();
}
