#include "sqlrpc/rpc/rpc_error.hpp"

#include <format>

namespace sqlrpc {

auto RpcError::to_json() const -> nlohmann::json {
  nlohmann::json j = {{"code", code}, {"message", message}};
  if (!data.is_null()) {
    j["data"] = data;
  }
  return j;
}

namespace rpc_error {

namespace {

auto with_detail(int code, std::string message, std::string_view detail)
    -> RpcError {
  RpcError err{code, std::move(message), nullptr};
  if (!detail.empty()) {
    err.data = {{"message", detail}};
  }
  return err;
}

}  // namespace

auto parse_error(std::string_view detail) -> RpcError {
  return with_detail(rpc_code::kParseError, "Parse error", detail);
}

auto invalid_request(std::string_view detail) -> RpcError {
  return with_detail(rpc_code::kInvalidRequest, "Invalid Request", detail);
}

auto method_not_found(std::string_view method) -> RpcError {
  return with_detail(rpc_code::kMethodNotFound, "Method not found",
                     std::format("Method '{}' is not supported", method));
}

auto invalid_params(std::string_view detail) -> RpcError {
  return with_detail(rpc_code::kInvalidParams, "Invalid params", detail);
}

auto internal_error(std::string_view detail) -> RpcError {
  return with_detail(rpc_code::kInternalError, "Internal error", detail);
}

auto runtime_error(std::string_view detail) -> RpcError {
  return RpcError{rpc_code::kRuntimeError,
                  "Runtime Error",
                  {{"type", "RuntimeException"}, {"message", detail}}};
}

auto compilation_error(std::string_view node_name, std::string_view detail,
                       const nlohmann::json& raw_sql) -> RpcError {
  return RpcError{
      rpc_code::kCompilationError,
      "Compilation Error",
      {{"type", "CompilationException"},
       {"message", std::format("Compilation Error in rpc {} (from remote "
                               "system)\n  {}",
                               node_name, detail)},
       {"raw_sql", raw_sql},
       {"compiled_sql", nullptr}}};
}

auto database_error(std::string_view node_name, std::string_view detail,
                    const nlohmann::json& raw_sql,
                    const nlohmann::json& compiled_sql) -> RpcError {
  return RpcError{
      rpc_code::kDatabaseError,
      "Database Error",
      {{"type", "DatabaseException"},
       {"message",
        std::format("Database Error in rpc {} (from remote system)\n  {}",
                    node_name, detail)},
       {"raw_sql", raw_sql},
       {"compiled_sql", compiled_sql}}};
}

auto timeout(const nlohmann::json& timeout) -> RpcError {
  auto shown =
      timeout.is_string() ? timeout.get<std::string>() : timeout.dump();
  return RpcError{rpc_code::kTimeout,
                  "RPC timeout error",
                  {{"timeout", timeout},
                   {"message", std::format("RPC timed out after {}s", shown)}}};
}

auto killed(int signum) -> RpcError {
  return RpcError{
      rpc_code::kKilled,
      "RPC process killed",
      {{"signum", signum},
       {"message", std::format("RPC process killed by signal {}", signum)}}};
}

auto server_compiling() -> RpcError {
  return RpcError{rpc_code::kServerCompiling,
                  "RPC server is compiling the project, call the \"status\" "
                  "method for compile status",
                  nullptr};
}

auto server_error(std::string_view compile_message) -> RpcError {
  return RpcError{rpc_code::kServerError,
                  "RPC server failed to compile project, call the \"status\" "
                  "method for compile status",
                  {{"message", compile_message}}};
}

auto duplicate_request(const nlohmann::json& request_id) -> RpcError {
  return RpcError{
      rpc_code::kDuplicateRequest,
      "Duplicate request ID",
      {{"request_id", request_id},
       {"message", std::format("A running request with id {} already exists",
                               request_id.dump())}}};
}

}  // namespace rpc_error

}  // namespace sqlrpc
