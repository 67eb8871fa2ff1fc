#pragma once

#include "sqlrpc/core/constants.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>

namespace sqlrpc {

// A JSON-RPC error object: {code, message, data?}.
struct RpcError {
  int code{rpc_code::kInternalError};
  std::string message;
  nlohmann::json data;  // null when absent

  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

namespace rpc_error {

[[nodiscard]] auto parse_error(std::string_view detail) -> RpcError;
[[nodiscard]] auto invalid_request(std::string_view detail) -> RpcError;
[[nodiscard]] auto method_not_found(std::string_view method) -> RpcError;
[[nodiscard]] auto invalid_params(std::string_view detail) -> RpcError;
[[nodiscard]] auto internal_error(std::string_view detail) -> RpcError;

// Worker died without reporting anything.
[[nodiscard]] auto runtime_error(std::string_view detail) -> RpcError;
[[nodiscard]] auto compilation_error(std::string_view node_name,
                                     std::string_view detail,
                                     const nlohmann::json& raw_sql) -> RpcError;
[[nodiscard]] auto database_error(std::string_view node_name,
                                  std::string_view detail,
                                  const nlohmann::json& raw_sql,
                                  const nlohmann::json& compiled_sql)
    -> RpcError;
// `timeout` is echoed verbatim, as the client sent it.
[[nodiscard]] auto timeout(const nlohmann::json& timeout) -> RpcError;
[[nodiscard]] auto killed(int signum) -> RpcError;
[[nodiscard]] auto server_compiling() -> RpcError;
[[nodiscard]] auto server_error(std::string_view compile_message) -> RpcError;
[[nodiscard]] auto duplicate_request(const nlohmann::json& request_id)
    -> RpcError;

}  // namespace rpc_error

}  // namespace sqlrpc
