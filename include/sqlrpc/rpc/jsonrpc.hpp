#pragma once

#include "sqlrpc/rpc/rpc_error.hpp"

#include <nlohmann/json.hpp>

#include <expected>
#include <string>
#include <string_view>

namespace sqlrpc {

struct RpcRequest {
  // String, number or null.
  nlohmann::json id;
  std::string method;
  // Object; an absent params member becomes {}.
  nlohmann::json params = nlohmann::json::object();
};

struct EnvelopeError {
  RpcError error;
  // Whatever id could be recovered from the body, else null.
  nlohmann::json id;
};

[[nodiscard]] auto parse_request(std::string_view body)
    -> std::expected<RpcRequest, EnvelopeError>;

[[nodiscard]] auto make_result(const nlohmann::json& id, nlohmann::json result)
    -> nlohmann::json;
[[nodiscard]] auto make_error(const nlohmann::json& id, const RpcError& error)
    -> nlohmann::json;

// Serializes a response; invalid UTF-8 coming from the database is replaced
// rather than thrown on.
[[nodiscard]] auto dump_response(const nlohmann::json& response)
    -> std::string;

}  // namespace sqlrpc
