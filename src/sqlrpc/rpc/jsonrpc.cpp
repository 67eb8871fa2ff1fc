#include "sqlrpc/rpc/jsonrpc.hpp"

namespace sqlrpc {

namespace {

inline constexpr std::string_view kVersion = "2.0";

auto valid_id(const nlohmann::json& id) -> bool {
  return id.is_null() || id.is_string() || id.is_number();
}

auto envelope_error(RpcError error, nlohmann::json id = nullptr)
    -> std::unexpected<EnvelopeError> {
  return std::unexpected(EnvelopeError{std::move(error), std::move(id)});
}

}  // namespace

auto parse_request(std::string_view body)
    -> std::expected<RpcRequest, EnvelopeError> {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) {
    return envelope_error(rpc_error::parse_error("Request body is not JSON"));
  }
  if (!j.is_object()) {
    return envelope_error(
        rpc_error::invalid_request("Request must be a JSON object"));
  }

  RpcRequest req;
  if (auto it = j.find("id"); it != j.end()) {
    if (!valid_id(*it)) {
      return envelope_error(rpc_error::invalid_request(
          "'id' must be a string, a number or null"));
    }
    req.id = *it;
  }

  auto version = j.find("jsonrpc");
  if (version == j.end() || !version->is_string() ||
      version->get<std::string>() != kVersion) {
    return envelope_error(
        rpc_error::invalid_request("'jsonrpc' must be exactly \"2.0\""),
        req.id);
  }

  auto method = j.find("method");
  if (method == j.end() || !method->is_string()) {
    return envelope_error(
        rpc_error::invalid_request("'method' must be a string"), req.id);
  }
  req.method = method->get<std::string>();

  if (auto it = j.find("params"); it != j.end() && !it->is_null()) {
    if (!it->is_object()) {
      return envelope_error(
          rpc_error::invalid_params("'params' must be an object"), req.id);
    }
    req.params = *it;
  }
  return req;
}

auto make_result(const nlohmann::json& id, nlohmann::json result)
    -> nlohmann::json {
  return {{"jsonrpc", kVersion}, {"result", std::move(result)}, {"id", id}};
}

auto make_error(const nlohmann::json& id, const RpcError& error)
    -> nlohmann::json {
  return {{"jsonrpc", kVersion}, {"error", error.to_json()}, {"id", id}};
}

auto dump_response(const nlohmann::json& response) -> std::string {
  return response.dump(-1, ' ', false,
                       nlohmann::json::error_handler_t::replace);
}

}  // namespace sqlrpc
