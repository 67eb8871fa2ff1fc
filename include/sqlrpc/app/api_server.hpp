#pragma once

#include <cstdint>
#include <memory>
#include <string>

namespace sqlrpc {

class Dispatcher;

// HTTP front end: POST /jsonrpc bodies go to the dispatcher.
class ApiServer {
public:
  ApiServer(Dispatcher& dispatcher, std::uint16_t port = 8580,
            const std::string& host = "127.0.0.1", unsigned threads = 16);
  ~ApiServer();

  ApiServer(const ApiServer&) = delete;
  auto operator=(const ApiServer&) -> ApiServer& = delete;

  auto start() -> void;
  auto stop() -> void;
  [[nodiscard]] auto is_running() const noexcept -> bool;

private:
  struct Impl;
  std::unique_ptr<Impl> impl_;
};

}  // namespace sqlrpc
