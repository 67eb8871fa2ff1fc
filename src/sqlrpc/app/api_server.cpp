#include "sqlrpc/app/api_server.hpp"

#include "sqlrpc/rpc/dispatcher.hpp"
#include "sqlrpc/rpc/jsonrpc.hpp"
#include "sqlrpc/util/log.hpp"

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <thread>
#include <unordered_map>

#include <crow.h>

namespace sqlrpc {

namespace {

// Responses whose task is still running. A reply that arrives after the
// server closed them (or after the server is gone) is dropped.
class PendingResponses {
public:
  auto add(crow::response& res) -> std::uint64_t {
    std::lock_guard lock(mu_);
    auto ticket = next_++;
    open_.emplace(ticket, &res);
    return ticket;
  }

  auto complete(std::uint64_t ticket, const std::string& body) -> void {
    std::lock_guard lock(mu_);
    auto it = open_.find(ticket);
    if (it == open_.end()) {
      return;
    }
    send(*it->second, body);
    open_.erase(it);
  }

  auto close_all(const std::string& body) -> std::size_t {
    std::lock_guard lock(mu_);
    auto count = open_.size();
    for (auto& [ticket, res] : open_) {
      send(*res, body);
    }
    open_.clear();
    return count;
  }

private:
  static auto send(crow::response& res, const std::string& body) -> void {
    res.code = 200;
    res.set_header("Content-Type", "application/json");
    res.body = body;
    res.end();
  }

  std::mutex mu_;
  std::uint64_t next_{0};
  std::unordered_map<std::uint64_t, crow::response*> open_;
};

}  // namespace

struct ApiServer::Impl {
  Dispatcher& dispatcher;
  std::uint16_t port;
  std::string host;
  unsigned threads;

  std::unique_ptr<crow::SimpleApp> crow_app;
  std::thread server_thread;
  std::atomic<bool> running{false};
  std::shared_ptr<PendingResponses> pending =
      std::make_shared<PendingResponses>();

  Impl(Dispatcher& d, std::uint16_t p, const std::string& h, unsigned t)
      : dispatcher(d), port(p), host(h), threads(t) {
  }

  auto setup_routes() -> void;
};

ApiServer::ApiServer(Dispatcher& dispatcher, std::uint16_t port,
                     const std::string& host, unsigned threads)
    : impl_(std::make_unique<Impl>(dispatcher, port, host, threads)) {
}

ApiServer::~ApiServer() {
  stop();
}

auto ApiServer::start() -> void {
  if (impl_->running.exchange(true)) {
    return;
  }

  impl_->crow_app = std::make_unique<crow::SimpleApp>();
  impl_->crow_app->loglevel(crow::LogLevel::Warning);
  impl_->setup_routes();

  // Signals belong to main().
  impl_->crow_app->signal_clear();

  impl_->server_thread = std::thread([this]() {
    log::info("JSON-RPC server listening on {}:{}", impl_->host, impl_->port);
    impl_->crow_app->bindaddr(impl_->host)
        .port(impl_->port)
        .concurrency(static_cast<std::uint16_t>(impl_->threads))
        .run();
  });
}

auto ApiServer::stop() -> void {
  if (!impl_->running.exchange(false)) {
    return;
  }

  log::info("Stopping JSON-RPC server...");

  auto shutdown = dump_response(make_error(
      nullptr, rpc_error::internal_error("Server is shutting down")));
  if (auto closed = impl_->pending->close_all(shutdown); closed > 0) {
    log::warn("Closed {} waiting request(s) on shutdown", closed);
  }

  if (impl_->crow_app) {
    impl_->crow_app->stop();
  }

  if (impl_->server_thread.joinable()) {
    impl_->server_thread.join();
  }

  impl_->crow_app.reset();
  log::info("JSON-RPC server stopped");
}

auto ApiServer::is_running() const noexcept -> bool {
  return impl_->running.load();
}

// Handlers never wait for a task: a synchronous call leaves its response
// open and the task's completion ends it, so a full pool of long calls
// cannot starve status, ps or kill.
auto ApiServer::Impl::setup_routes() -> void {
  CROW_ROUTE((*crow_app), "/jsonrpc")
      .methods(crow::HTTPMethod::POST)(
          [this](const crow::request& req, crow::response& res) {
            auto ticket = pending->add(res);
            std::weak_ptr<PendingResponses> weak = pending;
            dispatcher.handle_async(
                req.body, [weak, ticket](nlohmann::json response) {
                  if (auto open = weak.lock()) {
                    open->complete(ticket, dump_response(response));
                  }
                });
          });
}

}  // namespace sqlrpc
