#pragma once

#include "sqlrpc/core/error.hpp"

#include <chrono>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace sqlrpc {

struct ServerSection {
  std::string host = "127.0.0.1";
  std::uint16_t port = 8580;
  unsigned threads = 16;
  std::string log_level = "info";
  std::string log_file;
};

struct ProjectSection {
  std::string dir = ".";
  std::string schema = "main";
};

struct DatabaseSection {
  std::string path = "sqlrpc.db";
};

struct TaskSection {
  std::chrono::milliseconds watchdog_interval{100};
  std::chrono::milliseconds kill_grace{2000};
  std::size_t log_history = 200;
};

struct ServerConfig {
  ServerSection server;
  ProjectSection project;
  DatabaseSection database;
  TaskSection tasks;
  std::map<std::string, std::string, std::less<>> vars;
};

class ConfigLoader {
public:
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<ServerConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view yaml_str)
      -> Result<ServerConfig>;
};

}  // namespace sqlrpc
