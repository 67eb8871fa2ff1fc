#include "sqlrpc/config/config.hpp"

#include "sqlrpc/config/yaml_utils.hpp"
#include "sqlrpc/util/log.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>

namespace YAML {

template <>
struct convert<sqlrpc::ServerSection> {
  static bool decode(const Node& node, sqlrpc::ServerSection& s) {
    if (!node.IsMap()) {
      return false;
    }
    s.host = sqlrpc::yaml_get_or<std::string>(node, "host", "127.0.0.1");
    s.port = sqlrpc::yaml_get_or<std::uint16_t>(node, "port", 8580);
    s.threads = sqlrpc::yaml_get_or(node, "threads", 16u);
    s.log_level = sqlrpc::yaml_get_or<std::string>(node, "log_level", "info");
    s.log_file = sqlrpc::yaml_get_or<std::string>(node, "log_file", "");
    return true;
  }
};

template <>
struct convert<sqlrpc::ProjectSection> {
  static bool decode(const Node& node, sqlrpc::ProjectSection& p) {
    if (!node.IsMap()) {
      return false;
    }
    p.dir = sqlrpc::yaml_get_or<std::string>(node, "dir", ".");
    p.schema = sqlrpc::yaml_get_or<std::string>(node, "schema", "main");
    return true;
  }
};

template <>
struct convert<sqlrpc::DatabaseSection> {
  static bool decode(const Node& node, sqlrpc::DatabaseSection& d) {
    if (!node.IsMap()) {
      return false;
    }
    d.path = sqlrpc::yaml_get_or<std::string>(node, "path", "sqlrpc.db");
    return true;
  }
};

template <>
struct convert<sqlrpc::TaskSection> {
  static bool decode(const Node& node, sqlrpc::TaskSection& t) {
    if (!node.IsMap()) {
      return false;
    }
    t.watchdog_interval = std::chrono::milliseconds(
        sqlrpc::yaml_get_or(node, "watchdog_interval_ms", 100));
    t.kill_grace = std::chrono::milliseconds(
        sqlrpc::yaml_get_or(node, "kill_grace_ms", 2000));
    t.log_history = sqlrpc::yaml_get_or<std::size_t>(node, "log_history", 200);
    return true;
  }
};

template <>
struct convert<sqlrpc::ServerConfig> {
  static bool decode(const Node& node, sqlrpc::ServerConfig& c) {
    if (!node.IsMap()) {
      return false;
    }
    if (auto server = node["server"]) {
      c.server = server.as<sqlrpc::ServerSection>();
    }
    if (auto project = node["project"]) {
      c.project = project.as<sqlrpc::ProjectSection>();
    }
    if (auto database = node["database"]) {
      c.database = database.as<sqlrpc::DatabaseSection>();
    }
    if (auto tasks = node["tasks"]) {
      c.tasks = tasks.as<sqlrpc::TaskSection>();
    }
    if (auto vars = node["vars"]; vars && vars.IsMap()) {
      for (const auto& kv : vars) {
        c.vars[kv.first.as<std::string>()] = kv.second.as<std::string>();
      }
    }
    return true;
  }
};

}  // namespace YAML

namespace sqlrpc {

namespace {

auto validate(const ServerConfig& config) -> Result<void> {
  if (config.server.port == 0) {
    log::error("Invalid config: server.port must be non-zero");
    return fail(Error::InvalidArgument);
  }
  if (config.server.threads == 0 ||
      config.server.threads > std::numeric_limits<std::uint16_t>::max()) {
    log::error("Invalid config: server.threads must be between 1 and {}",
               std::numeric_limits<std::uint16_t>::max());
    return fail(Error::InvalidArgument);
  }
  if (config.tasks.watchdog_interval <= std::chrono::milliseconds::zero()) {
    log::error("Invalid config: tasks.watchdog_interval_ms must be positive");
    return fail(Error::InvalidArgument);
  }
  if (config.tasks.kill_grace < std::chrono::milliseconds::zero()) {
    log::error("Invalid config: tasks.kill_grace_ms must not be negative");
    return fail(Error::InvalidArgument);
  }
  return ok();
}

}  // namespace

auto ConfigLoader::load_from_file(std::string_view path)
    -> Result<ServerConfig> {
  std::string path_str{path};
  std::ifstream file(path_str);
  if (!file.is_open()) {
    log::error("Failed to open config file: {}", path);
    return fail(Error::FileNotFound);
  }

  std::stringstream buffer;
  buffer << file.rdbuf();
  return load_from_string(buffer.str());
}

auto ConfigLoader::load_from_string(std::string_view yaml_str)
    -> Result<ServerConfig> {
  try {
    YAML::Node root = YAML::Load(std::string(yaml_str));
    if (!root.IsDefined() || root.IsNull()) {
      // An empty file means all defaults.
      return ok(ServerConfig{});
    }
    if (!root.IsMap()) {
      log::error("Failed to parse config: top level must be a mapping");
      return fail(Error::ParseError);
    }
    auto config = root.as<ServerConfig>();
    if (auto r = validate(config); !r) {
      return std::unexpected(r.error());
    }
    return ok(std::move(config));
  } catch (const YAML::Exception& e) {
    log::error("YAML parse error: {}", e.what());
    return fail(Error::ParseError);
  }
}

}  // namespace sqlrpc
