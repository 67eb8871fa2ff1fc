#pragma once

#include "sqlrpc/project/project.hpp"

#include <expected>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace sqlrpc {

struct ProjectError {
  std::string message;
};

struct ProjectOptions {
  std::filesystem::path root;
  std::string schema = "main";
  // Overrides project.yml vars.
  tmpl::Value vars = tmpl::Value::object();
};

// Reads an on-disk project and builds its compiled graph:
//
//   project.yml       name, *-paths, vars, models.materialized
//   models/*.sql      models
//   models/*.yml      sources and column tests
//   seeds/*.csv       seeds
//   tests/*.sql       data tests
//   macros/*.sql      macro definitions
class ProjectLoader {
public:
  explicit ProjectLoader(ProjectOptions options);

  [[nodiscard]] auto load() const -> std::expected<ProjectSnapshot, ProjectError>;

private:
  ProjectOptions options_;
};

struct SeedData {
  std::vector<std::string> columns;
  // Empty cells are nullopt.
  std::vector<std::vector<std::optional<std::string>>> rows;
};

// RFC 4180 CSV with a header row.
[[nodiscard]] auto parse_seed_csv(std::string_view text)
    -> std::expected<SeedData, std::string>;

}  // namespace sqlrpc
