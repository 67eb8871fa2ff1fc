#pragma once

#include "sqlrpc/project/project.hpp"

#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sqlrpc {

struct CompileError {
  std::string message;
};

enum class CompileMode : std::uint8_t {
  // Dependency discovery while loading: ref() and source() are recorded but
  // not resolved.
  Parse,
  Compile,
};

struct CompileRequest {
  std::string_view name;
  std::string_view sql;
  // Extra macro definitions; they override project macros of the same name.
  std::string_view macros;
  bool inject_ctes = true;
};

struct CompileOutput {
  std::string raw_sql;
  std::string compiled_sql;
  std::vector<NodeId> depends_on;
  std::vector<std::string> refs;
  std::vector<std::pair<std::string, std::string>> sources;
  std::vector<std::string> ephemeral_refs;
  std::optional<Materialization> materialized;
};

class Compiler {
public:
  explicit Compiler(const CompiledProject& project,
                    CompileMode mode = CompileMode::Compile);

  [[nodiscard]] auto compile(const CompileRequest& request) const
      -> std::expected<CompileOutput, CompileError>;

  // `with __dbt__CTE__a as (...), ... ` for every ephemeral model reachable
  // through `names`, dependencies first.
  [[nodiscard]] auto cte_prefix(const std::vector<std::string>& names) const
      -> std::string;

private:
  const CompiledProject& project_;
  CompileMode mode_;
};

[[nodiscard]] auto ephemeral_cte_name(std::string_view model) -> std::string;

}  // namespace sqlrpc
