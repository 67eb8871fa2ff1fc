#pragma once

#include "sqlrpc/compiler/template.hpp"
#include "sqlrpc/core/error.hpp"
#include "sqlrpc/project/graph.hpp"
#include "sqlrpc/util/id.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sqlrpc {

enum class ResourceType : std::uint8_t { Model, Seed, Test, Source };

enum class Materialization : std::uint8_t { View, Table, Ephemeral };

enum class SchemaTestKind : std::uint8_t { Unique, NotNull, AcceptedValues };

inline constexpr std::array kResourceTypeNames = {"model", "seed", "test",
                                                  "source"};
inline constexpr std::array kMaterializationNames = {"view", "table",
                                                     "ephemeral"};
inline constexpr std::array kSchemaTestNames = {"unique", "not_null",
                                                "accepted_values"};

[[nodiscard]] auto resource_type_name(ResourceType type) noexcept
    -> std::string_view;
[[nodiscard]] auto materialization_name(Materialization m) noexcept
    -> std::string_view;
[[nodiscard]] auto parse_materialization(std::string_view name) noexcept
    -> std::optional<Materialization>;
[[nodiscard]] auto parse_schema_test(std::string_view name) noexcept
    -> std::optional<SchemaTestKind>;

// Double-quoted, with embedded quotes doubled.
[[nodiscard]] auto quote_identifier(std::string_view name) -> std::string;

struct SchemaTest {
  SchemaTestKind kind{SchemaTestKind::NotNull};
  std::string model;
  std::string column;
  std::vector<std::string> values;
};

struct Node {
  NodeId unique_id;
  std::string name;
  ResourceType resource_type{ResourceType::Model};
  std::string original_file_path;
  std::string raw_sql;
  // For ephemeral models this is the bare body; CTEs are injected by whoever
  // refs them.
  std::string compiled_sql;
  Materialization materialized{Materialization::View};
  std::vector<NodeId> depends_on;
  std::vector<std::string> ephemeral_refs;
  std::string schema;
  std::string alias;
  std::string source_name;
  std::optional<SchemaTest> schema_test;

  [[nodiscard]] auto relation() const -> std::string;
  [[nodiscard]] auto is_ephemeral() const noexcept -> bool {
    return resource_type == ResourceType::Model &&
           materialized == Materialization::Ephemeral;
  }
  [[nodiscard]] auto to_json() const -> nlohmann::json;
};

// Immutable once published. The loader fills it in; everything after that
// holds it through shared_ptr<const CompiledProject>.
class CompiledProject {
public:
  CompiledProject(std::string name, std::string root, std::string schema);

  [[nodiscard]] auto add_node(Node node) -> Result<NodeIndex>;
  [[nodiscard]] auto add_dependency(NodeIndex upstream, NodeIndex downstream)
      -> Result<void>;
  auto add_macros(const tmpl::Template& source) -> void;
  auto set_vars(tmpl::Value vars) -> void;
  auto finalize() -> void;

  [[nodiscard]] auto name() const noexcept -> const std::string& {
    return name_;
  }
  [[nodiscard]] auto root() const noexcept -> const std::string& {
    return root_;
  }
  [[nodiscard]] auto schema() const noexcept -> const std::string& {
    return schema_;
  }
  [[nodiscard]] auto vars() const noexcept -> const tmpl::Value& {
    return vars_;
  }
  [[nodiscard]] auto macros() const noexcept
      -> std::span<const std::shared_ptr<const tmpl::Macro>> {
    return macros_;
  }
  [[nodiscard]] auto graph() const noexcept -> const Graph& {
    return graph_;
  }

  [[nodiscard]] auto nodes() const noexcept -> std::span<const Node> {
    return nodes_;
  }
  [[nodiscard]] auto node(NodeIndex idx) const -> const Node& {
    return nodes_[idx];
  }
  [[nodiscard]] auto mutable_node(NodeIndex idx) -> Node& {
    return nodes_[idx];
  }

  [[nodiscard]] auto find(const NodeId& id) const -> const Node*;
  // Models and seeds are addressable through ref().
  [[nodiscard]] auto find_ref(std::string_view name) const -> const Node*;
  [[nodiscard]] auto find_source(std::string_view source,
                                 std::string_view table) const -> const Node*;

  // Topological order, computed by finalize().
  [[nodiscard]] auto order() const noexcept -> std::span<const NodeIndex> {
    return order_;
  }
  [[nodiscard]] auto nodes_of(ResourceType type) const
      -> std::vector<const Node*>;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }

private:
  std::string name_;
  std::string root_;
  std::string schema_;
  tmpl::Value vars_ = tmpl::Value::object();
  std::vector<std::shared_ptr<const tmpl::Macro>> macros_;

  std::vector<Node> nodes_;
  Graph graph_;
  std::vector<NodeIndex> order_;
  std::unordered_map<std::string, NodeIndex, StringHash, StringEqual> by_ref_;
};

using ProjectSnapshot = std::shared_ptr<const CompiledProject>;

}  // namespace sqlrpc
