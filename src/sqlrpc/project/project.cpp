#include "sqlrpc/project/project.hpp"

#include <algorithm>
#include <utility>

namespace sqlrpc {

auto resource_type_name(ResourceType type) noexcept -> std::string_view {
  auto idx = std::to_underlying(type);
  return idx < kResourceTypeNames.size() ? kResourceTypeNames[idx] : "unknown";
}

auto materialization_name(Materialization m) noexcept -> std::string_view {
  auto idx = std::to_underlying(m);
  return idx < kMaterializationNames.size() ? kMaterializationNames[idx]
                                            : "view";
}

auto parse_materialization(std::string_view name) noexcept
    -> std::optional<Materialization> {
  auto it = std::ranges::find(kMaterializationNames, name);
  if (it == kMaterializationNames.end()) {
    return std::nullopt;
  }
  return static_cast<Materialization>(
      std::ranges::distance(kMaterializationNames.begin(), it));
}

auto parse_schema_test(std::string_view name) noexcept
    -> std::optional<SchemaTestKind> {
  auto it = std::ranges::find(kSchemaTestNames, name);
  if (it == kSchemaTestNames.end()) {
    return std::nullopt;
  }
  return static_cast<SchemaTestKind>(
      std::ranges::distance(kSchemaTestNames.begin(), it));
}

auto quote_identifier(std::string_view name) -> std::string {
  std::string out;
  out.reserve(name.size() + 2);
  out.push_back('"');
  for (char c : name) {
    if (c == '"') {
      out.push_back('"');
    }
    out.push_back(c);
  }
  out.push_back('"');
  return out;
}

auto Node::relation() const -> std::string {
  return quote_identifier(schema) + "." +
         quote_identifier(alias.empty() ? name : alias);
}

auto Node::to_json() const -> nlohmann::json {
  nlohmann::json deps = nlohmann::json::array();
  for (const auto& dep : depends_on) {
    deps.push_back(dep.str());
  }
  nlohmann::json j = {
      {"unique_id", unique_id.str()},
      {"name", name},
      {"resource_type", resource_type_name(resource_type)},
      {"original_file_path", original_file_path},
      {"raw_sql", raw_sql},
      {"compiled_sql", compiled_sql},
      {"config", {{"materialized", materialization_name(materialized)}}},
      {"depends_on", {{"nodes", std::move(deps)}}},
      {"schema", schema},
      {"alias", alias.empty() ? name : alias},
  };
  if (resource_type == ResourceType::Source) {
    j["source_name"] = source_name;
  }
  return j;
}

CompiledProject::CompiledProject(std::string name, std::string root,
                                 std::string schema)
    : name_(std::move(name)), root_(std::move(root)),
      schema_(std::move(schema)) {
}

auto CompiledProject::add_node(Node node) -> Result<NodeIndex> {
  if (graph_.has_node(node.unique_id)) {
    return fail(Error::AlreadyExists);
  }
  bool addressable = node.resource_type == ResourceType::Model ||
                     node.resource_type == ResourceType::Seed;
  if (addressable && by_ref_.contains(node.name)) {
    return fail(Error::AlreadyExists);
  }

  auto idx = graph_.add_node(node.unique_id);
  if (addressable) {
    by_ref_.emplace(node.name, idx);
  }
  nodes_.push_back(std::move(node));
  return idx;
}

auto CompiledProject::add_dependency(NodeIndex upstream, NodeIndex downstream)
    -> Result<void> {
  return graph_.add_edge(upstream, downstream);
}

auto CompiledProject::add_macros(const tmpl::Template& source) -> void {
  for (const auto& macro : source.macros()) {
    macros_.push_back(macro);
  }
}

auto CompiledProject::set_vars(tmpl::Value vars) -> void {
  vars_ = std::move(vars);
}

auto CompiledProject::finalize() -> void {
  order_ = graph_.topological_order();
}

auto CompiledProject::find(const NodeId& id) const -> const Node* {
  auto idx = graph_.index_of(id);
  return idx == INVALID_NODE ? nullptr : &nodes_[idx];
}

auto CompiledProject::find_ref(std::string_view name) const -> const Node* {
  auto it = by_ref_.find(name);
  return it == by_ref_.end() ? nullptr : &nodes_[it->second];
}

auto CompiledProject::find_source(std::string_view source,
                                  std::string_view table) const
    -> const Node* {
  auto it = std::ranges::find_if(nodes_, [&](const Node& n) {
    return n.resource_type == ResourceType::Source &&
           n.source_name == source && n.name == table;
  });
  return it == nodes_.end() ? nullptr : &*it;
}

auto CompiledProject::nodes_of(ResourceType type) const
    -> std::vector<const Node*> {
  std::vector<const Node*> out;
  for (auto idx : order_) {
    if (nodes_[idx].resource_type == type) {
      out.push_back(&nodes_[idx]);
    }
  }
  return out;
}

}  // namespace sqlrpc
