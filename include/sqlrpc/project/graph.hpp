#pragma once

#include "sqlrpc/core/error.hpp"
#include "sqlrpc/util/id.hpp"

#include <cstdint>
#include <span>
#include <unordered_map>
#include <vector>

namespace sqlrpc {

using NodeIndex = std::uint32_t;
inline constexpr NodeIndex INVALID_NODE = UINT32_MAX;

// Dependency graph over project nodes. An edge from -> to means `to` depends
// on `from`.
class Graph {
public:
  auto add_node(const NodeId& id) -> NodeIndex;
  [[nodiscard]] auto add_edge(const NodeId& from, const NodeId& to)
      -> Result<void>;
  [[nodiscard]] auto add_edge(NodeIndex from, NodeIndex to) -> Result<void>;

  [[nodiscard]] auto has_node(const NodeId& id) const -> bool;

  // Kahn's algorithm; ties are broken by insertion order so the result is
  // stable across reloads of the same project.
  [[nodiscard]] auto topological_order() const -> std::vector<NodeIndex>;

  [[nodiscard]] auto deps(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  [[nodiscard]] auto dependents(NodeIndex idx) const noexcept
      -> std::span<const NodeIndex>;
  // Every node reachable through dependents, excluding `idx` itself.
  [[nodiscard]] auto descendants(NodeIndex idx) const -> std::vector<NodeIndex>;

  [[nodiscard]] auto index_of(const NodeId& id) const -> NodeIndex;
  [[nodiscard]] auto key(NodeIndex idx) const -> const NodeId&;

  [[nodiscard]] auto size() const noexcept -> std::size_t {
    return nodes_.size();
  }
  [[nodiscard]] auto empty() const noexcept -> bool {
    return nodes_.empty();
  }

private:
  [[nodiscard]] auto would_create_cycle(NodeIndex from, NodeIndex to) const
      -> bool;

  struct Node {
    std::vector<NodeIndex> deps;
    std::vector<NodeIndex> dependents;
  };

  std::vector<Node> nodes_;
  std::vector<NodeId> keys_;
  std::unordered_map<NodeId, NodeIndex> key_to_idx_;
};

}  // namespace sqlrpc
