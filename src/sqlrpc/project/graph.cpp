#include "sqlrpc/project/graph.hpp"

#include <algorithm>
#include <queue>

namespace sqlrpc {

auto Graph::add_node(const NodeId& id) -> NodeIndex {
  if (auto it = key_to_idx_.find(id); it != key_to_idx_.end()) {
    return it->second;
  }

  auto idx = static_cast<NodeIndex>(nodes_.size());
  nodes_.emplace_back();
  keys_.push_back(id);
  key_to_idx_.emplace(id, idx);
  return idx;
}

auto Graph::add_edge(const NodeId& from, const NodeId& to) -> Result<void> {
  auto from_idx = index_of(from);
  auto to_idx = index_of(to);
  if (from_idx == INVALID_NODE || to_idx == INVALID_NODE) [[unlikely]] {
    return fail(Error::NotFound);
  }
  return add_edge(from_idx, to_idx);
}

auto Graph::add_edge(NodeIndex from, NodeIndex to) -> Result<void> {
  if (from >= nodes_.size() || to >= nodes_.size()) [[unlikely]] {
    return fail(Error::InvalidArgument);
  }
  if (from == to || would_create_cycle(from, to)) {
    return fail(Error::CycleDetected);
  }

  auto& deps = nodes_[to].deps;
  if (std::ranges::find(deps, from) != deps.end()) {
    return ok();
  }
  deps.push_back(from);
  nodes_[from].dependents.push_back(to);
  return ok();
}

// Adding from -> to closes a cycle iff `to` is already an ancestor of `from`.
auto Graph::would_create_cycle(NodeIndex from, NodeIndex to) const -> bool {
  std::vector<bool> visited(nodes_.size(), false);
  std::vector<NodeIndex> stack{from};

  while (!stack.empty()) {
    auto current = stack.back();
    stack.pop_back();

    if (current == to) {
      return true;
    }
    if (visited[current]) {
      continue;
    }
    visited[current] = true;

    for (auto dep : nodes_[current].deps) {
      if (!visited[dep]) {
        stack.push_back(dep);
      }
    }
  }
  return false;
}

auto Graph::has_node(const NodeId& id) const -> bool {
  return key_to_idx_.contains(id);
}

auto Graph::topological_order() const -> std::vector<NodeIndex> {
  std::vector<std::size_t> in_degree;
  in_degree.reserve(nodes_.size());
  for (const auto& n : nodes_) {
    in_degree.push_back(n.deps.size());
  }

  std::priority_queue<NodeIndex, std::vector<NodeIndex>, std::greater<>> ready;
  for (NodeIndex i = 0; i < nodes_.size(); ++i) {
    if (in_degree[i] == 0) {
      ready.push(i);
    }
  }

  std::vector<NodeIndex> order;
  order.reserve(nodes_.size());
  while (!ready.empty()) {
    auto current = ready.top();
    ready.pop();
    order.push_back(current);

    for (auto dependent : nodes_[current].dependents) {
      if (--in_degree[dependent] == 0) {
        ready.push(dependent);
      }
    }
  }
  return order;
}

auto Graph::deps(NodeIndex idx) const noexcept -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].deps;
}

auto Graph::dependents(NodeIndex idx) const noexcept
    -> std::span<const NodeIndex> {
  if (idx >= nodes_.size()) {
    return {};
  }
  return nodes_[idx].dependents;
}

auto Graph::descendants(NodeIndex idx) const -> std::vector<NodeIndex> {
  std::vector<NodeIndex> result;
  if (idx >= nodes_.size()) {
    return result;
  }

  std::vector<bool> seen(nodes_.size(), false);
  std::vector<NodeIndex> stack(nodes_[idx].dependents.begin(),
                               nodes_[idx].dependents.end());
  while (!stack.empty()) {
    auto current = stack.back();
    stack.pop_back();
    if (seen[current]) {
      continue;
    }
    seen[current] = true;
    result.push_back(current);
    for (auto next : nodes_[current].dependents) {
      stack.push_back(next);
    }
  }
  std::ranges::sort(result);
  return result;
}

auto Graph::index_of(const NodeId& id) const -> NodeIndex {
  auto it = key_to_idx_.find(id);
  return it != key_to_idx_.end() ? it->second : INVALID_NODE;
}

auto Graph::key(NodeIndex idx) const -> const NodeId& {
  static const NodeId empty;
  if (idx >= keys_.size()) {
    return empty;
  }
  return keys_[idx];
}

}  // namespace sqlrpc
