#pragma once

#include "sqlrpc/util/util.hpp"

#include <concepts>
#include <format>
#include <functional>
#include <ostream>
#include <string>
#include <string_view>

namespace sqlrpc {

struct TaskTag {};
struct NodeTag {};

// Phantom-typed string id; a TaskId never compares equal to a NodeId.
template <typename Tag>
class TypedId {
public:
  explicit TypedId(std::string value) : value_(std::move(value)) {}

  TypedId() = default;

  [[nodiscard]] auto value() const -> std::string_view { return value_; }
  [[nodiscard]] auto str() const -> const std::string& { return value_; }

  [[nodiscard]] explicit operator std::string() const { return value_; }

  [[nodiscard]] auto empty() const -> bool { return value_.empty(); }

  [[nodiscard]] friend auto operator<=>(const TypedId& lhs, const TypedId& rhs) = default;
  [[nodiscard]] friend auto operator==(const TypedId& lhs, const TypedId& rhs) -> bool = default;

private:
  std::string value_;
};

using TaskId = TypedId<TaskTag>;
using NodeId = TypedId<NodeTag>;

inline auto generate_task_id() -> TaskId {
  return TaskId{generate_uuid()};
}

template <typename Tag>
inline auto operator<<(std::ostream& os, const TypedId<Tag>& id) -> std::ostream& {
  return os << id.value();
}

}  // namespace sqlrpc

template <typename Tag>
struct std::hash<sqlrpc::TypedId<Tag>> {
  auto operator()(const sqlrpc::TypedId<Tag>& id) const noexcept
      -> std::size_t {
    return std::hash<std::string_view>{}(id.value());
  }
};

template <typename Tag>
struct std::formatter<sqlrpc::TypedId<Tag>> : std::formatter<std::string_view> {
  auto format(const sqlrpc::TypedId<Tag>& id, auto& ctx) const {
    return std::formatter<std::string_view>::format(id.value(), ctx);
  }
};
