#pragma once

#include <nlohmann/json.hpp>

#include <expected>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// A small Jinja dialect: {{ expr }}, {% if/elif/else %}, {% for %},
// {% set %}, {% macro %}, {% raw %}, {# comments #} and `-` whitespace
// control. Expressions evaluate to JSON values.
namespace sqlrpc::tmpl {

using Value = nlohmann::json;

struct TemplateError {
  std::string message;
};

template <typename T>
using TResult = std::expected<T, TemplateError>;

[[nodiscard]] inline auto template_error(std::string message)
    -> std::unexpected<TemplateError> {
  return std::unexpected{TemplateError{std::move(message)}};
}

struct CallArgs {
  std::vector<Value> positional;
  std::vector<std::pair<std::string, Value>> keyword;

  [[nodiscard]] auto kwarg(std::string_view name) const -> const Value*;
  // Positional argument `index`, falling back to keyword `name`.
  [[nodiscard]] auto arg(std::size_t index, std::string_view name) const
      -> const Value*;
};

using Function = std::function<TResult<Value>(const CallArgs&)>;

struct Program;
class Macro;
class Template;

[[nodiscard]] auto macro_name(const Macro& macro) -> const std::string&;

class Environment {
public:
  // Later definitions of the same name replace earlier ones.
  auto define(std::shared_ptr<const Macro> macro) -> void;
  auto define_all(const Template& tmpl) -> void;
  auto set_function(std::string name, Function fn) -> void;
  auto set_variable(std::string name, Value value) -> void;

  [[nodiscard]] auto find_macro(std::string_view name) const -> const Macro*;
  [[nodiscard]] auto find_function(std::string_view name) const
      -> const Function*;
  [[nodiscard]] auto find_variable(std::string_view name) const
      -> const Value*;

private:
  std::unordered_map<std::string, std::shared_ptr<const Macro>> macros_;
  std::unordered_map<std::string, Function> functions_;
  std::unordered_map<std::string, Value> variables_;
};

class Template {
public:
  [[nodiscard]] static auto parse(std::string_view source) -> TResult<Template>;

  [[nodiscard]] auto render(const Environment& env) const
      -> TResult<std::string>;

  // Top-level {% macro %} blocks, in source order.
  [[nodiscard]] auto macros() const noexcept
      -> const std::vector<std::shared_ptr<const Macro>>& {
    return macros_;
  }

  // The source with every top-level macro definition cut out.
  [[nodiscard]] auto source_without_macros() const -> const std::string&;

private:
  std::shared_ptr<const Program> program_;
  std::vector<std::shared_ptr<const Macro>> macros_;
};

// How a value prints inside {{ }}: strings verbatim, booleans and null the
// Python way.
[[nodiscard]] auto to_output(const Value& value) -> std::string;
[[nodiscard]] auto is_truthy(const Value& value) noexcept -> bool;

}  // namespace sqlrpc::tmpl
