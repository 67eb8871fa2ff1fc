#include "sqlrpc/compiler/compiler.hpp"

#include <algorithm>
#include <format>
#include <functional>
#include <unordered_set>

namespace sqlrpc {

namespace {

auto push_unique(std::vector<std::string>& list, const std::string& value)
    -> void {
  if (std::ranges::find(list, value) == list.end()) {
    list.push_back(value);
  }
}

auto push_unique(std::vector<NodeId>& list, const NodeId& value) -> void {
  if (std::ranges::find(list, value) == list.end()) {
    list.push_back(value);
  }
}

auto string_arg(const tmpl::Value* value, std::string_view fn)
    -> tmpl::TResult<std::string> {
  if (value == nullptr || !value->is_string()) {
    return tmpl::template_error(
        std::format("{}() arguments must be strings", fn));
  }
  return value->get<std::string>();
}

class Functions {
public:
  Functions(const CompiledProject& project, CompileMode mode,
            CompileOutput& out)
      : project_(project), mode_(mode), out_(out) {
  }

  auto install(tmpl::Environment& env) -> void {
    env.set_function("ref", [this](const tmpl::CallArgs& args) {
      return ref(args);
    });
    env.set_function("source", [this](const tmpl::CallArgs& args) {
      return source(args);
    });
    env.set_function("var", [this](const tmpl::CallArgs& args) {
      return var(args);
    });
    env.set_function("config", [this](const tmpl::CallArgs& args) {
      return config(args);
    });
    env.set_variable("target", tmpl::Value{{"name", "default"},
                                           {"schema", project_.schema()},
                                           {"type", "sqlite"}});
    env.set_variable("project_name", project_.name());
  }

private:
  auto ref(const tmpl::CallArgs& args) -> tmpl::TResult<tmpl::Value> {
    if (args.positional.empty() || args.positional.size() > 2) {
      return tmpl::template_error("ref() takes at most two arguments (" +
                                  std::to_string(args.positional.size()) +
                                  " given)");
    }
    auto name = string_arg(&args.positional.back(), "ref");
    if (!name) {
      return std::unexpected(name.error());
    }

    if (mode_ == CompileMode::Parse) {
      push_unique(out_.refs, *name);
      return tmpl::Value(quote_identifier(project_.schema()) + "." +
                         quote_identifier(*name));
    }

    const auto* node = project_.find_ref(*name);
    if (node == nullptr) {
      return tmpl::template_error(std::format(
          "depends on a node named '{}' which was not found", *name));
    }
    push_unique(out_.depends_on, node->unique_id);
    if (node->is_ephemeral()) {
      push_unique(out_.ephemeral_refs, node->name);
      return tmpl::Value(ephemeral_cte_name(node->name));
    }
    return tmpl::Value(node->relation());
  }

  auto source(const tmpl::CallArgs& args) -> tmpl::TResult<tmpl::Value> {
    auto source_name = string_arg(args.arg(0, "source_name"), "source");
    if (!source_name) {
      return std::unexpected(source_name.error());
    }
    auto table_name = string_arg(args.arg(1, "table_name"), "source");
    if (!table_name) {
      return std::unexpected(table_name.error());
    }

    if (mode_ == CompileMode::Parse) {
      auto entry = std::pair{*source_name, *table_name};
      if (std::ranges::find(out_.sources, entry) == out_.sources.end()) {
        out_.sources.push_back(std::move(entry));
      }
      return tmpl::Value(quote_identifier(project_.schema()) + "." +
                         quote_identifier(*table_name));
    }

    const auto* node = project_.find_source(*source_name, *table_name);
    if (node == nullptr) {
      return tmpl::template_error(
          std::format("depends on a source named '{}.{}' which was not found",
                      *source_name, *table_name));
    }
    push_unique(out_.depends_on, node->unique_id);
    return tmpl::Value(node->relation());
  }

  auto var(const tmpl::CallArgs& args) -> tmpl::TResult<tmpl::Value> {
    auto name = string_arg(args.arg(0, "name"), "var");
    if (!name) {
      return std::unexpected(name.error());
    }
    const auto& vars = project_.vars();
    if (vars.is_object()) {
      if (auto it = vars.find(*name); it != vars.end()) {
        return *it;
      }
    }
    if (const auto* fallback = args.arg(1, "default")) {
      return *fallback;
    }
    return tmpl::template_error(
        std::format("Required var '{}' not found in config", *name));
  }

  auto config(const tmpl::CallArgs& args) -> tmpl::TResult<tmpl::Value> {
    if (const auto* materialized = args.kwarg("materialized")) {
      if (!materialized->is_string()) {
        return tmpl::template_error("materialized must be a string");
      }
      auto m = parse_materialization(materialized->get<std::string>());
      if (!m) {
        return tmpl::template_error(
            std::format("Invalid materialization '{}'",
                        materialized->get<std::string>()));
      }
      out_.materialized = *m;
    }
    return tmpl::Value("");
  }

  const CompiledProject& project_;
  CompileMode mode_;
  CompileOutput& out_;
};

}  // namespace

auto ephemeral_cte_name(std::string_view model) -> std::string {
  return std::format("__dbt__CTE__{}", model);
}

Compiler::Compiler(const CompiledProject& project, CompileMode mode)
    : project_(project), mode_(mode) {
}

auto Compiler::compile(const CompileRequest& request) const
    -> std::expected<CompileOutput, CompileError> {
  CompileOutput out;
  tmpl::Environment env;
  for (const auto& macro : project_.macros()) {
    env.define(macro);
  }

  if (!request.macros.empty()) {
    auto extra = tmpl::Template::parse(request.macros);
    if (!extra) {
      return std::unexpected(CompileError{extra.error().message});
    }
    env.define_all(*extra);
  }

  auto parsed = tmpl::Template::parse(request.sql);
  if (!parsed) {
    return std::unexpected(CompileError{parsed.error().message});
  }
  env.define_all(*parsed);

  Functions functions(project_, mode_, out);
  functions.install(env);

  auto rendered = parsed->render(env);
  if (!rendered) {
    return std::unexpected(CompileError{rendered.error().message});
  }

  out.raw_sql = parsed->source_without_macros();
  if (mode_ == CompileMode::Compile && request.inject_ctes &&
      !out.ephemeral_refs.empty()) {
    out.compiled_sql = cte_prefix(out.ephemeral_refs) + *rendered;
  } else {
    out.compiled_sql = std::move(*rendered);
  }
  return out;
}

auto Compiler::cte_prefix(const std::vector<std::string>& names) const
    -> std::string {
  std::vector<const Node*> ordered;
  std::unordered_set<std::string> seen;

  std::function<void(const std::string&)> visit = [&](const std::string& name) {
    if (!seen.insert(name).second) {
      return;
    }
    const auto* node = project_.find_ref(name);
    if (node == nullptr || !node->is_ephemeral()) {
      return;
    }
    for (const auto& dep : node->ephemeral_refs) {
      visit(dep);
    }
    ordered.push_back(node);
  };
  for (const auto& name : names) {
    visit(name);
  }

  if (ordered.empty()) {
    return {};
  }
  std::string prefix = "with ";
  for (std::size_t i = 0; i < ordered.size(); ++i) {
    if (i > 0) {
      prefix += ", ";
    }
    prefix += std::format("{} as (\n{}\n)", ephemeral_cte_name(ordered[i]->name),
                          ordered[i]->compiled_sql);
  }
  return prefix;
}

}  // namespace sqlrpc
