#include "sqlrpc/project/project_loader.hpp"

#include "sqlrpc/compiler/compiler.hpp"
#include "sqlrpc/config/yaml_utils.hpp"
#include "sqlrpc/util/log.hpp"
#include "sqlrpc/util/util.hpp"

#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <format>
#include <system_error>

namespace sqlrpc {

namespace {

constexpr std::string_view kProjectFile = "project.yml";

struct PendingDeps {
  NodeIndex idx;
  std::vector<std::string> refs;
  std::vector<std::pair<std::string, std::string>> sources;
};

auto project_error(std::string message) -> std::unexpected<ProjectError> {
  return std::unexpected{ProjectError{std::move(message)}};
}

auto compilation_error(const Node& node, std::string_view detail)
    -> std::unexpected<ProjectError> {
  return project_error(std::format("Compilation Error in {} {} ({})\n  {}",
                                   resource_type_name(node.resource_type),
                                   node.name, node.original_file_path,
                                   detail));
}

auto invalid_test_config(std::string_view file, std::string_view detail)
    -> std::unexpected<ProjectError> {
  return project_error(std::format(
      "Compilation warning: Invalid test config given in {}: {}", file,
      detail));
}

auto duplicate_error(const Node& node) -> std::unexpected<ProjectError> {
  return project_error(
      std::format("Compilation Error\n  Found two resources with the name "
                  "\"{}\". The second one is {}",
                  node.name, node.original_file_path));
}

auto yaml_to_json(const YAML::Node& node) -> tmpl::Value {
  switch (node.Type()) {
    case YAML::NodeType::Map: {
      tmpl::Value obj = tmpl::Value::object();
      for (const auto& kv : node) {
        obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
      }
      return obj;
    }
    case YAML::NodeType::Sequence: {
      tmpl::Value arr = tmpl::Value::array();
      for (const auto& item : node) {
        arr.push_back(yaml_to_json(item));
      }
      return arr;
    }
    case YAML::NodeType::Scalar: {
      // Quoted scalars stay strings.
      if (node.Tag() == "!") {
        return node.Scalar();
      }
      long long i = 0;
      if (YAML::convert<long long>::decode(node, i)) {
        return i;
      }
      double d = 0;
      if (YAML::convert<double>::decode(node, d)) {
        return d;
      }
      bool b = false;
      if (YAML::convert<bool>::decode(node, b)) {
        return b;
      }
      return node.Scalar();
    }
    default:
      return nullptr;
  }
}

auto collect_files(const std::filesystem::path& root,
                   const std::vector<std::string>& dirs,
                   std::initializer_list<std::string_view> extensions)
    -> std::vector<std::filesystem::path> {
  std::vector<std::filesystem::path> files;
  for (const auto& dir : dirs) {
    auto base = root / dir;
    std::error_code ec;
    if (!std::filesystem::is_directory(base, ec)) {
      continue;
    }
    for (auto it = std::filesystem::recursive_directory_iterator(base, ec);
         !ec && it != std::filesystem::recursive_directory_iterator();
         it.increment(ec)) {
      if (!it->is_regular_file(ec)) {
        continue;
      }
      auto ext = it->path().extension().string();
      if (std::ranges::find(extensions, ext) != extensions.end()) {
        files.push_back(it->path());
      }
    }
    if (ec) {
      log::warn("Failed to scan {}: {}", base.string(), ec.message());
    }
  }
  std::ranges::sort(files);
  return files;
}

auto sql_literal(const YAML::Node& value) -> std::string {
  const auto& text = value.Scalar();
  long long i = 0;
  double d = 0;
  if (value.Tag() != "!" && (YAML::convert<long long>::decode(value, i) ||
                             YAML::convert<double>::decode(value, d))) {
    return text;
  }
  std::string out = "'";
  for (char c : text) {
    if (c == '\'') {
      out.push_back('\'');
    }
    out.push_back(c);
  }
  out.push_back('\'');
  return out;
}

auto schema_test_sql(const SchemaTest& test) -> std::string {
  auto column = quote_identifier(test.column);
  auto relation = std::format("{{{{ ref('{}') }}}}", test.model);
  switch (test.kind) {
    case SchemaTestKind::Unique:
      return std::format(
          "select {0} from {1} where {0} is not null group by {0} having "
          "count(*) > 1",
          column, relation);
    case SchemaTestKind::NotNull:
      return std::format("select * from {} where {} is null", relation,
                         column);
    case SchemaTestKind::AcceptedValues: {
      std::string values;
      for (const auto& v : test.values) {
        if (!values.empty()) {
          values += ", ";
        }
        values += v;
      }
      return std::format("select {0} from {1} where {0} not in ({2})", column,
                         relation, values);
    }
  }
  return {};
}

class Builder {
public:
  Builder(const ProjectOptions& options, std::shared_ptr<CompiledProject> project)
      : options_(options), project_(std::move(project)) {
  }

  auto rel(const std::filesystem::path& path) const -> std::string {
    return path.lexically_relative(options_.root).generic_string();
  }

  auto id(ResourceType type, std::string_view name) const -> NodeId {
    return NodeId{std::format("{}.{}.{}", resource_type_name(type),
                              project_->name(), name)};
  }

  auto add_macros(const std::vector<std::string>& dirs)
      -> std::expected<void, ProjectError> {
    for (const auto& path : collect_files(options_.root, dirs, {".sql"})) {
      auto text = read_file(path);
      if (!text) {
        return project_error(std::format("Failed to read {}", rel(path)));
      }
      auto parsed = tmpl::Template::parse(*text);
      if (!parsed) {
        return project_error(std::format("Compilation Error in macro file {}\n  {}",
                                         rel(path), parsed.error().message));
      }
      project_->add_macros(*parsed);
    }
    return {};
  }

  auto add_seeds(const std::vector<std::string>& dirs)
      -> std::expected<void, ProjectError> {
    for (const auto& path : collect_files(options_.root, dirs, {".csv"})) {
      Node node;
      node.name = path.stem().string();
      node.unique_id = id(ResourceType::Seed, node.name);
      node.resource_type = ResourceType::Seed;
      node.original_file_path = rel(path);
      node.materialized = Materialization::Table;
      node.schema = project_->schema();
      node.alias = node.name;
      if (auto r = insert(std::move(node)); !r) {
        return std::unexpected(r.error());
      }
    }
    return {};
  }

  auto add_sql_nodes(const std::vector<std::string>& dirs, ResourceType type,
                     Materialization default_materialization)
      -> std::expected<void, ProjectError> {
    Compiler parser(*project_, CompileMode::Parse);
    for (const auto& path : collect_files(options_.root, dirs, {".sql"})) {
      Node node;
      node.name = path.stem().string();
      node.unique_id = id(type, node.name);
      node.resource_type = type;
      node.original_file_path = rel(path);
      node.schema = project_->schema();
      node.alias = node.name;

      auto text = read_file(path);
      if (!text) {
        return project_error(std::format("Failed to read {}", rel(path)));
      }
      node.raw_sql = std::move(*text);

      auto parsed = parser.compile({.name = node.name, .sql = node.raw_sql});
      if (!parsed) {
        return compilation_error(node, parsed.error().message);
      }
      node.materialized = parsed->materialized.value_or(default_materialization);

      auto idx = insert(std::move(node));
      if (!idx) {
        return std::unexpected(idx.error());
      }
      pending_.push_back(
          {*idx, std::move(parsed->refs), std::move(parsed->sources)});
    }
    return {};
  }

  auto add_schema_files(const std::vector<std::string>& dirs)
      -> std::expected<void, ProjectError> {
    for (const auto& path :
         collect_files(options_.root, dirs, {".yml", ".yaml"})) {
      auto file = rel(path);
      auto text = read_file(path);
      if (!text) {
        return project_error(std::format("Failed to read {}", file));
      }

      YAML::Node doc;
      try {
        doc = YAML::Load(*text);
      } catch (const YAML::Exception& e) {
        return project_error(
            std::format("Runtime Error\n  Syntax error in {}: {}", file, e.what()));
      }
      if (!doc.IsMap()) {
        continue;
      }

      if (auto r = add_sources(doc["sources"], file); !r) {
        return r;
      }
      if (auto r = add_schema_tests(doc["models"], file); !r) {
        return r;
      }
    }
    return {};
  }

  auto link() -> std::expected<void, ProjectError> {
    for (const auto& p : pending_) {
      const auto& node = project_->node(p.idx);
      for (const auto& ref : p.refs) {
        const auto* upstream = project_->find_ref(ref);
        if (upstream == nullptr) {
          return compilation_error(
              node, std::format("depends on a node named '{}' which was not "
                                "found",
                                ref));
        }
        if (auto r = connect(*upstream, p.idx); !r) {
          return r;
        }
      }
      for (const auto& [source, table] : p.sources) {
        const auto* upstream = project_->find_source(source, table);
        if (upstream == nullptr) {
          return compilation_error(
              node, std::format("depends on a source named '{}.{}' which was "
                                "not found",
                                source, table));
        }
        if (auto r = connect(*upstream, p.idx); !r) {
          return r;
        }
      }
    }
    project_->finalize();
    return {};
  }

  auto compile_all() -> std::expected<void, ProjectError> {
    Compiler compiler(*project_);
    for (auto idx : project_->order()) {
      const auto& node = project_->node(idx);
      if (node.resource_type != ResourceType::Model &&
          node.resource_type != ResourceType::Test) {
        continue;
      }
      auto compiled = compiler.compile({.name = node.name,
                                        .sql = node.raw_sql,
                                        .inject_ctes = !node.is_ephemeral()});
      if (!compiled) {
        return compilation_error(node, compiled.error().message);
      }
      auto& target = project_->mutable_node(idx);
      target.compiled_sql = std::move(compiled->compiled_sql);
      target.depends_on = std::move(compiled->depends_on);
      target.ephemeral_refs = std::move(compiled->ephemeral_refs);
    }
    return {};
  }

private:
  auto insert(Node node) -> std::expected<NodeIndex, ProjectError> {
    Node copy_for_error;
    copy_for_error.name = node.name;
    copy_for_error.original_file_path = node.original_file_path;
    auto idx = project_->add_node(std::move(node));
    if (!idx) {
      return duplicate_error(copy_for_error);
    }
    return *idx;
  }

  auto connect(const Node& upstream, NodeIndex downstream)
      -> std::expected<void, ProjectError> {
    auto from = project_->graph().index_of(upstream.unique_id);
    if (auto r = project_->add_dependency(from, downstream); !r) {
      if (r.error() == make_error_code(Error::CycleDetected)) {
        return project_error(std::format(
            "Found a cycle: {} --> {}", upstream.unique_id,
            project_->node(downstream).unique_id));
      }
      return project_error(r.error().message());
    }
    return {};
  }

  auto add_sources(const YAML::Node& sources, const std::string& file)
      -> std::expected<void, ProjectError> {
    if (!sources) {
      return {};
    }
    if (!sources.IsSequence()) {
      return project_error(
          std::format("Invalid sources config given in {}: expected a list", file));
    }
    for (const auto& source : sources) {
      auto source_name = yaml_get_or<std::string>(source, "name", "");
      if (source_name.empty()) {
        return project_error(
            std::format("Invalid sources config given in {}: source without a "
                        "name",
                        file));
      }
      auto schema =
          yaml_get_or<std::string>(source, "schema", project_->schema());
      auto tables = source["tables"];
      if (!tables || !tables.IsSequence()) {
        continue;
      }
      for (const auto& table : tables) {
        Node node;
        node.name = yaml_get_or<std::string>(table, "name", "");
        if (node.name.empty()) {
          return project_error(std::format(
              "Invalid sources config given in {}: table without a name", file));
        }
        node.unique_id = id(ResourceType::Source,
                            std::format("{}.{}", source_name, node.name));
        node.resource_type = ResourceType::Source;
        node.original_file_path = file;
        node.source_name = source_name;
        node.schema = schema;
        node.alias = yaml_get_or<std::string>(table, "identifier", node.name);
        if (auto r = insert(std::move(node)); !r) {
          return std::unexpected(r.error());
        }
      }
    }
    return {};
  }

  auto add_schema_tests(const YAML::Node& models, const std::string& file)
      -> std::expected<void, ProjectError> {
    if (!models) {
      return {};
    }
    if (!models.IsSequence()) {
      return invalid_test_config(file, "models must be a list");
    }
    for (const auto& model : models) {
      auto model_name = yaml_get_or<std::string>(model, "name", "");
      if (model_name.empty()) {
        return invalid_test_config(file, "model entry without a name");
      }
      auto columns = model["columns"];
      if (!columns) {
        continue;
      }
      if (!columns.IsSequence()) {
        return invalid_test_config(file, "columns must be a list");
      }
      for (const auto& column : columns) {
        auto column_name = yaml_get_or<std::string>(column, "name", "");
        if (column_name.empty()) {
          return invalid_test_config(file, "column entry without a name");
        }
        auto tests = column["tests"] ? column["tests"] : column["data_tests"];
        if (!tests) {
          continue;
        }
        if (!tests.IsSequence()) {
          return invalid_test_config(file, "tests must be a list");
        }
        for (const auto& entry : tests) {
          auto test = parse_test(entry, model_name, column_name, file);
          if (!test) {
            return std::unexpected(test.error());
          }
          if (auto r = add_schema_test(std::move(test->first),
                                       std::move(test->second), file);
              !r) {
            return r;
          }
        }
      }
    }
    return {};
  }

  // Returns the test and its node name.
  auto parse_test(const YAML::Node& entry, const std::string& model,
                  const std::string& column, const std::string& file)
      -> std::expected<std::pair<SchemaTest, std::string>, ProjectError> {
    SchemaTest test{.model = model, .column = column};
    std::string test_name;
    YAML::Node args;

    if (entry.IsScalar()) {
      test_name = entry.Scalar();
    } else if (entry.IsMap() && entry.size() == 1) {
      auto it = entry.begin();
      test_name = it->first.as<std::string>();
      args = it->second;
    } else {
      return invalid_test_config(
          file, std::format("test must be dict or str, got {} (value {})",
                            entry.IsSequence() ? "list" : "dict",
                            YAML::Dump(entry)));
    }

    auto kind = parse_schema_test(test_name);
    if (!kind) {
      return invalid_test_config(
          file, std::format("test '{}' is not defined", test_name));
    }
    test.kind = *kind;

    auto node_name = std::format("{}_{}_{}", test_name, model, column);
    if (test.kind == SchemaTestKind::AcceptedValues) {
      auto values = args && args.IsMap() ? args["values"] : YAML::Node{};
      if (!values || !values.IsSequence() || values.size() == 0) {
        return invalid_test_config(
            file, "accepted_values test requires a non-empty 'values' list");
      }
      for (const auto& v : values) {
        if (!v.IsScalar()) {
          return invalid_test_config(
              file, "accepted_values entries must be scalars");
        }
        test.values.push_back(sql_literal(v));
        node_name += "__" + v.Scalar();
      }
    }
    return std::pair{std::move(test), std::move(node_name)};
  }

  auto add_schema_test(SchemaTest test, std::string name,
                       const std::string& file)
      -> std::expected<void, ProjectError> {
    Node node;
    node.unique_id = id(ResourceType::Test, name);
    node.name = std::move(name);
    node.resource_type = ResourceType::Test;
    node.original_file_path = file;
    node.schema = project_->schema();
    node.raw_sql = schema_test_sql(test);
    auto model = test.model;
    node.schema_test = std::move(test);

    auto idx = insert(std::move(node));
    if (!idx) {
      return std::unexpected(idx.error());
    }
    pending_.push_back({*idx, {std::move(model)}, {}});
    return {};
  }

  const ProjectOptions& options_;
  std::shared_ptr<CompiledProject> project_;
  std::vector<PendingDeps> pending_;
};

}  // namespace

ProjectLoader::ProjectLoader(ProjectOptions options)
    : options_(std::move(options)) {
}

auto ProjectLoader::load() const
    -> std::expected<ProjectSnapshot, ProjectError> {
  auto project_file = options_.root / kProjectFile;
  auto text = read_file(project_file);
  if (!text) {
    return project_error(std::format(
        "Runtime Error\n  Could not find {} in {}", kProjectFile,
        options_.root.string()));
  }

  try {
    YAML::Node cfg = YAML::Load(*text);
    if (!cfg.IsMap()) {
      return project_error(
          std::format("Runtime Error\n  {} must be a mapping", kProjectFile));
    }

    auto dir_name =
        std::filesystem::absolute(options_.root).lexically_normal().filename();
    if (dir_name.empty()) {
      dir_name = std::filesystem::absolute(options_.root)
                     .lexically_normal()
                     .parent_path()
                     .filename();
    }
    auto name = yaml_get_or<std::string>(cfg, "name", dir_name.string());

    auto model_paths = yaml_string_list(
        cfg, "model-paths", yaml_string_list(cfg, "source-paths", {"models"}));
    auto seed_paths = yaml_string_list(
        cfg, "seed-paths", yaml_string_list(cfg, "data-paths", {"seeds"}));
    auto test_paths = yaml_string_list(cfg, "test-paths", {"tests"});
    auto macro_paths = yaml_string_list(cfg, "macro-paths", {"macros"});

    auto default_name = std::string{"view"};
    if (auto models = cfg["models"]; models && models.IsMap()) {
      default_name = yaml_get_or<std::string>(
          models, "materialized",
          yaml_get_or<std::string>(models, "+materialized", "view"));
    }
    auto default_materialization = parse_materialization(default_name);
    if (!default_materialization) {
      return project_error(
          std::format("Runtime Error\n  Invalid materialization '{}' in {}",
                      default_name, kProjectFile));
    }

    auto project = std::make_shared<CompiledProject>(
        name, options_.root.string(), options_.schema);
    auto vars = cfg["vars"] && cfg["vars"].IsMap() ? yaml_to_json(cfg["vars"])
                                                  : tmpl::Value::object();
    if (options_.vars.is_object()) {
      vars.update(options_.vars);
    }
    project->set_vars(std::move(vars));

    Builder builder(options_, project);
    if (auto r = builder.add_macros(macro_paths); !r) {
      return std::unexpected(r.error());
    }
    if (auto r = builder.add_seeds(seed_paths); !r) {
      return std::unexpected(r.error());
    }
    if (auto r = builder.add_sql_nodes(model_paths, ResourceType::Model,
                                       *default_materialization);
        !r) {
      return std::unexpected(r.error());
    }
    if (auto r = builder.add_schema_files(model_paths); !r) {
      return std::unexpected(r.error());
    }
    if (auto r = builder.add_sql_nodes(test_paths, ResourceType::Test,
                                       Materialization::View);
        !r) {
      return std::unexpected(r.error());
    }
    if (auto r = builder.link(); !r) {
      return std::unexpected(r.error());
    }
    if (auto r = builder.compile_all(); !r) {
      return std::unexpected(r.error());
    }

    log::info("Loaded project '{}': {} models, {} seeds, {} tests, {} sources, "
              "{} macros",
              project->name(), project->nodes_of(ResourceType::Model).size(),
              project->nodes_of(ResourceType::Seed).size(),
              project->nodes_of(ResourceType::Test).size(),
              project->nodes_of(ResourceType::Source).size(),
              project->macros().size());
    return ProjectSnapshot{std::move(project)};
  } catch (const YAML::Exception& e) {
    return project_error(
        std::format("Runtime Error\n  Syntax error in {}: {}", kProjectFile,
                    e.what()));
  }
}

auto parse_seed_csv(std::string_view text)
    -> std::expected<SeedData, std::string> {
  std::vector<std::vector<std::optional<std::string>>> records;
  std::vector<std::optional<std::string>> record;
  std::string field;
  bool quoted = false;
  bool was_quoted = false;
  bool at_field_start = true;

  auto end_field = [&] {
    if (field.empty() && !was_quoted) {
      record.emplace_back(std::nullopt);
    } else {
      record.emplace_back(std::move(field));
    }
    field.clear();
    was_quoted = false;
    at_field_start = true;
  };
  auto end_record = [&] {
    end_field();
    bool blank = record.size() == 1 && !record.front().has_value();
    if (!blank) {
      records.push_back(std::move(record));
    }
    record.clear();
  };

  for (std::size_t i = 0; i < text.size(); ++i) {
    char c = text[i];
    if (quoted) {
      if (c == '"') {
        if (i + 1 < text.size() && text[i + 1] == '"') {
          field.push_back('"');
          ++i;
        } else {
          quoted = false;
        }
      } else {
        field.push_back(c);
      }
      continue;
    }
    switch (c) {
      case '"':
        if (!at_field_start) {
          return std::unexpected("unexpected quote inside unquoted field");
        }
        quoted = true;
        was_quoted = true;
        at_field_start = false;
        break;
      case ',':
        end_field();
        break;
      case '\r':
        break;
      case '\n':
        end_record();
        break;
      default:
        field.push_back(c);
        at_field_start = false;
        break;
    }
  }
  if (quoted) {
    return std::unexpected("unterminated quoted field");
  }
  if (!field.empty() || was_quoted || !record.empty()) {
    end_record();
  }

  if (records.empty()) {
    return std::unexpected("missing header row");
  }

  SeedData data;
  for (auto& col : records.front()) {
    if (!col || col->empty()) {
      return std::unexpected("empty column name in header");
    }
    data.columns.push_back(std::move(*col));
  }
  for (std::size_t r = 1; r < records.size(); ++r) {
    if (records[r].size() != data.columns.size()) {
      return std::unexpected(std::format("row {} has {} values, expected {}",
                                         r, records[r].size(),
                                         data.columns.size()));
    }
    data.rows.push_back(std::move(records[r]));
  }
  return data;
}

}  // namespace sqlrpc
