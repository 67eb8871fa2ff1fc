#include "sqlrpc/project/project_loader.hpp"

#include "test_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>

using namespace sqlrpc;

class ProjectLoaderTest : public ::testing::Test {
protected:
  auto load() -> std::expected<ProjectSnapshot, ProjectError> {
    return ProjectLoader({.root = dir_.path()}).load();
  }

  auto position(const CompiledProject& project, std::string_view id)
      -> std::ptrdiff_t {
    auto order = project.order();
    auto idx = project.graph().index_of(NodeId{std::string(id)});
    return std::ranges::find(order, idx) - order.begin();
  }

  test::TempDir dir_;
};

TEST_F(ProjectLoaderTest, LoadsSampleProject) {
  test::write_sample_project(dir_.path());
  auto loaded = load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  const auto& project = **loaded;

  EXPECT_EQ(project.name(), "shop");
  EXPECT_EQ(project.nodes_of(ResourceType::Model).size(), 3u);
  EXPECT_EQ(project.nodes_of(ResourceType::Seed).size(), 1u);
  EXPECT_EQ(project.nodes_of(ResourceType::Source).size(), 1u);
  EXPECT_EQ(project.nodes_of(ResourceType::Test).size(), 3u);
  EXPECT_EQ(project.macros().size(), 1u);
  EXPECT_EQ(project.order().size(), project.size());
}

TEST_F(ProjectLoaderTest, MaterializationFromConfigAndDefault) {
  test::write_sample_project(dir_.path());
  auto loaded = load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  const auto& project = **loaded;

  EXPECT_EQ(project.find_ref("orders")->materialized, Materialization::View);
  EXPECT_EQ(project.find_ref("big_orders")->materialized,
            Materialization::Ephemeral);
  EXPECT_EQ(project.find_ref("customer_totals")->materialized,
            Materialization::Table);
  EXPECT_EQ(project.find_ref("raw_orders")->materialized,
            Materialization::Table);
}

TEST_F(ProjectLoaderTest, OrderPutsDependenciesFirst) {
  test::write_sample_project(dir_.path());
  auto loaded = load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  const auto& project = **loaded;

  EXPECT_LT(position(project, "seed.shop.raw_orders"),
            position(project, "model.shop.orders"));
  EXPECT_LT(position(project, "model.shop.orders"),
            position(project, "model.shop.big_orders"));
  EXPECT_LT(position(project, "model.shop.big_orders"),
            position(project, "model.shop.customer_totals"));
  EXPECT_LT(position(project, "model.shop.orders"),
            position(project, "test.shop.unique_orders_id"));
}

TEST_F(ProjectLoaderTest, CompilesModelsWithCtes) {
  test::write_sample_project(dir_.path());
  auto loaded = load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  const auto* node = (*loaded)->find_ref("customer_totals");
  ASSERT_NE(node, nullptr);

  EXPECT_TRUE(node->compiled_sql.starts_with(
      "with __dbt__CTE__big_orders as ("));
  EXPECT_NE(node->compiled_sql.find("sum((amount * 100))"), std::string::npos);
  ASSERT_EQ(node->depends_on.size(), 1u);
  EXPECT_EQ(node->depends_on[0].str(), "model.shop.big_orders");
}

TEST_F(ProjectLoaderTest, SchemaTestsBecomeNodes) {
  test::write_sample_project(dir_.path());
  auto loaded = load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  const auto* unique =
      (*loaded)->find(NodeId{std::string("test.shop.unique_orders_id")});
  ASSERT_NE(unique, nullptr);
  ASSERT_TRUE(unique->schema_test.has_value());
  EXPECT_EQ(unique->schema_test->kind, SchemaTestKind::Unique);
  EXPECT_EQ(unique->original_file_path, "models/schema.yml");
  EXPECT_EQ(unique->compiled_sql,
            R"(select "id" from "main"."orders" where "id" is not null )"
            R"(group by "id" having count(*) > 1)");

  EXPECT_NE((*loaded)->find(NodeId{std::string("test.shop.not_null_orders_id")}),
            nullptr);
}

TEST_F(ProjectLoaderTest, AcceptedValuesQuotesStrings) {
  test::write_file(dir_ / "project.yml", "name: p\n");
  test::write_file(dir_ / "models/m.sql", "select 'a' as kind");
  test::write_file(dir_ / "models/schema.yml",
                   "models:\n"
                   "  - name: m\n"
                   "    columns:\n"
                   "      - name: kind\n"
                   "        tests:\n"
                   "          - accepted_values:\n"
                   "              values: ['a', 'it''s', 3]\n");
  auto loaded = load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  auto tests = (*loaded)->nodes_of(ResourceType::Test);
  ASSERT_EQ(tests.size(), 1u);
  EXPECT_NE(tests[0]->compiled_sql.find("not in ('a', 'it''s', 3)"),
            std::string::npos)
      << tests[0]->compiled_sql;
}

TEST_F(ProjectLoaderTest, VarsOverrideProjectFile) {
  test::write_sample_project(dir_.path());
  auto loaded = ProjectLoader({.root = dir_.path(),
                               .vars = {{"min_amount", 20}}})
                    .load();
  ASSERT_TRUE(loaded.has_value()) << loaded.error().message;
  const auto* node = (*loaded)->find_ref("big_orders");
  EXPECT_TRUE(node->compiled_sql.ends_with("amount >= 20"));
}

TEST_F(ProjectLoaderTest, MissingProjectFile) {
  auto loaded = load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_NE(loaded.error().message.find("Could not find project.yml"),
            std::string::npos);
}

TEST_F(ProjectLoaderTest, UnknownRefIsCompilationError) {
  test::write_file(dir_ / "project.yml", "name: p\n");
  test::write_file(dir_ / "models/a.sql", "select * from {{ ref('ghost') }}");
  auto loaded = load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_EQ(loaded.error().message,
            "Compilation Error in model a (models/a.sql)\n"
            "  depends on a node named 'ghost' which was not found");
}

TEST_F(ProjectLoaderTest, CycleIsRejected) {
  test::write_file(dir_ / "project.yml", "name: p\n");
  test::write_file(dir_ / "models/a.sql", "select * from {{ ref('b') }}");
  test::write_file(dir_ / "models/b.sql", "select * from {{ ref('a') }}");
  auto loaded = load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_TRUE(loaded.error().message.starts_with("Found a cycle"))
      << loaded.error().message;
}

TEST_F(ProjectLoaderTest, DuplicateNamesAreRejected) {
  test::write_file(dir_ / "project.yml", "name: p\n");
  test::write_file(dir_ / "models/a.sql", "select 1");
  test::write_file(dir_ / "models/nested/a.sql", "select 2");
  auto loaded = load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_NE(loaded.error().message.find("Found two resources with the name "
                                        "\"a\""),
            std::string::npos);
}

TEST_F(ProjectLoaderTest, BadTemplateIsCompilationError) {
  test::write_file(dir_ / "project.yml", "name: p\n");
  test::write_file(dir_ / "models/a.sql", "select {% if %}");
  auto loaded = load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_TRUE(loaded.error().message.starts_with(
      "Compilation Error in model a (models/a.sql)"));
}

TEST_F(ProjectLoaderTest, UnknownSchemaTestIsRejected) {
  test::write_file(dir_ / "project.yml", "name: p\n");
  test::write_file(dir_ / "models/m.sql", "select 1 as id");
  test::write_file(dir_ / "models/schema.yml",
                   "models:\n"
                   "  - name: m\n"
                   "    columns:\n"
                   "      - name: id\n"
                   "        tests: [sorted]\n");
  auto loaded = load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_NE(loaded.error().message.find("Invalid test config"),
            std::string::npos);
}

TEST_F(ProjectLoaderTest, InvalidDefaultMaterialization) {
  test::write_file(dir_ / "project.yml",
                   "name: p\nmodels:\n  materialized: snapshot\n");
  auto loaded = load();
  ASSERT_FALSE(loaded.has_value());
  EXPECT_NE(loaded.error().message.find("Invalid materialization 'snapshot'"),
            std::string::npos);
}

TEST(SeedCsvTest, ParsesQuotedFieldsAndEmptyCells) {
  auto data = parse_seed_csv("id,name,note\n"
                             "1,\"Smith, J\",\n"
                             "2,\"say \"\"hi\"\"\",x\r\n"
                             "\n");
  ASSERT_TRUE(data.has_value()) << data.error();
  ASSERT_EQ(data->columns.size(), 3u);
  ASSERT_EQ(data->rows.size(), 2u);
  EXPECT_EQ(data->rows[0][1], "Smith, J");
  EXPECT_FALSE(data->rows[0][2].has_value());
  EXPECT_EQ(data->rows[1][1], "say \"hi\"");
  EXPECT_EQ(data->rows[1][2], "x");
}

TEST(SeedCsvTest, RejectsRaggedRows) {
  auto data = parse_seed_csv("a,b\n1\n");
  ASSERT_FALSE(data.has_value());
  EXPECT_EQ(data.error(), "row 1 has 1 values, expected 2");
}

TEST(SeedCsvTest, RejectsUnterminatedQuote) {
  auto data = parse_seed_csv("a\n\"open\n");
  ASSERT_FALSE(data.has_value());
  EXPECT_EQ(data.error(), "unterminated quoted field");
}

TEST(SeedCsvTest, RequiresHeader) {
  EXPECT_FALSE(parse_seed_csv("").has_value());
  EXPECT_FALSE(parse_seed_csv("a,,c\n1,2,3\n").has_value());
}
