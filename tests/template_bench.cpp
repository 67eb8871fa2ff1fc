#include "sqlrpc/compiler/template.hpp"

#include <benchmark/benchmark.h>

#include <string>

using namespace sqlrpc;

namespace {

constexpr std::string_view kModel = R"(
{% set statuses = ['placed', 'shipped', 'returned'] %}
select
  order_id,
  {% for status in statuses %}
  sum(case when status = '{{ status }}' then amount else 0 end)
    as {{ status }}_amount{% if not loop.last %},{% endif %}
  {% endfor %}
from orders
group by 1
)";

}  // namespace

static void BM_TemplateParse(benchmark::State& state) {
  for (auto _ : state) {
    auto parsed = tmpl::Template::parse(kModel);
    benchmark::DoNotOptimize(parsed);
  }
}

static void BM_TemplateRender(benchmark::State& state) {
  auto parsed = tmpl::Template::parse(kModel);
  if (!parsed) {
    state.SkipWithError(parsed.error().message.c_str());
    return;
  }
  tmpl::Environment env;

  for (auto _ : state) {
    auto out = parsed->render(env);
    benchmark::DoNotOptimize(out);
  }
}

static void BM_TemplateMacroCall(benchmark::State& state) {
  auto macros = tmpl::Template::parse(
      "{% macro cents(col) %}({{ col }} * 100){% endmacro %}");
  std::string body;
  for (int i = 0; i < state.range(0); ++i) {
    body += "{{ cents('c" + std::to_string(i) + "') }},";
  }
  auto parsed = tmpl::Template::parse(body);
  if (!macros || !parsed) {
    state.SkipWithError("template failed to parse");
    return;
  }
  tmpl::Environment env;
  env.define_all(*macros);

  for (auto _ : state) {
    auto out = parsed->render(env);
    benchmark::DoNotOptimize(out);
  }
}

BENCHMARK(BM_TemplateParse);
BENCHMARK(BM_TemplateRender);
BENCHMARK(BM_TemplateMacroCall)->Arg(10)->Arg(100);
