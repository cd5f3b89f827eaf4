#include "test_harness.h"
#include "test_utils.h"

namespace {

using sqlfrag::sql;

void test_named_render_positional_value() {
  sqlfrag::NamedQuery q = sqlfrag::render_named(sql("FOO {}", {42}));
  expect_str_eq(q.text, "FOO (:_arg_0_0)", "positional key");
  expect_eq(q.bindings.size(), 1, "one binding");
  if (!q.bindings.empty()) {
    expect_str_eq(q.bindings[0].first, "_arg_0_0", "binding key");
    expect_true(q.bindings[0].second == sqlfrag::Value(42), "binding value");
  }
  expect_eq(q.slots.size(), 0, "no slots");
}

void test_named_render_keyword_value() {
  sqlfrag::NamedQuery q = sqlfrag::render_named(sql("FOO {kw}", {}, {{"kw", 42}}));
  expect_str_eq(q.text, "FOO (:_arg_kw_0)", "keyword key");
}

void test_named_render_slot() {
  sqlfrag::NamedQuery q = sqlfrag::render_named(sql("  FOO {slot} AND {slot}\n"));
  expect_str_eq(q.text, "FOO (:slot) AND (:slot)", "slots become named params, text trimmed");
  expect_eq(q.bindings.size(), 0, "no bindings");
  expect_eq(q.slots.size(), 1, "distinct slot listed once");
}

void test_named_render_shared_binding() {
  sqlfrag::NamedQuery q =
      sqlfrag::render_named(sql("{a} = {a} AND {} = {}", {1, 2}, {{"a", "x"}}));
  expect_str_eq(q.text, "(:_arg_a_0) = (:_arg_a_0) AND (:_arg_0_1) = (:_arg_1_2)",
                "shared binding keeps one key");
  expect_eq(q.bindings.size(), 3, "three distinct bindings");
}

}  // namespace

void register_named_render_tests(std::vector<TestCase>& tests) {
  tests.push_back({"named_render_positional_value", test_named_render_positional_value});
  tests.push_back({"named_render_keyword_value", test_named_render_keyword_value});
  tests.push_back({"named_render_slot", test_named_render_slot});
  tests.push_back({"named_render_shared_binding", test_named_render_shared_binding});
}
