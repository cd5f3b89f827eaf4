#include "test_harness.h"
#include "test_utils.h"

namespace {

using sqlfrag::Value;

void test_unnest_transposes_rows() {
  sqlfrag::Fragment f = sqlfrag::unnest({{"a", 1}, {"b", 2}, {"c", 3}}, {"text", "integer"});
  renders_as(f, "UNNEST($1::text[], $2::integer[])",
             {Value(std::vector<Value>{"a", "b", "c"}), Value(std::vector<Value>{1, 2, 3})});
}

void test_unnest_in_insert() {
  sqlfrag::Fragment insert = sqlfrag::sql("INSERT INTO t (name, n) SELECT * FROM {rows} WHERE {}",
                                          {true},
                                          {{"rows", sqlfrag::unnest({{"x", 1}}, {"text", "int"})}});
  renders_as(insert, "INSERT INTO t (name, n) SELECT * FROM UNNEST($1::text[], $2::int[]) WHERE $3",
             {Value(std::vector<Value>{"x"}), Value(std::vector<Value>{1}), true});
}

void test_unnest_arity_mismatch() {
  bool threw = false;
  try {
    sqlfrag::unnest({{"a", 1}, {"b"}}, {"text", "integer"});
  } catch (const sqlfrag::ArityError& ex) {
    threw = true;
    expect_true(std::string(ex.what()).find("row 1") != std::string::npos, "offending row named");
  }
  expect_true(threw, "short row rejected");
}

void test_unnest_no_rows() {
  sqlfrag::Fragment f = sqlfrag::unnest({}, {"text", "integer"});
  renders_as(f, "UNNEST($1::text[], $2::integer[])",
             {Value(std::vector<Value>{}), Value(std::vector<Value>{})});
}

void test_unnest_json_columns() {
  std::vector<std::vector<Value>> rows = {
      {1, Value::json_document(nlohmann::json::array({"foo"}))},
      {2, Value::json_document({{"k", true}})},
      {3, nullptr},
      {4, "already text"},
  };
  sqlfrag::Fragment f = sqlfrag::unnest(rows, {"integer", "jsonb"});
  renders_as(f, "UNNEST($1::integer[], $2::TEXT[]::jsonb[])",
             {Value(std::vector<Value>{1, 2, 3, 4}),
              Value(std::vector<Value>{"[\"foo\"]", "{\"k\":true}", nullptr, "already text"})});
}

void test_unnest_json_type_case_insensitive() {
  sqlfrag::Fragment f = sqlfrag::unnest({{Value(std::vector<Value>{1, 2})}}, {"JSON"});
  renders_as(f, "UNNEST($1::TEXT[]::JSON[])", {Value(std::vector<Value>{"[1,2]"})});
}

}  // namespace

void register_unnest_tests(std::vector<TestCase>& tests) {
  tests.push_back({"unnest_transposes_rows", test_unnest_transposes_rows});
  tests.push_back({"unnest_in_insert", test_unnest_in_insert});
  tests.push_back({"unnest_arity_mismatch", test_unnest_arity_mismatch});
  tests.push_back({"unnest_no_rows", test_unnest_no_rows});
  tests.push_back({"unnest_json_columns", test_unnest_json_columns});
  tests.push_back({"unnest_json_type_case_insensitive", test_unnest_json_type_case_insensitive});
}
