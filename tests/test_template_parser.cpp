#include "test_harness.h"

#include "template/template_parser.h"

namespace {

using sqlfrag::TemplateItemType;
using sqlfrag::TemplateParseError;

void test_parse_literal_only() {
  auto result = sqlfrag::parse_template("SELECT 1");
  expect_true(result.parsed.has_value(), "plain text parses");
  if (!result.parsed.has_value()) return;
  expect_eq(result.parsed->items.size(), 1, "one literal item");
  expect_str_eq(result.parsed->items[0].text, "SELECT 1", "literal text");
  expect_eq(result.parsed->positional_count, 0, "no positional markers");
}

void test_parse_empty_template() {
  auto result = sqlfrag::parse_template("");
  expect_true(result.parsed.has_value(), "empty template parses");
  if (!result.parsed.has_value()) return;
  expect_eq(result.parsed->items.size(), 0, "no items");
}

void test_parse_markers_in_order() {
  auto result = sqlfrag::parse_template("a={} AND b={name} AND c={}");
  expect_true(result.parsed.has_value(), "markers parse");
  if (!result.parsed.has_value()) return;
  const auto& items = result.parsed->items;
  expect_eq(items.size(), 6, "three literals and three markers");
  if (items.size() != 6) return;
  expect_true(items[0].type == TemplateItemType::Literal, "leading literal");
  expect_true(items[1].type == TemplateItemType::Positional, "first positional");
  expect_eq(items[1].pos, 2, "positional byte offset");
  expect_true(items[3].type == TemplateItemType::Named, "named marker");
  expect_str_eq(items[3].text, "name", "named marker text");
  expect_true(items[5].type == TemplateItemType::Positional, "second positional");
  expect_eq(result.parsed->positional_count, 2, "positional count");
}

void test_parse_escaped_braces() {
  auto result = sqlfrag::parse_template("SELECT '{{}}' || {x} || '}}'");
  expect_true(result.parsed.has_value(), "escaped braces parse");
  if (!result.parsed.has_value()) return;
  const auto& items = result.parsed->items;
  expect_eq(items.size(), 3, "literal, marker, literal");
  if (items.size() != 3) return;
  expect_str_eq(items[0].text, "SELECT '{}' || ", "doubled braces collapse");
  expect_str_eq(items[2].text, " || '}'", "trailing doubled brace collapses");
}

void test_parse_underscore_names() {
  auto result = sqlfrag::parse_template("{_private} {snake_case_2}");
  expect_true(result.parsed.has_value(), "underscore names parse");
}

void test_parse_unmatched_open_brace() {
  auto result = sqlfrag::parse_template("SELECT {x");
  expect_true(!result.parsed.has_value(), "unterminated marker rejected");
  if (!result.error.has_value()) return;
  expect_true(result.error->reason == TemplateParseError::Reason::UnmatchedBrace,
              "unterminated marker reason");
  expect_eq(result.error->position, 7, "error at opening brace");
}

void test_parse_unmatched_close_brace() {
  auto result = sqlfrag::parse_template("a } b");
  expect_true(!result.parsed.has_value(), "stray close brace rejected");
  if (!result.error.has_value()) return;
  expect_true(result.error->reason == TemplateParseError::Reason::UnmatchedBrace,
              "stray close brace reason");
  expect_eq(result.error->position, 2, "error at close brace");
}

void test_parse_invalid_names() {
  const char* bad[] = {"{0}", "{1abc}", "{a b}", "{x:>5}", "{x!r}", "{a.b}", "{a[0]}", "{-}"};
  for (const char* tmpl : bad) {
    auto result = sqlfrag::parse_template(tmpl);
    expect_true(!result.parsed.has_value(), std::string("rejects ") + tmpl);
    if (result.error.has_value()) {
      expect_true(result.error->reason == TemplateParseError::Reason::InvalidName,
                  std::string("invalid name reason for ") + tmpl);
    }
  }
}

}  // namespace

void register_template_parser_tests(std::vector<TestCase>& tests) {
  tests.push_back({"parse_literal_only", test_parse_literal_only});
  tests.push_back({"parse_empty_template", test_parse_empty_template});
  tests.push_back({"parse_markers_in_order", test_parse_markers_in_order});
  tests.push_back({"parse_escaped_braces", test_parse_escaped_braces});
  tests.push_back({"parse_underscore_names", test_parse_underscore_names});
  tests.push_back({"parse_unmatched_open_brace", test_parse_unmatched_open_brace});
  tests.push_back({"parse_unmatched_close_brace", test_parse_unmatched_close_brace});
  tests.push_back({"parse_invalid_names", test_parse_invalid_names});
}
