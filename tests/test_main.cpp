#include <cctype>
#include <cstdlib>
#include <iostream>
#include <sstream>
#include <string>
#include <unordered_set>
#include <vector>

#include "test_harness.h"

void register_template_parser_tests(std::vector<TestCase>& tests);
void register_query_basic_tests(std::vector<TestCase>& tests);
void register_fill_tests(std::vector<TestCase>& tests);
void register_compile_tests(std::vector<TestCase>& tests);
void register_prepare_tests(std::vector<TestCase>& tests);
void register_combinator_tests(std::vector<TestCase>& tests);
void register_builder_tests(std::vector<TestCase>& tests);
void register_escape_tests(std::vector<TestCase>& tests);
void register_unnest_tests(std::vector<TestCase>& tests);
void register_named_render_tests(std::vector<TestCase>& tests);
void register_value_tests(std::vector<TestCase>& tests);
void register_diagnostics_tests(std::vector<TestCase>& tests);

namespace {

std::unordered_set<std::string> parse_skip_list_from_env() {
  std::unordered_set<std::string> out;
  const char* raw = std::getenv("SQLFRAG_TEST_SKIP");
  if (!raw || !*raw) return out;
  std::istringstream iss(raw);
  std::string token;
  while (std::getline(iss, token, ',')) {
    size_t start = 0;
    while (start < token.size() && std::isspace(static_cast<unsigned char>(token[start]))) ++start;
    size_t end = token.size();
    while (end > start && std::isspace(static_cast<unsigned char>(token[end - 1]))) --end;
    if (end > start) out.insert(token.substr(start, end - start));
  }
  return out;
}

}  // namespace

int main(int argc, char** argv) {
  std::vector<TestCase> tests;
  tests.reserve(128);
  register_template_parser_tests(tests);
  register_query_basic_tests(tests);
  register_fill_tests(tests);
  register_compile_tests(tests);
  register_prepare_tests(tests);
  register_combinator_tests(tests);
  register_builder_tests(tests);
  register_escape_tests(tests);
  register_unnest_tests(tests);
  register_named_render_tests(tests);
  register_value_tests(tests);
  register_diagnostics_tests(tests);

  const auto skip_tests = parse_skip_list_from_env();

  if (argc > 1) {
    std::string target = argv[1];
    if (skip_tests.find(target) != skip_tests.end()) {
      std::cout << "SKIPPED: " << target << std::endl;
      return EXIT_SUCCESS;
    }
    for (const auto& test : tests) {
      if (target == test.name) {
        int failures = run_test(test);
        return failures == 0 ? EXIT_SUCCESS : EXIT_FAILURE;
      }
    }
    std::cerr << "Unknown test: " << target << std::endl;
    std::cerr << "Available tests:" << std::endl;
    for (const auto& test : tests) {
      std::cerr << "  " << test.name << std::endl;
    }
    return EXIT_FAILURE;
  }

  if (skip_tests.empty()) {
    return run_all_tests(tests);
  }

  std::vector<TestCase> filtered;
  filtered.reserve(tests.size());
  for (const auto& test : tests) {
    if (skip_tests.find(test.name) != skip_tests.end()) {
      std::cout << "SKIPPED: " << test.name << std::endl;
      continue;
    }
    filtered.push_back(test);
  }
  return run_all_tests(filtered);
}
