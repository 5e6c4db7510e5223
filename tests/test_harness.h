#pragma once

#include <cstddef>
#include <string>
#include <vector>

struct TestCase {
  const char* name;
  void (*fn)();
};

void expect_true(bool condition, const std::string& message);
void expect_eq(size_t actual, size_t expected, const std::string& message);
void expect_eq(const std::string& actual, const std::string& expected, const std::string& message);

void register_lexer_tests(std::vector<TestCase>& tests);
void register_parser_tests(std::vector<TestCase>& tests);
void register_safety_tests(std::vector<TestCase>& tests);
void register_semantic_tests(std::vector<TestCase>& tests);
void register_reflect_tests(std::vector<TestCase>& tests);
void register_execution_tests(std::vector<TestCase>& tests);
void register_validator_tests(std::vector<TestCase>& tests);
void register_runner_tests(std::vector<TestCase>& tests);
void register_config_tests(std::vector<TestCase>& tests);
void register_cli_args_tests(std::vector<TestCase>& tests);
void register_cli_utils_tests(std::vector<TestCase>& tests);
