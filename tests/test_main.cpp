#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_common_tests(std::vector<trustgate::tests::TestCase> &tests);
void register_config_tests(std::vector<trustgate::tests::TestCase> &tests);
void register_observability_tests(std::vector<trustgate::tests::TestCase> &tests);
void register_signature_tests(std::vector<trustgate::tests::TestCase> &tests);
void register_hasher_tests(std::vector<trustgate::tests::TestCase> &tests);
void register_sanitize_tests(std::vector<trustgate::tests::TestCase> &tests);
void register_import_schema_tests(std::vector<trustgate::tests::TestCase> &tests);
void register_reputation_tests(std::vector<trustgate::tests::TestCase> &tests);
void register_batch_tests(std::vector<trustgate::tests::TestCase> &tests);

int main() {
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<trustgate::tests::TestCase> tests;
  register_common_tests(tests);
  register_config_tests(tests);
  register_observability_tests(tests);
  register_signature_tests(tests);
  register_hasher_tests(tests);
  register_sanitize_tests(tests);
  register_import_schema_tests(tests);
  register_reputation_tests(tests);
  register_batch_tests(tests);

  std::size_t passed = 0;
  std::size_t failed = 0;

  for (const auto &test : tests) {
    try {
      test.fn();
      ++passed;
    } catch (const std::exception &ex) {
      ++failed;
      std::cerr << "[FAIL] " << test.name << ": " << ex.what() << "\n";
    }
  }

  std::cout << "Ran " << tests.size() << " tests: " << passed << " passed, " << failed
            << " failed\n";

  return failed == 0 ? 0 : 1;
}
