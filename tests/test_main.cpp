#include "test_framework.hpp"

#include <csignal>
#include <iostream>

void register_config_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_security_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_provider_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_synth_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_schema_rules_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_synthesizer_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_process_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_proxy_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_observability_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_bootstrap_tests(std::vector<clawboot::tests::TestCase> &tests);
void register_cli_tests(std::vector<clawboot::tests::TestCase> &tests);

int main() {
  // Ignore SIGPIPE to prevent crashes when output is piped
  std::signal(SIGPIPE, SIG_IGN);

  std::vector<clawboot::tests::TestCase> tests;
  register_config_tests(tests);
  register_security_tests(tests);
  register_provider_tests(tests);
  register_synth_tests(tests);
  register_schema_rules_tests(tests);
  register_synthesizer_tests(tests);
  register_process_tests(tests);
  register_proxy_tests(tests);
  register_observability_tests(tests);
  register_bootstrap_tests(tests);
  register_cli_tests(tests);

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
