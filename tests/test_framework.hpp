#pragma once

#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

namespace clawboot::tests {

struct TestCase {
  std::string name;
  std::function<void()> fn;
};

inline void require(bool condition, const std::string &message) {
  if (!condition) {
    throw std::runtime_error(message);
  }
}

/// Exact text comparison; the failure shows both sides so snippet and
/// document mismatches are readable in the runner output.
inline void require_eq(const std::string &actual, const std::string &expected,
                       const std::string &message) {
  if (actual != expected) {
    throw std::runtime_error(message + "\n  expected: [" + expected + "]\n  actual:   [" + actual +
                             "]");
  }
}

inline void require_contains(const std::string &haystack, const std::string &needle,
                             const std::string &message) {
  if (haystack.find(needle) == std::string::npos) {
    throw std::runtime_error(message + " (missing '" + needle + "')");
  }
}

inline void require_absent(const std::string &haystack, const std::string &needle,
                           const std::string &message) {
  if (haystack.find(needle) != std::string::npos) {
    throw std::runtime_error(message);
  }
}

} // namespace clawboot::tests
