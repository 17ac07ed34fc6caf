#pragma once

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace matricx::minitest {

struct Failure final : std::exception {
  std::string message;

  explicit Failure(std::string msg) : message(std::move(msg)) {}

  const char* what() const noexcept override { return message.c_str(); }
};

using TestFn = void (*)();

struct TestCase {
  std::string_view name;
  TestFn fn;
};

inline std::vector<TestCase>& registry() {
  static std::vector<TestCase> tests;
  return tests;
}

inline bool registerTest(std::string_view name, TestFn fn) {
  registry().push_back(TestCase{name, fn});
  return true;
}

inline std::string location(const char* file, int line) {
  return std::string(" (") + file + ":" + std::to_string(line) + ")";
}

// Runs every registered test whose name contains `filter` (all when empty).
inline int runAll(std::string_view filter = {}) {
  int failed = 0;
  int ran = 0;
  for (const auto& t : registry()) {
    if (!filter.empty() && t.name.find(filter) == std::string_view::npos) continue;
    ++ran;
    try {
      t.fn();
      std::cout << "[PASS] " << t.name << "\n";
    } catch (const Failure& f) {
      ++failed;
      std::cout << "[FAIL] " << t.name << "\n";
      std::cout << "       " << f.what() << "\n";
    } catch (const std::exception& e) {
      ++failed;
      std::cout << "[FAIL] " << t.name << "\n";
      std::cout << "       unhandled std::exception: " << e.what() << "\n";
    } catch (...) {
      ++failed;
      std::cout << "[FAIL] " << t.name << "\n";
      std::cout << "       unhandled unknown exception\n";
    }
  }

  if (failed == 0) {
    std::cout << "All tests passed (" << ran << ")\n";
    return 0;
  }

  std::cout << failed << " test(s) failed (" << ran << " run)\n";
  return 1;
}

}  // namespace matricx::minitest

#define MATRICX_MINITEST_CONCAT_IMPL(a, b) a##b
#define MATRICX_MINITEST_CONCAT(a, b) MATRICX_MINITEST_CONCAT_IMPL(a, b)

#define MATRICX_MINITEST_TEST_CASE_IMPL(id, name_literal)                                  \
  static void MATRICX_MINITEST_CONCAT(matricx_minitest_fn_, id)();                         \
  static const bool MATRICX_MINITEST_CONCAT(matricx_minitest_reg_, id) =                   \
      ::matricx::minitest::registerTest((name_literal),                                    \
                                        &MATRICX_MINITEST_CONCAT(matricx_minitest_fn_, id)); \
  static void MATRICX_MINITEST_CONCAT(matricx_minitest_fn_, id)()

#define TEST_CASE(name_literal) MATRICX_MINITEST_TEST_CASE_IMPL(__COUNTER__, name_literal)

#define REQUIRE(...)                                                                      \
  do {                                                                                    \
    if (!(__VA_ARGS__)) {                                                                 \
      throw ::matricx::minitest::Failure(std::string("REQUIRE failed: ") + #__VA_ARGS__ + \
                                         ::matricx::minitest::location(__FILE__, __LINE__)); \
    }                                                                                     \
  } while (0)

#define REQUIRE_FALSE(...)                                                                      \
  do {                                                                                          \
    if ((__VA_ARGS__)) {                                                                        \
      throw ::matricx::minitest::Failure(std::string("REQUIRE_FALSE failed: ") + #__VA_ARGS__ + \
                                         ::matricx::minitest::location(__FILE__, __LINE__));    \
    }                                                                                           \
  } while (0)

#define REQUIRE_THROWS_AS(expr, exception_type)                                          \
  do {                                                                                   \
    bool matricx_minitest_threw = false;                                                 \
    try {                                                                                \
      (void)(expr);                                                                      \
    } catch (const exception_type&) {                                                    \
      matricx_minitest_threw = true;                                                     \
    }                                                                                    \
    if (!matricx_minitest_threw) {                                                       \
      throw ::matricx::minitest::Failure(std::string("REQUIRE_THROWS_AS failed: ") +     \
                                         #expr " did not throw " #exception_type +       \
                                         ::matricx::minitest::location(__FILE__, __LINE__)); \
    }                                                                                    \
  } while (0)
