#pragma once

// rlreward/harness.hpp - Test program instrumentation (run-all-assertions mode).
//
// A reference test program defines `check(candidate)` with bare assertions and
// normally dies on the first failing one. wrap_tests() rewrites it line by line
// so that every assertion runs and reports:
//
//   def check(candidate):                  def check(candidate):
//       assert candidate(1, 2) == 3            _results = []
//       assert candidate(0, 0) == 0            try:
//                                                  assert candidate(1, 2) == 3
//                                                  _results.append(True)
//                                              except:
//                                                  _results.append(False)
//                                              ...
//                                              return _results
//
//                                          _test_results = check(add)
//                                          ...
//                                          print(f"TESTS_PASSED:{_passed}/{_total}")
//                                          exit(0 if _passed == _total else 1)
//
// The transformation is textual with explicit indentation tracking; it never
// parses or executes the program. A program with no assertion statements is
// returned byte-for-byte unchanged.

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace rlreward {

// Marker printed by the instrumented driver. Fixed interoperability contract.
inline constexpr std::string_view kTestsPassedMarker = "TESTS_PASSED:";

std::string wrap_tests(std::string_view test_program, std::string_view entry_point);

// Number of assertion statements wrap_tests() would guard inside check().
std::size_t count_guarded_assertions(std::string_view test_program);

struct TestSummary {
  std::uint64_t passed{0};
  std::uint64_t total{0};
};

// Parses the LAST well-formed TESTS_PASSED:<passed>/<total> occurrence in
// `output`. Returns nullopt when absent or when passed > total.
std::optional<TestSummary> parse_test_summary(std::string_view output);

}  // namespace rlreward
