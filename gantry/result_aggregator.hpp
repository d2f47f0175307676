#pragma once

#include <expected>
#include <filesystem>
#include <string>
#include <system_error>
#include <vector>

namespace gantry {

struct test_case_result {
  enum class status { PASSED, FAILED, ERROR, SKIPPED };

  std::string suite;
  std::string classname;
  std::string name;
  status result = status::PASSED;
  std::string message;
  std::string details;

  /** @brief suite::classname.name, or suite::name without a class */
  std::string qualified_name() const;
};

const char *to_string(test_case_result::status status);

/**
 * @brief Failing and erroring cases of one suite result document
 */
struct failure_report {
  std::string suite;
  std::filesystem::path source;
  bool results_found = false;
  size_t total_cases = 0;
  std::vector<test_case_result> failures;

  bool empty() const
  {
    return failures.empty();
  }
};

struct aggregate_outcome {
  std::vector<failure_report> reports;
  std::vector<test_case_result> failures;
  std::vector<std::filesystem::path> missing;
  std::string message;

  bool failed() const
  {
    return !failures.empty();
  }
};

/**
 * @brief Read every test case of a suite result document
 *
 * JUnit XML (<testsuites>, <testsuite>, <testcase>) and JSON documents of the form
 * { "suite": name, "cases": [ { "name", "status", "message" } ] } are accepted.
 *
 * @throw error if the document exists but cannot be parsed
 */
std::vector<test_case_result> load_suite_results(const std::filesystem::path &suite_result_path);

/**
 * @brief Keep only failing and erroring cases
 *
 * A missing document yields an empty report with results_found = false. A document that cannot
 * be parsed yields a single error case named after the file.
 */
failure_report condense(const std::filesystem::path &suite_result_path);

/**
 * @brief Condense every document and union the failures
 *
 * Missing documents are recorded in `missing` and are not failures.
 */
aggregate_outcome check_all_suites(const std::vector<std::filesystem::path> &paths);

/**
 * @brief Write the condensed report as <directory>/<suite>-failures.xml
 * @return The path of the written document
 */
std::expected<std::filesystem::path, std::error_code> write_failure_report(const failure_report &report, const std::filesystem::path &directory);

} // namespace gantry
