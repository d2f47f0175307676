#include "result_aggregator.hpp"
#include "gantry.hpp"
#include "gantry_errors.hpp"
#include "utilities.hpp"
#include "pugixml.hpp"
#include "nlohmann/json.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cctype>

namespace gantry {

std::string test_case_result::qualified_name() const
{
  std::string qualified = suite + "::";
  if (!classname.empty() && classname != suite)
    qualified += classname + ".";
  return qualified + name;
}

const char *to_string(test_case_result::status status)
{
  switch (status) {
    case test_case_result::status::PASSED:
      return "passed";
    case test_case_result::status::FAILED:
      return "failure";
    case test_case_result::status::ERROR:
      return "error";
    case test_case_result::status::SKIPPED:
      return "skipped";
  }
  return "unknown";
}

static test_case_result::status parse_status(std::string text)
{
  std::transform(text.begin(), text.end(), text.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  if (text == "fail" || text == "failed" || text == "failure")
    return test_case_result::status::FAILED;
  if (text == "error" || text == "errored")
    return test_case_result::status::ERROR;
  if (text == "skip" || text == "skipped" || text == "ignored")
    return test_case_result::status::SKIPPED;
  if (text == "pass" || text == "passed" || text == "ok" || text == "success")
    return test_case_result::status::PASSED;
  throw error("Unknown test case status '" + text + "'");
}

static void load_junit_suite(const pugi::xml_node &suite_node, const std::string &default_suite, std::vector<test_case_result> &cases)
{
  const std::string suite_name = suite_node.attribute("name").empty() ? default_suite : suite_node.attribute("name").as_string();

  for (const auto &case_node: suite_node.children("testcase")) {
    test_case_result result;
    result.suite     = suite_name;
    result.name      = case_node.attribute("name").as_string();
    result.classname = case_node.attribute("classname").as_string();

    pugi::xml_node outcome;
    if ((outcome = case_node.child("failure"))) {
      result.result = test_case_result::status::FAILED;
    } else if ((outcome = case_node.child("error"))) {
      result.result = test_case_result::status::ERROR;
    } else if ((outcome = case_node.child("skipped"))) {
      result.result = test_case_result::status::SKIPPED;
    }
    if (outcome) {
      result.message = outcome.attribute("message").as_string();
      result.details = outcome.child_value();
      if (result.message.empty())
        result.message = result.details.substr(0, result.details.find('\n'));
    }
    cases.push_back(result);
  }

  // Nested suites as written by some runners
  for (const auto &nested: suite_node.children("testsuite"))
    load_junit_suite(nested, suite_name, cases);
}

static std::vector<test_case_result> load_junit_results(const fs::path &path)
{
  pugi::xml_document doc;
  const pugi::xml_parse_result parse_result = doc.load_file(path.c_str());
  if (!parse_result)
    throw error("Failed to parse '" + path.generic_string() + "': " + parse_result.description());

  std::vector<test_case_result> cases;
  const auto default_suite = path.stem().string();
  if (auto root = doc.child("testsuites")) {
    for (const auto &suite_node: root.children("testsuite"))
      load_junit_suite(suite_node, root.attribute("name").empty() ? default_suite : root.attribute("name").as_string(), cases);
  } else if (auto suite_node = doc.child("testsuite")) {
    load_junit_suite(suite_node, default_suite, cases);
  } else {
    throw error("'" + path.generic_string() + "' is not a test suite document");
  }
  return cases;
}

static void load_json_suite(const nlohmann::json &suite_node, const std::string &default_suite, std::vector<test_case_result> &cases)
{
  const auto suite_name = suite_node.value("suite", default_suite);
  if (!suite_node.contains("cases") || !suite_node["cases"].is_array())
    throw error("Suite '" + suite_name + "' has no 'cases' list");

  for (const auto &case_node: suite_node["cases"]) {
    test_case_result result;
    result.suite     = suite_name;
    result.name      = case_node.value("name", "");
    result.classname = case_node.value("classname", "");
    result.result    = parse_status(case_node.value("status", "passed"));
    result.message   = case_node.value("message", "");
    result.details   = case_node.value("details", "");
    cases.push_back(result);
  }
}

static std::vector<test_case_result> load_json_results(const fs::path &path)
{
  auto contents = get_file_contents<std::string>(path);
  if (!contents)
    throw error("Failed to read '" + path.generic_string() + "': " + contents.error().message());

  nlohmann::json document;
  try {
    document = nlohmann::json::parse(*contents);
  } catch (const nlohmann::json::exception &e) {
    throw error("Failed to parse '" + path.generic_string() + "': " + e.what());
  }

  std::vector<test_case_result> cases;
  const auto default_suite = path.stem().string();
  try {
    if (document.is_array()) {
      for (const auto &suite_node: document)
        load_json_suite(suite_node, default_suite, cases);
    } else if (document.contains("suites")) {
      for (const auto &suite_node: document["suites"])
        load_json_suite(suite_node, default_suite, cases);
    } else {
      load_json_suite(document, default_suite, cases);
    }
  } catch (const nlohmann::json::exception &e) {
    throw error("Malformed test results in '" + path.generic_string() + "': " + e.what());
  }
  return cases;
}

std::vector<test_case_result> load_suite_results(const fs::path &suite_result_path)
{
  if (suite_result_path.extension() == ".json")
    return load_json_results(suite_result_path);
  return load_junit_results(suite_result_path);
}

failure_report condense(const fs::path &suite_result_path)
{
  failure_report report;
  report.source = suite_result_path;
  report.suite  = suite_result_path.stem().string();

  std::error_code ec;
  if (!fs::exists(suite_result_path, ec)) {
    spdlog::info("No test results at {}", suite_result_path.generic_string());
    return report;
  }
  report.results_found = true;

  try {
    const auto cases = load_suite_results(suite_result_path);
    report.total_cases = cases.size();
    if (!cases.empty())
      report.suite = cases.front().suite;
    std::copy_if(cases.begin(), cases.end(), std::back_inserter(report.failures), [](const test_case_result &c) {
      return c.result == test_case_result::status::FAILED || c.result == test_case_result::status::ERROR;
    });
  } catch (const error &e) {
    spdlog::error("{}", e.what());
    test_case_result unreadable;
    unreadable.suite   = report.suite;
    unreadable.name    = suite_result_path.filename().string();
    unreadable.result  = test_case_result::status::ERROR;
    unreadable.message = e.what();
    report.failures.push_back(unreadable);
  }

  spdlog::info("{}: {} cases, {} failing", report.suite, report.total_cases, report.failures.size());
  return report;
}

aggregate_outcome check_all_suites(const std::vector<fs::path> &paths)
{
  aggregate_outcome outcome;
  for (const auto &path: paths) {
    auto report = condense(path);
    if (!report.results_found)
      outcome.missing.push_back(path);
    outcome.failures.insert(outcome.failures.end(), report.failures.begin(), report.failures.end());
    outcome.reports.push_back(std::move(report));
  }

  if (outcome.failed()) {
    constexpr size_t listed_limit = 10;
    outcome.message = std::to_string(outcome.failures.size()) + " failing test case(s):";
    for (size_t i = 0; i < outcome.failures.size() && i < listed_limit; ++i) {
      const auto &f = outcome.failures[i];
      outcome.message += "\n  " + f.qualified_name() + " [" + to_string(f.result) + "]";
      if (!f.message.empty())
        outcome.message += " " + f.message;
    }
    if (outcome.failures.size() > listed_limit)
      outcome.message += "\n  ... and " + std::to_string(outcome.failures.size() - listed_limit) + " more";
  } else {
    outcome.message = "All test suites passed";
  }
  return outcome;
}

std::expected<fs::path, std::error_code> write_failure_report(const failure_report &report, const fs::path &directory)
{
  std::error_code ec;
  fs::create_directories(directory, ec);
  if (ec)
    return std::unexpected(ec);

  pugi::xml_document doc;
  auto declaration                        = doc.append_child(pugi::node_declaration);
  declaration.append_attribute("version")  = "1.0";
  declaration.append_attribute("encoding") = "UTF-8";

  auto root                          = doc.append_child("failures");
  root.append_attribute("suite")     = report.suite.c_str();
  root.append_attribute("source")    = report.source.generic_string().c_str();
  root.append_attribute("tests")     = static_cast<unsigned int>(report.total_cases);
  root.append_attribute("failures")  = static_cast<unsigned int>(report.failures.size());
  for (const auto &f: report.failures) {
    auto node                       = root.append_child("testcase");
    node.append_attribute("suite")     = f.suite.c_str();
    node.append_attribute("classname") = f.classname.c_str();
    node.append_attribute("name")      = f.name.c_str();
    node.append_attribute("status")    = to_string(f.result);
    if (!f.message.empty())
      node.append_child("message").text().set(f.message.c_str());
    if (!f.details.empty())
      node.append_child("details").text().set(f.details.c_str());
  }

  const auto path = directory / (sanitize_filename(report.suite) + failure_report_suffix);
  if (!doc.save_file(path.c_str()))
    return std::unexpected(std::make_error_code(std::errc::io_error));
  return path;
}

} // namespace gantry
