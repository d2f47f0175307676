#include "gtest/gtest.h"
#include "result_aggregator.hpp"
#include "test_utilities.hpp"
#include "pugixml.hpp"

static const std::string passing_suite = R"(<?xml version="1.0" encoding="UTF-8"?>
<testsuites>
  <testsuite name="java" tests="2">
    <testcase classname="org.cellprofiler.ImageTest" name="test_load"/>
    <testcase classname="org.cellprofiler.ImageTest" name="test_save"/>
    <testcase classname="org.cellprofiler.ImageTest" name="test_slow"><skipped/></testcase>
  </testsuite>
</testsuites>
)";

static const std::string failing_suite = R"(<?xml version="1.0" encoding="UTF-8"?>
<testsuite name="cellprofiler" tests="3">
  <testcase classname="modules.identify" name="test_threshold"/>
  <testcase classname="modules.identify" name="test_segmentation">
    <failure message="expected 12 objects, found 11">Traceback (most recent call last)
AssertionError</failure>
  </testcase>
  <testcase classname="modules.measure" name="test_intensity"/>
</testsuite>
)";

class ResultAggregatorTest : public ::testing::Test {
protected:
  gantry::test::temporary_directory dir;
};

TEST_F(ResultAggregatorTest, CondenseKeepsOnlyFailures)
{
  gantry::test::write_file(dir.path / "cellprofiler.xml", failing_suite);
  const auto report = gantry::condense(dir.path / "cellprofiler.xml");

  EXPECT_TRUE(report.results_found);
  EXPECT_EQ(report.suite, "cellprofiler");
  EXPECT_EQ(report.total_cases, 3u);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].name, "test_segmentation");
  EXPECT_EQ(report.failures[0].classname, "modules.identify");
  EXPECT_EQ(report.failures[0].result, gantry::test_case_result::status::FAILED);
  EXPECT_EQ(report.failures[0].message, "expected 12 objects, found 11");
}

TEST_F(ResultAggregatorTest, SkippedCasesAreNotFailures)
{
  gantry::test::write_file(dir.path / "java.xml", passing_suite);
  const auto report = gantry::condense(dir.path / "java.xml");
  EXPECT_EQ(report.total_cases, 3u);
  EXPECT_TRUE(report.empty());
}

TEST_F(ResultAggregatorTest, AggregateNamesFailingCase)
{
  gantry::test::write_file(dir.path / "java.xml", passing_suite);
  gantry::test::write_file(dir.path / "cellprofiler.xml", failing_suite);

  const auto outcome = gantry::check_all_suites({ dir.path / "java.xml", dir.path / "cellprofiler.xml" });
  EXPECT_TRUE(outcome.failed());
  ASSERT_EQ(outcome.failures.size(), 1u);
  EXPECT_NE(outcome.message.find("test_segmentation"), std::string::npos);
}

TEST_F(ResultAggregatorTest, MissingResultsAreTolerated)
{
  gantry::test::write_file(dir.path / "java.xml", passing_suite);

  auto outcome = gantry::check_all_suites({ dir.path / "java.xml", dir.path / "matlab.xml" });
  EXPECT_FALSE(outcome.failed());
  ASSERT_EQ(outcome.missing.size(), 1u);
  EXPECT_EQ(outcome.missing[0], dir.path / "matlab.xml");

  gantry::test::write_file(dir.path / "cellprofiler.xml", failing_suite);
  outcome = gantry::check_all_suites({ dir.path / "java.xml", dir.path / "matlab.xml", dir.path / "cellprofiler.xml" });
  EXPECT_TRUE(outcome.failed());
  EXPECT_EQ(outcome.failures.size(), 1u);
  EXPECT_EQ(outcome.missing.size(), 1u);
}

TEST_F(ResultAggregatorTest, JsonResults)
{
  gantry::test::write_file(dir.path / "gui.json", R"({
    "suite": "gui",
    "cases": [
      { "name": "test_open_window", "status": "passed" },
      { "name": "test_menu", "status": "error", "message": "display not available" },
      { "name": "test_dialog", "status": "skipped" }
    ]
  })");

  const auto report = gantry::condense(dir.path / "gui.json");
  EXPECT_EQ(report.suite, "gui");
  EXPECT_EQ(report.total_cases, 3u);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].result, gantry::test_case_result::status::ERROR);
  EXPECT_EQ(report.failures[0].qualified_name(), "gui::test_menu");
}

TEST_F(ResultAggregatorTest, MalformedDocumentIsAnError)
{
  gantry::test::write_file(dir.path / "broken.xml", "<testsuite name=\"broken\"><testcase");
  const auto report = gantry::condense(dir.path / "broken.xml");
  EXPECT_TRUE(report.results_found);
  ASSERT_EQ(report.failures.size(), 1u);
  EXPECT_EQ(report.failures[0].name, "broken.xml");
  EXPECT_EQ(report.failures[0].result, gantry::test_case_result::status::ERROR);
}

TEST_F(ResultAggregatorTest, WriteFailureReport)
{
  gantry::test::write_file(dir.path / "cellprofiler.xml", failing_suite);
  const auto report  = gantry::condense(dir.path / "cellprofiler.xml");
  const auto written = gantry::write_failure_report(report, dir.path / "results");
  ASSERT_TRUE(written.has_value());
  EXPECT_EQ(*written, dir.path / "results" / "cellprofiler-failures.xml");

  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_file(written->c_str()));
  auto root = doc.child("failures");
  EXPECT_STREQ(root.attribute("suite").as_string(), "cellprofiler");
  EXPECT_EQ(root.attribute("failures").as_uint(), 1u);
  auto testcase = root.child("testcase");
  EXPECT_STREQ(testcase.attribute("name").as_string(), "test_segmentation");
  EXPECT_STREQ(testcase.attribute("status").as_string(), "failure");
  EXPECT_STREQ(testcase.child_value("message"), "expected 12 objects, found 11");
}
