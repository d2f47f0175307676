#include "gtest/gtest.h"
#include "task_engine.hpp"
#include "gantry_errors.hpp"
#include "test_utilities.hpp"
#include <thread>

using namespace std::chrono_literals;

class TaskEngineTest : public ::testing::Test {
protected:
  gantry::test::temporary_directory dir;
  gantry::workspace workspace;
  std::unique_ptr<gantry::project> project;

  void create(const std::string &pipeline_text)
  {
    workspace.workspace_path = dir.path;
    project                  = std::make_unique<gantry::project>(gantry::pipeline::parse(pipeline_text, dir.path), workspace, gantry::platform{ "linux", "x86_64" });
  }

  void load(const std::string &pipeline_text, const std::vector<std::string> &entries = { "build" })
  {
    create(pipeline_text);
    project->resolve_properties();
    project->resolve_tasks(entries);
  }

  gantry::task_state state(const gantry::task_engine &engine, const std::string &key)
  {
    const auto *record = engine.record(key);
    EXPECT_NE(record, nullptr) << key;
    return record ? record->state : gantry::task_state::PENDING;
  }
};

TEST_F(TaskEngineTest, SharedDependencyRunsOnce)
{
  load(R"(
tasks:
  build:
    depends: [test]
  test:
    depends: [check-tests, test-java]
  check-tests:
    depends: [test-cellprofiler]
  test-cellprofiler:
    depends: [external-dependencies]
    process:
      - exec: "echo cellprofiler >> suites.txt"
  test-java:
    depends: [external-dependencies]
    process:
      - exec: "echo java >> suites.txt"
  external-dependencies:
    process:
      - exec: "echo fetched >> dependencies.txt"
)");
  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));

  EXPECT_EQ(gantry::test::count_lines(dir.path / "dependencies.txt"), 1u);
  EXPECT_EQ(gantry::test::read_file(dir.path / "suites.txt"), "cellprofiler\njava\n");
  for (const auto &name: { "build", "test", "check-tests", "test-cellprofiler", "test-java", "external-dependencies" })
    EXPECT_EQ(state(engine, name), gantry::task_state::SUCCEEDED) << name;

  // Running again within the same build returns the recorded outcome
  EXPECT_EQ(engine.run_task("external-dependencies").state, gantry::task_state::SUCCEEDED);
  EXPECT_EQ(gantry::test::count_lines(dir.path / "dependencies.txt"), 1u);
}

TEST_F(TaskEngineTest, SkippedTaskSatisfiesDependents)
{
  load(R"(
tasks:
  build:
    depends: [installer]
    process:
      - exec: "echo packaged > packaged.txt"
  installer:
    if: make.installer
    process:
      - exec: "echo built > installer.txt"
)");
  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));

  EXPECT_EQ(state(engine, "installer"), gantry::task_state::SKIPPED);
  EXPECT_EQ(state(engine, "build"), gantry::task_state::SUCCEEDED);
  EXPECT_FALSE(fs::exists(dir.path / "installer.txt"));
  EXPECT_TRUE(fs::exists(dir.path / "packaged.txt"));
}

TEST_F(TaskEngineTest, GuardIsEvaluatedBeforeDependencies)
{
  create(R"(
tasks:
  build:
    depends: [sign]
  sign:
    unless: skip.signing
    depends: [certificate]
  certificate:
    process:
      - exec: "touch certificate.txt"
)");
  project->add_override("skip.signing", "");
  project->resolve_properties();
  project->resolve_tasks({ "build" });

  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));
  EXPECT_EQ(state(engine, "sign"), gantry::task_state::SKIPPED);
  EXPECT_EQ(state(engine, "certificate"), gantry::task_state::PENDING);
  EXPECT_FALSE(fs::exists(dir.path / "certificate.txt"));
}

TEST_F(TaskEngineTest, FailFastStopsLaterSiblings)
{
  load(R"(
tasks:
  build:
    depends: [compile, test]
  compile:
    process:
      - exec: "echo compiler error; exit 3"
  test:
    process:
      - exec: "touch tested.txt"
)");
  gantry::task_engine engine(*project);
  EXPECT_FALSE(engine.run({ "build" }));

  EXPECT_EQ(state(engine, "compile"), gantry::task_state::FAILED);
  EXPECT_EQ(state(engine, "build"), gantry::task_state::FAILED);
  EXPECT_EQ(state(engine, "test"), gantry::task_state::PENDING);
  EXPECT_FALSE(fs::exists(dir.path / "tested.txt"));
  EXPECT_TRUE(engine.abort_build);
  EXPECT_TRUE(engine.build_failed());

  const auto *failure = engine.first_failure();
  ASSERT_NE(failure, nullptr);
  EXPECT_EQ(failure->key, "compile");
  EXPECT_NE(failure->error.find("returned 3"), std::string::npos);
  EXPECT_NE(failure->output.find("compiler error"), std::string::npos);
}

TEST_F(TaskEngineTest, KeepGoingRunsUnrelatedTasks)
{
  load(R"(
tasks:
  build:
    depends: [compile, test]
  compile:
    process:
      - exec: "exit 1"
  test:
    process:
      - exec: "touch tested.txt"
)");
  gantry::task_engine::options options;
  options.fail_fast = false;
  gantry::task_engine engine(*project, options);
  EXPECT_FALSE(engine.run({ "build" }));

  EXPECT_EQ(state(engine, "compile"), gantry::task_state::FAILED);
  EXPECT_EQ(state(engine, "test"), gantry::task_state::SUCCEEDED);
  EXPECT_EQ(state(engine, "build"), gantry::task_state::FAILED);
  EXPECT_EQ(engine.record("build")->error, "dependency 'compile' failed");
  EXPECT_TRUE(fs::exists(dir.path / "tested.txt"));
}

TEST_F(TaskEngineTest, FailSoftTaskDoesNotStopTheBuild)
{
  load(R"(
tasks:
  build:
    depends: [clean, compile]
  clean:
    failonerror: false
    process:
      - exec: "exit 2"
  compile:
    process:
      - exec: "touch compiled.txt"
)");
  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));

  EXPECT_EQ(state(engine, "clean"), gantry::task_state::FAILED);
  EXPECT_EQ(state(engine, "build"), gantry::task_state::SUCCEEDED);
  EXPECT_FALSE(engine.build_failed());
  EXPECT_EQ(engine.first_failure(), nullptr);
  EXPECT_TRUE(fs::exists(dir.path / "compiled.txt"));
}

TEST_F(TaskEngineTest, CallsWithBindingsFanOut)
{
  load(R"(
tasks:
  build:
    process:
      - call:
          task: test-suite
          with:
            - suite: core
            - suite: gui
      - call:
          task: test-suite
          with:
            suite: core
  test-suite:
    depends: [setup]
    process:
      - exec: "echo {{ suite }} >> suites.txt"
  setup:
    process:
      - exec: "echo setup >> setup.txt"
)");
  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));

  EXPECT_EQ(gantry::test::read_file(dir.path / "suites.txt"), "core\ngui\n");
  EXPECT_EQ(gantry::test::count_lines(dir.path / "setup.txt"), 1u);
  EXPECT_EQ(state(engine, "test-suite(suite=core)"), gantry::task_state::SUCCEEDED);
  EXPECT_EQ(state(engine, "test-suite(suite=gui)"), gantry::task_state::SUCCEEDED);
  EXPECT_EQ(engine.record("test-suite"), nullptr);
  EXPECT_EQ(engine.count(gantry::task_state::PENDING), 0u);
  EXPECT_EQ(project->properties.scope_depth(), 0u);
  EXPECT_FALSE(project->properties.contains("suite"));
}

TEST_F(TaskEngineTest, CallScopeIsReleasedOnFailure)
{
  load(R"(
tasks:
  build:
    process:
      - call:
          task: test-suite
          with:
            suite: core
      - exec: "touch after.txt"
  test-suite:
    process:
      - exec: "exit 1"
)");
  gantry::task_engine engine(*project);
  EXPECT_FALSE(engine.run({ "build" }));

  EXPECT_EQ(state(engine, "test-suite(suite=core)"), gantry::task_state::FAILED);
  EXPECT_EQ(state(engine, "build"), gantry::task_state::FAILED);
  EXPECT_EQ(project->properties.scope_depth(), 0u);
  EXPECT_FALSE(fs::exists(dir.path / "after.txt"));
}

TEST_F(TaskEngineTest, MissingPropertyFailsTheTask)
{
  load(R"(
tasks:
  build:
    process:
      - exec: "{{ java.home }}/bin/java -version"
)");
  gantry::task_engine engine(*project);
  EXPECT_FALSE(engine.run({ "build" }));
  EXPECT_NE(engine.record("build")->error.find("java.home"), std::string::npos);
}

TEST_F(TaskEngineTest, ExecEnvironmentOverrides)
{
  load(R"(
properties:
  - name: suite.name
    value: segmentation
tasks:
  build:
    process:
      - exec:
          executable: /bin/sh
          args: ["-c", "echo $SUITE-$HOME_IS_SET > env.txt"]
          dir: "{{ gantry.pipeline.dir }}"
          env:
            SUITE: "{{ suite.name }}"
            HOME_IS_SET: "yes"
)");
  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));
  EXPECT_EQ(gantry::test::read_file(dir.path / "env.txt"), "segmentation-yes\n");
}

TEST_F(TaskEngineTest, TimeoutTerminatesTheProcess)
{
  load(R"(
tasks:
  build:
    process:
      - exec:
          executable: sleep
          args: ["10"]
          timeout: 0.2
)");
  gantry::task_engine engine(*project);
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(engine.run({ "build" }));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_EQ(state(engine, "build"), gantry::task_state::FAILED);
  EXPECT_NE(engine.record("build")->error.find("timed out"), std::string::npos);
}

TEST_F(TaskEngineTest, TimeoutStopsChildrenOfTheShell)
{
  load(R"(
tasks:
  build:
    process:
      - exec: "sleep 10; true"
)");
  gantry::task_engine engine(*project, { .fail_fast = true, .default_timeout = 200ms });
  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(engine.run({ "build" }));
  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_EQ(state(engine, "build"), gantry::task_state::FAILED);
  EXPECT_NE(engine.record("build")->error.find("timed out"), std::string::npos);
}

TEST_F(TaskEngineTest, NonPositiveTimeoutIsRejected)
{
  load(R"(
tasks:
  build:
    process:
      - exec:
          executable: "true"
          timeout: -1
)");
  gantry::task_engine engine(*project);
  EXPECT_FALSE(engine.run({ "build" }));
  EXPECT_NE(engine.record("build")->error.find("positive number"), std::string::npos);
}

TEST_F(TaskEngineTest, PropertiesAreTheProcessEnvironment)
{
  load(R"(
properties:
  - name: greeting
    value: hello
  - name: suite
    value: none
tasks:
  build:
    process:
      - call:
          task: report
          with:
            suite: core
      - exec:
          executable: /bin/sh
          args: ["-c", "echo $greeting > override.txt"]
          env:
            greeting: hi
  report:
    process:
      - exec: 'echo "$greeting $suite" > report.txt'
)");
  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));
  EXPECT_EQ(gantry::test::read_file(dir.path / "report.txt"), "hello core\n");
  EXPECT_EQ(gantry::test::read_file(dir.path / "override.txt"), "hi\n");
}

TEST_F(TaskEngineTest, CancellationLeavesRemainingTasksPending)
{
  load(R"(
tasks:
  build:
    depends: [slow, after]
  slow:
    process:
      - exec:
          executable: sleep
          args: ["10"]
  after:
    process:
      - exec: "touch after.txt"
)");
  gantry::task_engine engine(*project);
  std::thread canceller([&engine]() {
    std::this_thread::sleep_for(300ms);
    engine.cancel();
  });

  const auto start = std::chrono::steady_clock::now();
  EXPECT_FALSE(engine.run({ "build" }));
  canceller.join();

  EXPECT_LT(std::chrono::steady_clock::now() - start, 5s);
  EXPECT_TRUE(engine.is_cancelled());
  EXPECT_EQ(state(engine, "slow"), gantry::task_state::FAILED);
  EXPECT_EQ(state(engine, "after"), gantry::task_state::PENDING);
  EXPECT_FALSE(fs::exists(dir.path / "after.txt"));
}

TEST_F(TaskEngineTest, AliasWithoutVariantIsSkipped)
{
  load(R"(
tasks:
  build:
    depends: [package]
    process:
      - exec: "touch built.txt"
  package-mac:
    process:
      - exec: "touch dmg.txt"
aliases:
  package:
    macos: package-mac
)");
  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));
  EXPECT_EQ(state(engine, "package"), gantry::task_state::SKIPPED);
  EXPECT_TRUE(fs::exists(dir.path / "built.txt"));
  EXPECT_FALSE(fs::exists(dir.path / "dmg.txt"));
}

TEST_F(TaskEngineTest, FailCommand)
{
  load(R"(
properties:
  - name: have.java
    value: "yes"
    if:
      file_exists: jdk
tasks:
  build:
    process:
      - fail:
          message: "A JDK is required"
          unless: have.java
)");
  gantry::task_engine engine(*project);
  EXPECT_FALSE(engine.run({ "build" }));
  EXPECT_EQ(engine.record("build")->error, "A JDK is required");
}

TEST_F(TaskEngineTest, RecordsInCompletionOrder)
{
  load(R"(
tasks:
  build:
    depends: [a, b]
  a:
    process:
      - echo: "a"
  b:
    process:
      - echo: "b"
)");
  gantry::task_engine engine(*project);
  EXPECT_TRUE(engine.run({ "build" }));

  std::vector<std::string> keys;
  for (const auto *r: engine.records())
    keys.push_back(r->key);
  EXPECT_EQ(keys, (std::vector<std::string>{ "a", "b", "build" }));
  EXPECT_EQ(engine.record("a")->output, "a");
}
