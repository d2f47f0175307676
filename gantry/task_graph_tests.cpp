#include "gtest/gtest.h"
#include "task_graph.hpp"
#include "gantry_errors.hpp"

class TaskGraphTest : public ::testing::Test {
protected:
  gantry::task_graph graph;

  void add(const std::string &name, const nlohmann::json &node = nullptr)
  {
    graph.add_task(gantry::task::parse(name, node));
  }
};

TEST_F(TaskGraphTest, ParseTask)
{
  const auto t = gantry::task::parse("package-mac",
                                     { { "description", "Build the disk image" },
                                       { "depends", { "compile", "test" } },
                                       { "if", "make.installer" },
                                       { "failonerror", false },
                                       { "process", { { { "exec", "make dmg" } }, { { "call", { { "task", "sign" }, { "with", { { "identity", "dev" } } } } } } } } });
  EXPECT_EQ(t.description, "Build the disk image");
  EXPECT_EQ(t.dependencies, (std::vector<std::string>{ "compile", "test" }));
  EXPECT_EQ(t.if_property, "make.installer");
  EXPECT_FALSE(t.fail_on_error);
  EXPECT_TRUE(t.has_guard());
  EXPECT_TRUE(t.call_targets.empty());
  EXPECT_EQ(t.scoped_call_targets, std::vector<std::string>{ "sign" });
}

TEST_F(TaskGraphTest, MalformedAction)
{
  EXPECT_THROW(gantry::task::parse("bad", { { "process", { { { "exec", "a" }, { "echo", "b" } } } } }), gantry::pipeline_error);
  EXPECT_THROW(gantry::task::parse("bad", { { "process", { { { "call", 42 } } } } }), gantry::pipeline_error);
}

TEST_F(TaskGraphTest, DuplicateNames)
{
  add("build");
  EXPECT_THROW(add("build"), gantry::pipeline_error);
  EXPECT_THROW(graph.add_alias(gantry::task_alias::parse("build", { { "default", "build" } })), gantry::pipeline_error);
}

TEST_F(TaskGraphTest, UnknownReferences)
{
  add("build", { { "depends", { "compile" } } });
  graph.resolve_aliases({ "linux", "x86_64" });
  EXPECT_THROW(graph.validate({ "build" }), gantry::pipeline_error);

  add("compile", { { "process", { { { "call", "generate" } } } } });
  EXPECT_THROW(graph.validate({ "build" }), gantry::pipeline_error);

  add("generate");
  EXPECT_NO_THROW(graph.validate({ "build" }));
  EXPECT_THROW(graph.validate({ "deploy" }), gantry::pipeline_error);
}

TEST_F(TaskGraphTest, DependencyCycle)
{
  add("build", { { "depends", { "test" } } });
  add("test", { { "depends", { "compile" } } });
  add("compile", { { "depends", { "build" } } });
  graph.resolve_aliases({ "linux", "x86_64" });

  try {
    graph.validate({ "build" });
    FAIL() << "Expected cyclic_dependency_error";
  } catch (const gantry::cyclic_dependency_error &e) {
    EXPECT_EQ(e.cycle(), (std::vector<std::string>{ "build", "test", "compile", "build" }));
  }
}

TEST_F(TaskGraphTest, CallCycleThroughAlias)
{
  add("package", { { "process", { { { "call", "installer" } } } } });
  add("installer-linux", { { "depends", { "package" } } });
  graph.add_alias(gantry::task_alias::parse("installer", { { "linux", "installer-linux" } }));
  graph.resolve_aliases({ "linux", "x86_64" });
  EXPECT_THROW(graph.validate({ "package" }), gantry::cyclic_dependency_error);
}

TEST_F(TaskGraphTest, AliasSelection)
{
  const auto alias = gantry::task_alias::parse("package",
                                               { { "darwin-aarch64", "package-mac-arm" },
                                                 { "macos", "package-mac" },
                                                 { "windows", "package-windows" },
                                                 { "unix", "package-tarball" },
                                                 { "default", "package-none" } });
  EXPECT_EQ(alias.select({ "macos", "arm64" }), "package-mac-arm");
  EXPECT_EQ(alias.select({ "macos", "x86_64" }), "package-mac");
  EXPECT_EQ(alias.select({ "linux", "x86_64" }), "package-tarball");
  EXPECT_EQ(alias.select({ "windows", "x86_64" }), "package-windows");
  EXPECT_EQ(alias.select({ "", "" }), "package-none");
}

TEST_F(TaskGraphTest, AliasWithoutVariant)
{
  add("package-windows");
  graph.add_alias(gantry::task_alias::parse("package", { { "windows", "package-windows" } }));
  graph.resolve_aliases({ "linux", "x86_64" });
  EXPECT_EQ(graph.resolve("package"), "");
  EXPECT_TRUE(graph.reachable({ "package" }).empty());
}

TEST_F(TaskGraphTest, UnknownAliasTag)
{
  EXPECT_THROW(gantry::task_alias::parse("package", { { "beos", "x" } }), gantry::pipeline_error);
  EXPECT_THROW(gantry::task_alias::parse("package", { { "macos-sparc", "x" } }), gantry::pipeline_error);
}

TEST_F(TaskGraphTest, ReachableIsDeduplicatedAndDependencyOrdered)
{
  add("build", { { "depends", { "test", "package" } } });
  add("test", { { "depends", { "external-dependencies" } } });
  add("package", { { "depends", { "external-dependencies" } } });
  add("external-dependencies");
  add("unrelated");
  graph.resolve_aliases({ "linux", "x86_64" });

  EXPECT_EQ(graph.reachable({ "build" }), (std::vector<std::string>{ "external-dependencies", "test", "package", "build" }));
}

TEST_F(TaskGraphTest, TargetsOfBoundCallsAreNotListedUnderTheirOwnName)
{
  add("build", { { "process", { { { "call", { { "task", "test-suite" }, { "with", { { { "suite", "core" } } } } } } }, { { "call", "report" } } } } });
  add("test-suite", { { "depends", { "setup" } } });
  add("setup");
  add("report");
  graph.resolve_aliases({ "linux", "x86_64" });
  graph.validate({ "build" });

  EXPECT_EQ(graph.reachable({ "build" }), (std::vector<std::string>{ "report", "setup", "test-suite", "build" }));
  EXPECT_EQ(graph.unscoped_reachable({ "build" }), (std::vector<std::string>{ "report", "setup", "build" }));
}
