#include "gtest/gtest.h"
#include "artifact_stager.hpp"
#include "gantry_errors.hpp"
#include "test_utilities.hpp"

class ArtifactStagerTest : public ::testing::Test {
protected:
  gantry::test::temporary_directory dir;
};

TEST_F(ArtifactStagerTest, EnsurePresentIsIdempotent)
{
  const auto jar = dir.path / "lib" / "bioformats.jar";
  int fetch_count = 0;
  auto fetch      = [&]() {
    ++fetch_count;
    gantry::test::write_file(jar, "jar");
  };

  EXPECT_TRUE(gantry::ensure_present(jar, fetch));
  EXPECT_FALSE(gantry::ensure_present(jar, fetch));
  EXPECT_EQ(fetch_count, 1);
}

TEST_F(ArtifactStagerTest, FetchThatProducesNothingFails)
{
  EXPECT_THROW(gantry::ensure_present(dir.path / "missing.jar", []() {}), gantry::error);
}

TEST_F(ArtifactStagerTest, StageRemovesStaleArtifacts)
{
  gantry::test::write_file(dir.path / "dist" / "CellProfiler-4.1.dmg", "old");
  gantry::test::write_file(dir.path / "dist" / "README.txt", "keep");
  gantry::test::write_file(dir.path / "build" / "CellProfiler-4.2.dmg", "new");

  const auto staged = gantry::stage({ "build/*.dmg" }, "dist", dir.path);
  ASSERT_EQ(staged.size(), 1u);
  EXPECT_EQ(staged[0], dir.path / "dist" / "CellProfiler-4.2.dmg");

  EXPECT_FALSE(fs::exists(dir.path / "dist" / "CellProfiler-4.1.dmg"));
  EXPECT_EQ(gantry::test::read_file(dir.path / "dist" / "CellProfiler-4.2.dmg"), "new");
  EXPECT_TRUE(fs::exists(dir.path / "dist" / "README.txt"));
}

TEST_F(ArtifactStagerTest, StageWithMissingOutputLeavesDestinationUntouched)
{
  gantry::test::write_file(dir.path / "dist" / "CellProfiler-4.1.dmg", "old");
  EXPECT_THROW(gantry::stage({ "build/*.dmg" }, "dist", dir.path), gantry::error);
  EXPECT_TRUE(fs::exists(dir.path / "dist" / "CellProfiler-4.1.dmg"));
}

TEST_F(ArtifactStagerTest, StageCopiesDirectories)
{
  gantry::test::write_file(dir.path / "build" / "CellProfiler.app" / "Contents" / "Info.plist", "plist");
  gantry::test::write_file(dir.path / "dist" / "CellProfiler.app" / "stale.txt", "stale");

  gantry::stage({ "build/CellProfiler.app" }, "dist", dir.path);
  EXPECT_TRUE(fs::exists(dir.path / "dist" / "CellProfiler.app" / "Contents" / "Info.plist"));
  EXPECT_FALSE(fs::exists(dir.path / "dist" / "CellProfiler.app" / "stale.txt"));
}

TEST_F(ArtifactStagerTest, RemovePaths)
{
  gantry::test::write_file(dir.path / "build" / "a.o", "");
  gantry::test::write_file(dir.path / "build" / "b.o", "");
  gantry::test::write_file(dir.path / "build" / "keep.c", "");

  EXPECT_EQ(gantry::remove_paths({ "build/*.o", "does-not-exist" }, dir.path), 2u);
  EXPECT_FALSE(fs::exists(dir.path / "build" / "a.o"));
  EXPECT_TRUE(fs::exists(dir.path / "build" / "keep.c"));
}
