#include "artifact_stager.hpp"
#include "gantry_errors.hpp"
#include "utilities.hpp"
#include "glob/glob.h"
#include "spdlog/spdlog.h"

namespace gantry {

static bool has_wildcard(const std::string &pattern)
{
  return pattern.find_first_of("*?[") != std::string::npos;
}

std::vector<fs::path> expand_pattern(const fs::path &base_directory, const std::string &pattern)
{
  const auto full_pattern = resolve_path(base_directory, pattern).generic_string();
  if (!has_wildcard(pattern)) {
    std::error_code ec;
    if (fs::exists(full_pattern, ec))
      return { fs::path{ full_pattern } };
    return {};
  }
  if (pattern.find("**") != std::string::npos)
    return glob::rglob(full_pattern);
  return glob::glob(full_pattern);
}

bool ensure_present(const fs::path &path, const std::function<void()> &fetch)
{
  std::error_code ec;
  if (fs::exists(path, ec)) {
    spdlog::info("{} is present", path.generic_string());
    return false;
  }

  spdlog::info("{} is missing, fetching", path.generic_string());
  fetch();

  if (!fs::exists(path, ec))
    throw error("Fetching '" + path.generic_string() + "' did not produce the file");
  return true;
}

std::vector<fs::path> stage(const std::vector<std::string> &outputs, const fs::path &destination, const fs::path &base_directory)
{
  const auto destination_path = resolve_path(base_directory, destination);

  // Expand everything first so nothing is deleted when an output is missing
  std::vector<fs::path> sources;
  for (const auto &pattern: outputs) {
    auto matches = expand_pattern(base_directory, pattern);
    if (matches.empty())
      throw error("Build output '" + pattern + "' does not exist");
    sources.insert(sources.end(), matches.begin(), matches.end());
  }

  try {
    for (const auto &pattern: outputs) {
      const auto name_pattern = fs::path{ pattern }.filename().string();
      for (const auto &stale: expand_pattern(destination_path, name_pattern)) {
        spdlog::info("Removing stale artifact {}", stale.generic_string());
        fs::remove_all(stale);
      }
    }

    fs::create_directories(destination_path);

    std::vector<fs::path> staged;
    for (const auto &source: sources) {
      const auto target = destination_path / source.filename();
      spdlog::info("Staging {} -> {}", source.generic_string(), target.generic_string());
      fs::copy(source, target, fs::copy_options::recursive | fs::copy_options::overwrite_existing);
      staged.push_back(target);
    }
    return staged;
  } catch (const fs::filesystem_error &e) {
    throw error("Staging into '" + destination_path.generic_string() + "' failed: " + e.what());
  }
}

size_t remove_paths(const std::vector<std::string> &patterns, const fs::path &base_directory)
{
  size_t count = 0;
  for (const auto &pattern: patterns) {
    for (const auto &path: expand_pattern(base_directory, pattern)) {
      std::error_code ec;
      const auto removed = fs::remove_all(path, ec);
      if (ec)
        throw error("Failed to delete '" + path.generic_string() + "': " + ec.message());
      spdlog::info("Deleted {}", path.generic_string());
      count += static_cast<size_t>(removed);
    }
  }
  return count;
}

} // namespace gantry
