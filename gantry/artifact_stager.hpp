#pragma once

#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace gantry {

/**
 * @brief Invoke `fetch` only if `path` does not exist
 * @return true if `fetch` was invoked
 * @throw error if `fetch` ran but did not produce `path`
 */
bool ensure_present(const std::filesystem::path &path, const std::function<void()> &fetch);

/**
 * @brief Copy the latest build outputs into `destination`
 *
 * Files in `destination` matching the file name patterns of `outputs` are deleted first so the
 * destination never mixes old and new artifacts. Relative outputs are resolved against
 * `base_directory`. Output entries may be glob patterns.
 *
 * @return The staged paths inside `destination`
 * @throw error if an output pattern matches nothing or a filesystem operation fails
 */
std::vector<std::filesystem::path> stage(const std::vector<std::string> &outputs, const std::filesystem::path &destination, const std::filesystem::path &base_directory = {});

/** @brief Delete files or directories. Missing entries are ignored. */
size_t remove_paths(const std::vector<std::string> &patterns, const std::filesystem::path &base_directory = {});

/** @brief Expand a glob pattern. A pattern without wildcards expands to itself if it exists. */
std::vector<std::filesystem::path> expand_pattern(const std::filesystem::path &base_directory, const std::string &pattern);

} // namespace gantry
