#pragma once

#include "spdlog/spdlog.h"
#include "nlohmann/json.hpp"
#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <fstream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace gantry {

struct process_invocation {
  std::string executable;
  std::vector<std::string> arguments;
  fs::path working_directory;
  std::map<std::string, std::string> environment; // Set on top of the inherited process environment
  std::optional<std::chrono::milliseconds> timeout;
};

struct process_result {
  std::string output; // stdout and stderr interleaved
  int exit_code  = 0;
  bool timed_out = false;
  bool cancelled = false;
};

/**
 * @brief Run an external program and block until it exits
 *
 * Output is captured line by line. A watchdog terminates the process when the timeout expires or
 * when `cancel` becomes true.
 *
 * @throw subprocess_failure if the process cannot be started
 */
process_result run_process(const process_invocation &invocation, const std::atomic<bool> *cancel = nullptr);

std::string describe_command(const process_invocation &invocation);

/** @brief Download `url` to `destination` via a temporary file so a partial download never looks complete */
void download_resource(const std::string &url, const fs::path &destination, const std::atomic<bool> *cancel = nullptr);

fs::path resolve_path(const fs::path &base_directory, const fs::path &path);

/** @brief Logger for user facing output. Falls back to the default logger when "console" is not registered. */
std::shared_ptr<spdlog::logger> console();

std::string sanitize_filename(const std::string &name);

/** @brief String form of a YAML scalar. Strings are returned as is, numbers and booleans are printed. */
std::string scalar_to_string(const nlohmann::json &value);

/** @brief Numeric value of a number or of a string holding a number such as `0.20` */
std::optional<double> to_number(const nlohmann::json &value);

template <class CharContainer>
static std::expected<size_t, std::error_code> get_file_contents(std::filesystem::path filename, CharContainer *container)
{
  std::ifstream file(filename, std::ios::binary | std::ios::ate);
  if (!file) {
    return std::unexpected(std::make_error_code(std::errc::no_such_file_or_directory));
  }

  const auto file_size = file.tellg();
  if (file_size < 0) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  container->resize(static_cast<typename CharContainer::size_type>(file_size));

  file.seekg(0);
  if (!file.read(reinterpret_cast<char *>(container->data()), file_size)) {
    return std::unexpected(std::make_error_code(std::errc::io_error));
  }

  return container->size();
}

template <class CharContainer>
static std::expected<CharContainer, std::error_code> get_file_contents(std::filesystem::path filename)
{
  CharContainer cc;
  auto result = get_file_contents(filename, &cc);
  if (result) {
    return cc;
  }
  return std::unexpected(result.error());
}

} // namespace gantry
