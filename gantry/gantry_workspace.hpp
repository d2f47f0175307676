#pragma once

#include "spdlog/spdlog.h"
#include "nlohmann/json.hpp"
#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <system_error>

namespace gantry {

/**
 * @brief Defaults applied to every build in a workspace. Command line options take precedence.
 */
struct workspace_settings {
  bool keep_going = false;
  bool progress   = true;
  std::optional<std::chrono::milliseconds> timeout;
  std::string log_level;
  std::filesystem::path results_directory;
};

/**
 * @brief Manages a Gantry workspace: its root directory and optional configuration file
 */
class workspace {
public:
  /** @brief Default constructor */
  workspace() = default;
  /** @brief Default destructor */
  ~workspace() = default;

  /**
   * @brief Initializes the workspace with given path
   * @param workspace_path Path to initialize workspace at, defaults to current path
   * @return std::expected<void, std::error_code> Success or error code
   *
   * The GANTRY_WORKSPACE environment variable, if set, overrides `workspace_path`.
   * The configuration file `.gantry/config.yaml` is loaded if it exists.
   */
  std::expected<void, std::error_code> init(const std::filesystem::path &workspace_path = std::filesystem::current_path());

  /**
   * @brief Loads the workspace configuration file
   * @param config_file_path Path to the config file
   * @return Success or error code
   *
   * The file may provide `properties` (name to scalar value) and `settings`.
   */
  std::expected<void, std::error_code> load_config_file(const std::filesystem::path &config_file_path);

  /**
   * @brief Loads configuration from YAML text
   * @param text YAML text
   * @param source Name used in diagnostics
   */
  std::expected<void, std::error_code> load_config(const std::string &text, const std::string &source);

public:
  /** @brief Logger instance for workspace operations */
  std::shared_ptr<spdlog::logger> log;

  /** @brief Path to the current workspace root */
  std::filesystem::path workspace_path;

  /** @brief Path of the loaded configuration file, empty if there is none */
  std::filesystem::path config_file_path;

  /** @brief Properties from the configuration file */
  std::map<std::string, std::string> properties;

  /** @brief Build defaults from the configuration file */
  workspace_settings settings;
};

} // namespace gantry
