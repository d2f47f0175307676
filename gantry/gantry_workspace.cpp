#include "gantry_workspace.hpp"
#include "gantry.hpp"
#include "gantry_schema.hpp"
#include "utilities.hpp"
#include <cstdlib>

namespace gantry {

std::expected<void, std::error_code> workspace::init(const fs::path &path)
{
  log = spdlog::default_logger();

  const char *workspace_override = std::getenv(workspace_environment_key.c_str());
  workspace_path                 = (workspace_override != nullptr && *workspace_override != '\0') ? fs::path{ workspace_override } : path;

  std::error_code ec;
  workspace_path = fs::absolute(workspace_path, ec);
  if (ec) {
    log->error("Invalid workspace path '{}': {}", path.generic_string(), ec.message());
    return std::unexpected(ec);
  }
  if (!fs::is_directory(workspace_path, ec)) {
    log->error("Workspace '{}' is not a directory", workspace_path.generic_string());
    return std::unexpected(std::make_error_code(std::errc::not_a_directory));
  }
  log->debug("Workspace: {}", workspace_path.generic_string());

  const auto config_path = workspace_path / default_config_filename;
  if (fs::exists(config_path, ec))
    return load_config_file(config_path);

  return {};
}

std::expected<void, std::error_code> workspace::load_config_file(const fs::path &path)
{
  if (!log)
    log = spdlog::default_logger();

  auto contents = get_file_contents<std::string>(path);
  if (!contents) {
    log->error("Cannot read configuration file '{}': {}", path.generic_string(), contents.error().message());
    return std::unexpected(contents.error());
  }
  config_file_path = path;
  return load_config(*contents, path.generic_string());
}

std::expected<void, std::error_code> workspace::load_config(const std::string &text, const std::string &source)
{
  if (!log)
    log = spdlog::default_logger();

  nlohmann::json config;
  try {
    config = YAML::Load(text).as<nlohmann::json>();
  } catch (const YAML::Exception &e) {
    log->error("Failed to parse '{}': {}", source, e.what());
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));
  }

  if (!gantry_schema_validator::get().validate_config(config, source))
    return std::unexpected(std::make_error_code(std::errc::invalid_argument));

  if (config.is_null())
    return {};

  if (config.contains("properties") && config["properties"].is_object())
    for (const auto &[name, value]: config["properties"].items())
      properties[name] = scalar_to_string(value);

  if (config.contains("settings") && config["settings"].is_object()) {
    const auto &s     = config["settings"];
    settings.keep_going = s.value("keep_going", settings.keep_going);
    settings.progress   = s.value("progress", settings.progress);
    settings.log_level  = s.value("log_level", settings.log_level);
    if (s.contains("timeout")) {
      const auto seconds = to_number(s["timeout"]);
      if (seconds && *seconds > 0)
        settings.timeout = std::chrono::milliseconds(static_cast<long long>(*seconds * 1000));
    }
    if (s.contains("results_dir"))
      settings.results_directory = s["results_dir"].get<std::string>();
  }

  log->debug("Loaded configuration '{}': {} properties", source, properties.size());
  return {};
}

} // namespace gantry
