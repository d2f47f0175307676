#pragma once

#include "condition.hpp"
#include "task_graph.hpp"
#include "nlohmann/json.hpp"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

/**
 * @brief One entry of the pipeline `properties` list
 *
 *   - name: python            value: python3                      # VALUE
 *   - name: python            env: PYTHON       default: python3  # ENVIRONMENT
 *   - name: installer         select: [ {when, value} ] default:  # SELECT
 *   - name: have_java         value: yes        if: {...}          # CONDITIONAL
 */
struct property_definition {
  enum class kind { VALUE, ENVIRONMENT, SELECT, CONDITIONAL };

  struct variant {
    condition when;
    std::string value;
  };

  std::string name;
  kind type = kind::VALUE;
  std::string value;
  std::string environment_key;
  std::optional<std::string> default_value;
  std::optional<condition> predicate;
  std::vector<variant> variants;

  static property_definition parse(const nlohmann::json &node);
};

class pipeline {
public:
  std::string name;
  std::string description;
  std::string default_task;
  std::filesystem::path file_path;
  std::filesystem::path base_directory;
  std::vector<property_definition> properties;
  task_graph graph;

  /**
   * @brief Read and validate a pipeline file
   * @throw pipeline_error if the file cannot be read, is not valid YAML or fails validation
   */
  static pipeline load(const std::filesystem::path &path);

  /** @brief Parse pipeline text. Relative paths in the pipeline resolve against `base_directory`. */
  static pipeline parse(const std::string &text, const std::filesystem::path &base_directory, const std::string &source = "<pipeline>");
};

} // namespace gantry
