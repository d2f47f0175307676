#pragma once

#include "yaml-cpp/yaml.h"
#include "nlohmann/json.hpp"
#include <charconv>
#include <cstdlib>
#include <filesystem>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

namespace gantry {
const std::string default_pipeline_filename = "gantry.yaml";
const std::string default_config_filename   = ".gantry/config.yaml";
const std::string default_log_filename      = "gantry.log";
const std::string default_entry_task        = "build";
const std::string default_results_directory = "results";
const std::string workspace_environment_key = "GANTRY_WORKSPACE";
const std::string builtin_property_prefix   = "gantry.";
const std::string failure_report_suffix     = "-failures.xml";
} // namespace gantry

namespace YAML {
/**
 * Convert YAML nodes into JSON. Plain scalars are typed (bool, integer, float) when the typed
 * value prints as the original text, everything else including quoted scalars stays a string.
 */
template<> struct convert<nlohmann::json> {
  static bool decode(const Node &node, nlohmann::json &rhs)
  {
    switch (node.Type()) {
      case NodeType::Null:
      case NodeType::Undefined:
        rhs = nullptr;
        return true;

      case NodeType::Scalar: {
        const std::string &scalar = node.Scalar();
        if (node.Tag() == "!") {
          rhs = scalar;
          return true;
        }
        if (scalar == "true" || scalar == "false") {
          rhs = (scalar == "true");
          return true;
        }
        if (scalar == "~" || scalar == "null") {
          rhs = nullptr;
          return true;
        }
        // A number keeps its type only if it prints back as the same text, so `1.10` or `007`
        // stay strings
        long long integer = 0;
        const auto int_result = std::from_chars(scalar.data(), scalar.data() + scalar.size(), integer);
        if (!scalar.empty() && int_result.ec == std::errc() && int_result.ptr == scalar.data() + scalar.size()) {
          nlohmann::json typed = integer;
          if (typed.dump() == scalar) {
            rhs = std::move(typed);
            return true;
          }
        } else {
          char *end           = nullptr;
          const double number = std::strtod(scalar.c_str(), &end);
          if (!scalar.empty() && end == scalar.c_str() + scalar.size() && scalar.find_first_of("0123456789") != std::string::npos) {
            nlohmann::json typed = number;
            if (typed.dump() == scalar) {
              rhs = std::move(typed);
              return true;
            }
          }
        }
        rhs = scalar;
        return true;
      }

      case NodeType::Sequence:
        rhs = nlohmann::json::array();
        for (const auto &item: node)
          rhs.push_back(item.as<nlohmann::json>());
        return true;

      case NodeType::Map:
        rhs = nlohmann::json::object();
        for (const auto &item: node)
          rhs[item.first.as<std::string>()] = item.second.as<nlohmann::json>();
        return true;
    }
    return false;
  }
};
} // namespace YAML
