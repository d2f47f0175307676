#pragma once

#include "gantry.hpp"
#include "gantry_pipeline.hpp"
#include "gantry_workspace.hpp"
#include "condition.hpp"
#include "platform.hpp"
#include "property_store.hpp"
#include "nlohmann/json.hpp"
#include <inja/inja.hpp>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace gantry {

/**
 * @brief A pipeline bound to a workspace and a host platform
 *
 * Holds the build-wide property store. Properties are resolved once with resolve_properties()
 * after which the store is sealed for the rest of the build.
 */
class project {
public:
  project(gantry::pipeline pipeline, gantry::workspace &workspace, gantry::platform host = platform::detect());

  /** @brief Command line `-D name=value`. Must be added before resolve_properties(). */
  void add_override(const std::string &name, const std::string &value);

  /**
   * @brief Bind every property and seal the store
   *
   * Order: built-in properties, command line overrides, workspace configuration, then the
   * pipeline definitions in declaration order. A value bound before the pipeline definitions
   * is never replaced by one of them.
   *
   * @throw missing_property_error if a definition references an unbound property
   * @throw condition_evaluation_error if a predicate references an unknown platform fact
   */
  void resolve_properties();

  /** @brief Fix aliases for the host platform and validate the graph reachable from `entries` */
  void resolve_tasks(const std::vector<std::string> &entries);

  /** @brief The requested tasks, or the pipeline default when none are given */
  std::vector<std::string> entry_tasks(const std::vector<std::string> &requested) const;

  std::string render(const std::string &input);
  std::vector<std::string> render_list(const nlohmann::json &node);
  bool evaluate(const condition &predicate);
  std::filesystem::path resolve_path(const std::filesystem::path &path) const;

  gantry::pipeline pipeline;
  gantry::workspace &workspace;
  gantry::platform host;
  property_store properties;
  inja::Environment inja_environment;
  std::map<std::string, std::string> overrides;
};

} // namespace gantry
