#include "gantry_project.hpp"
#include "gantry_errors.hpp"
#include "template_engine.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"
#include <set>

namespace gantry {

project::project(gantry::pipeline pipeline, gantry::workspace &workspace, gantry::platform host) : pipeline(std::move(pipeline)), workspace(workspace), host(std::move(host))
{
  add_common_template_commands(inja_environment);
}

void project::add_override(const std::string &name, const std::string &value)
{
  if (properties.is_sealed())
    throw error("Property overrides must be added before properties are resolved");
  overrides[name] = value;
}

void project::resolve_properties()
{
  properties.set(builtin_property_prefix + "os", host.os_family);
  properties.set(builtin_property_prefix + "arch", host.os_arch);
  properties.set(builtin_property_prefix + "pipeline.dir", pipeline.base_directory.generic_string());
  properties.set(builtin_property_prefix + "pipeline.name", pipeline.name);
  properties.set(builtin_property_prefix + "workspace", workspace.workspace_path.generic_string());

  for (const auto &[name, value]: overrides) {
    spdlog::debug("Property '{}' = '{}' (command line)", name, value);
    properties.set(name, value);
  }

  for (const auto &[name, value]: workspace.properties)
    if (properties.set_if_absent(name, value))
      spdlog::debug("Property '{}' = '{}' (workspace configuration)", name, value);

  // Everything bound so far takes precedence over the pipeline definitions
  std::set<std::string> locked;
  for (const auto &[name, value]: properties.visible_bindings())
    locked.insert(name);

  const condition_evaluator evaluator(host, properties, inja_environment, pipeline.base_directory);
  for (const auto &definition: pipeline.properties) {
    if (locked.contains(definition.name)) {
      spdlog::debug("Property '{}' keeps its overridden value", definition.name);
      continue;
    }

    switch (definition.type) {
      case property_definition::kind::VALUE:
        properties.set(definition.name, render(definition.value));
        break;

      case property_definition::kind::ENVIRONMENT:
        if (!properties.set_from_environment(definition.name, definition.environment_key) && definition.default_value)
          properties.set(definition.name, render(*definition.default_value));
        break;

      case property_definition::kind::SELECT: {
        bool selected = false;
        for (const auto &v: definition.variants) {
          if (evaluator.evaluate(v.when)) {
            properties.set(definition.name, render(v.value));
            selected = true;
            break;
          }
        }
        if (!selected && definition.default_value)
          properties.set(definition.name, render(*definition.default_value));
        break;
      }

      case property_definition::kind::CONDITIONAL:
        if (evaluator.evaluate(*definition.predicate))
          properties.set_if_absent(definition.name, render(definition.value));
        break;
    }

    if (auto value = properties.get(definition.name))
      spdlog::debug("Property '{}' = '{}'", definition.name, *value);
    else
      spdlog::debug("Property '{}' is not set", definition.name);
  }

  if (auto clash = properties.name_clash())
    throw pipeline_error("Property '" + clash->second + "' clashes with property '" + clash->first + "'. A name cannot be both a value and a prefix.");

  properties.seal();
}

void project::resolve_tasks(const std::vector<std::string> &entries)
{
  pipeline.graph.resolve_aliases(host);
  pipeline.graph.validate(entries);
}

std::vector<std::string> project::entry_tasks(const std::vector<std::string> &requested) const
{
  if (!requested.empty())
    return requested;
  return { pipeline.default_task };
}

std::string project::render(const std::string &input)
{
  return render_properties(inja_environment, input, properties);
}

std::vector<std::string> project::render_list(const nlohmann::json &node)
{
  return gantry::render_list(inja_environment, node, properties);
}

bool project::evaluate(const condition &predicate)
{
  const condition_evaluator evaluator(host, properties, inja_environment, pipeline.base_directory);
  return evaluator.evaluate(predicate);
}

std::filesystem::path project::resolve_path(const std::filesystem::path &path) const
{
  return gantry::resolve_path(pipeline.base_directory, path);
}

} // namespace gantry
