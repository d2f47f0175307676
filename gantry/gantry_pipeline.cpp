#include "gantry_pipeline.hpp"
#include "gantry.hpp"
#include "gantry_errors.hpp"
#include "gantry_schema.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"

namespace gantry {

property_definition property_definition::parse(const nlohmann::json &node)
{
  property_definition d;
  d.name = node.at("name").get<std::string>();
  if (node.contains("default"))
    d.default_value = scalar_to_string(node["default"]);

  if (node.contains("env")) {
    d.type            = kind::ENVIRONMENT;
    d.environment_key = node["env"].get<std::string>();
  } else if (node.contains("select")) {
    d.type = kind::SELECT;
    for (const auto &v: node["select"])
      d.variants.push_back({ condition::parse(v.at("when")), scalar_to_string(v.at("value")) });
  } else if (node.contains("if")) {
    d.type      = kind::CONDITIONAL;
    d.value     = scalar_to_string(node.at("value"));
    d.predicate = condition::parse(node["if"]);
  } else {
    d.type  = kind::VALUE;
    d.value = scalar_to_string(node.at("value"));
  }
  return d;
}

pipeline pipeline::parse(const std::string &text, const fs::path &base_directory, const std::string &source)
{
  nlohmann::json document;
  try {
    document = YAML::Load(text).as<nlohmann::json>();
  } catch (const YAML::Exception &e) {
    throw pipeline_error("Failed to parse '" + source + "': " + e.what());
  }

  if (!gantry_schema_validator::get().validate_pipeline(document, source))
    throw pipeline_error("'" + source + "' is not a valid pipeline");

  pipeline p;
  p.base_directory = base_directory;
  p.name           = document.value("name", base_directory.filename().string());
  p.description    = document.value("description", "");
  p.default_task   = document.value("default", default_entry_task);

  try {
    if (document.contains("properties") && document["properties"].is_array())
      for (const auto &node: document["properties"])
        p.properties.push_back(property_definition::parse(node));

    for (const auto &[task_name, node]: document["tasks"].items())
      p.graph.add_task(task::parse(task_name, node));

    if (document.contains("aliases"))
      for (const auto &[alias_name, node]: document["aliases"].items())
        p.graph.add_alias(task_alias::parse(alias_name, node));
  } catch (const nlohmann::json::exception &e) {
    throw pipeline_error("Malformed pipeline '" + source + "': " + e.what());
  }

  spdlog::debug("Loaded pipeline '{}' with {} tasks, {} aliases and {} property definitions", p.name, p.graph.tasks().size(), p.graph.aliases().size(), p.properties.size());
  return p;
}

pipeline pipeline::load(const fs::path &path)
{
  auto contents = get_file_contents<std::string>(path);
  if (!contents)
    throw pipeline_error("Cannot read pipeline '" + path.generic_string() + "': " + contents.error().message());

  auto absolute_path = fs::absolute(path);
  auto p             = parse(*contents, absolute_path.parent_path(), path.generic_string());
  p.file_path        = absolute_path;
  return p;
}

} // namespace gantry
