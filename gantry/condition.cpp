#include "condition.hpp"
#include "gantry_errors.hpp"
#include "template_engine.hpp"
#include "utilities.hpp"
#include "spdlog/spdlog.h"

namespace gantry {

static std::string scalar_argument(const nlohmann::json &node, const std::string &key)
{
  if (node.is_string())
    return node.get<std::string>();
  if (node.is_primitive() && !node.is_null())
    return node.dump();
  throw pipeline_error("Condition '" + key + "' expects a string but got " + node.dump());
}

static condition parse_single(const std::string &key, const nlohmann::json &value)
{
  condition c;
  if (key == "all" || key == "any") {
    c.type = key == "all" ? condition::kind::ALL : condition::kind::ANY;
    if (!value.is_array())
      throw pipeline_error("Condition '" + key + "' expects a list but got " + value.dump());
    for (const auto &child: value)
      c.children.push_back(condition::parse(child));
  } else if (key == "not") {
    c.type = condition::kind::NOT;
    c.children.push_back(condition::parse(value));
  } else if (key == "os" || key == "os_family") {
    c.type     = condition::kind::OS_FAMILY;
    c.argument = scalar_argument(value, key);
  } else if (key == "arch" || key == "os_arch") {
    c.type     = condition::kind::OS_ARCH;
    c.argument = scalar_argument(value, key);
  } else if (key == "file_exists") {
    c.type     = condition::kind::FILE_EXISTS;
    c.argument = scalar_argument(value, key);
  } else if (key == "isset") {
    c.type     = condition::kind::IS_SET;
    c.argument = scalar_argument(value, key);
  } else if (key == "equals") {
    if (!value.is_array() || value.size() != 2)
      throw pipeline_error("Condition 'equals' expects a list of two values but got " + value.dump());
    c.type            = condition::kind::EQUALS;
    c.argument        = scalar_argument(value[0], key);
    c.second_argument = scalar_argument(value[1], key);
  } else {
    throw pipeline_error("Unknown condition '" + key + "'");
  }
  return c;
}

condition condition::parse(const nlohmann::json &node)
{
  if (node.is_boolean()) {
    condition c;
    c.type = node.get<bool>() ? kind::ALWAYS : kind::NOT;
    if (c.type == kind::NOT)
      c.children.push_back(condition{});
    return c;
  }

  if (node.is_array()) {
    condition c;
    c.type = kind::ALL;
    for (const auto &child: node)
      c.children.push_back(parse(child));
    return c;
  }

  if (!node.is_object() || node.empty())
    throw pipeline_error("Invalid condition: " + node.dump());

  if (node.size() == 1)
    return parse_single(node.begin().key(), node.begin().value());

  condition c;
  c.type = kind::ALL;
  for (const auto &[key, value]: node.items())
    c.children.push_back(parse_single(key, value));
  return c;
}

std::string condition::describe() const
{
  auto describe_children = [this](const std::string &separator) {
    std::string text;
    for (const auto &child: children) {
      if (!text.empty())
        text += separator;
      text += child.describe();
    }
    return "(" + text + ")";
  };

  switch (type) {
    case kind::ALWAYS:
      return "true";
    case kind::ALL:
      return describe_children(" and ");
    case kind::ANY:
      return describe_children(" or ");
    case kind::NOT:
      return "not " + (children.empty() ? std::string{ "true" } : children.front().describe());
    case kind::OS_FAMILY:
      return "os(" + argument + ")";
    case kind::OS_ARCH:
      return "arch(" + argument + ")";
    case kind::FILE_EXISTS:
      return "file_exists(" + argument + ")";
    case kind::IS_SET:
      return "isset(" + argument + ")";
    case kind::EQUALS:
      return "equals(" + argument + ", " + second_argument + ")";
  }
  return "";
}

condition_evaluator::condition_evaluator(const platform &host, const property_store &store, inja::Environment &env, const std::filesystem::path &base_directory)
    : host(host), store(store), env(env), base_directory(base_directory)
{
}

bool condition_evaluator::evaluate(const condition &predicate) const
{
  switch (predicate.type) {
    case condition::kind::ALWAYS:
      return true;

    case condition::kind::ALL:
      for (const auto &child: predicate.children)
        if (!evaluate(child))
          return false;
      return true;

    case condition::kind::ANY:
      for (const auto &child: predicate.children)
        if (evaluate(child))
          return true;
      return false;

    case condition::kind::NOT:
      return predicate.children.empty() ? false : !evaluate(predicate.children.front());

    case condition::kind::OS_FAMILY: {
      const auto family = platform::canonical_os_family(render_properties(env, predicate.argument, store));
      if (!family)
        throw condition_evaluation_error("Unknown OS family '" + predicate.argument + "'");
      if (host.os_family.empty())
        throw condition_evaluation_error("The host OS family could not be determined");
      return host.is_family(*family);
    }

    case condition::kind::OS_ARCH: {
      const auto arch = platform::canonical_arch(render_properties(env, predicate.argument, store));
      if (!arch)
        throw condition_evaluation_error("Unknown architecture '" + predicate.argument + "'");
      if (host.os_arch.empty())
        throw condition_evaluation_error("The host architecture could not be determined");
      return host.os_arch == *arch;
    }

    case condition::kind::FILE_EXISTS: {
      const auto path = resolve_path(base_directory, render_properties(env, predicate.argument, store));
      std::error_code ec;
      const bool exists = std::filesystem::exists(path, ec);
      spdlog::debug("file_exists({}) = {}", path.generic_string(), exists);
      return exists;
    }

    case condition::kind::IS_SET:
      return store.contains(predicate.argument);

    case condition::kind::EQUALS:
      return render_properties(env, predicate.argument, store) == render_properties(env, predicate.second_argument, store);
  }
  return false;
}

} // namespace gantry
