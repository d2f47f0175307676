#include "template_engine.hpp"
#include "gantry_errors.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <regex>
#include <sstream>

namespace gantry {

static bool has_template_markup(const std::string &input)
{
  return input.find("{{") != std::string::npos || input.find("{%") != std::string::npos || input.find("{#") != std::string::npos;
}

std::string render_properties(inja::Environment &env, const std::string &input, const property_store &store)
{
  if (!has_template_markup(input))
    return input;

  try {
    return env.render(input, store.as_json());
  } catch (const inja::RenderError &e) {
    static const std::regex missing_variable("variable '([^']+)' not found");
    std::smatch match;
    if (std::regex_search(e.message, match, missing_variable))
      throw missing_property_error(match[1].str(), "referenced by '" + input + "'");
    throw pipeline_error("Template error in '" + input + "': " + e.message);
  } catch (const inja::InjaError &e) {
    throw pipeline_error("Template error in '" + input + "': " + e.message);
  }
}

std::vector<std::string> render_list(inja::Environment &env, const nlohmann::json &node, const property_store &store)
{
  std::vector<std::string> items;
  if (node.is_null())
    return items;
  if (node.is_array()) {
    for (const auto &i: node)
      items.push_back(render_properties(env, i.is_string() ? i.get<std::string>() : i.dump(), store));
  } else {
    items.push_back(render_properties(env, node.is_string() ? node.get<std::string>() : node.dump(), store));
  }
  return items;
}

void add_common_template_commands(inja::Environment &env)
{
  env.add_callback("dir", 1, [](inja::Arguments &args) {
    auto path = std::filesystem::path{ args.at(0)->get<std::string>() };
    return path.has_filename() ? path.parent_path().generic_string() : path.generic_string();
  });
  env.add_callback("not_dir", 1, [](inja::Arguments &args) {
    return std::filesystem::path{ args.at(0)->get<std::string>() }.filename().generic_string();
  });
  env.add_callback("absolute_path", 1, [](inja::Arguments &args) {
    return std::filesystem::absolute(args.at(0)->get<std::string>()).generic_string();
  });
  env.add_callback("extension", 1, [](inja::Arguments &args) {
    const auto extension = std::filesystem::path{ args.at(0)->get<std::string>() }.extension().string();
    return extension.empty() ? extension : extension.substr(1);
  });
  env.add_callback("file_exists", 1, [](inja::Arguments &args) {
    std::error_code ec;
    return std::filesystem::exists(args.at(0)->get<std::string>(), ec);
  });
  env.add_callback("env", 1, [](inja::Arguments &args) {
    const char *value = std::getenv(args.at(0)->get<std::string>().c_str());
    return std::string{ value != nullptr ? value : "" };
  });
  env.add_callback("quote", 1, [](inja::Arguments &args) {
    std::stringstream ss;
    if (args.at(0)->is_string())
      ss << std::quoted(args.at(0)->get<std::string>());
    else
      ss << std::quoted(args.at(0)->dump());
    return ss.str();
  });
  env.add_callback("replace", 3, [](inja::Arguments &args) {
    auto input  = args.at(0)->get<std::string>();
    auto target = std::regex(args.at(1)->get<std::string>());
    auto match  = args.at(2)->get<std::string>();
    return std::regex_replace(input, target, match);
  });
  env.add_callback("trim", 1, [](inja::Arguments &args) {
    auto input = args.at(0)->get<std::string>();
    input.erase(input.begin(), std::find_if(input.begin(), input.end(), [](unsigned char ch) {
                  return !std::isspace(ch);
                }));
    input.erase(std::find_if(input.rbegin(),
                             input.rend(),
                             [](unsigned char ch) {
                               return !std::isspace(ch);
                             })
                  .base(),
                input.end());
    return input;
  });
  env.add_callback("concatenate", [](inja::Arguments &args) {
    std::string aggregate;
    for (const auto &i: args)
      aggregate.append(i->get<std::string>());
    return aggregate;
  });
}

} // namespace gantry
