#include "property_store.hpp"
#include "gantry_errors.hpp"
#include "spdlog/spdlog.h"
#include <cstdlib>

namespace gantry {

property_store::scope::scope(property_store &store, const binding_map &bindings) : store(store)
{
  if (store.active_visitors > 0)
    throw error("Cannot bind scoped properties while the property store is being visited");
  store.overlays.push_back(bindings);
  if (auto clash = store.name_clash()) {
    store.overlays.pop_back();
    throw error("Scoped property '" + clash->second + "' clashes with property '" + clash->first + "'");
  }
  depth = store.overlays.size();
}

property_store::scope::~scope()
{
  // Scopes nest strictly so the innermost overlay always belongs to this scope
  if (store.overlays.size() == depth)
    store.overlays.pop_back();
  else
    spdlog::error("Property scope released out of order ({} overlays, expected {})", store.overlays.size(), depth);
}

void property_store::check_writable(const std::string &name) const
{
  if (name.empty())
    throw error("Property name cannot be empty");
  if (active_visitors > 0)
    throw error("Re-entrant write of property '" + name + "' while the property store is being visited");
  if (sealed)
    throw error("Property '" + name + "' cannot be written after property resolution has completed");
}

void property_store::set(const std::string &name, const std::string &value)
{
  check_writable(name);
  auto existing = properties.find(name);
  if (existing != properties.end() && existing->second != value)
    spdlog::debug("Property '{}' changed from '{}' to '{}'", name, existing->second, value);
  properties[name] = value;
}

bool property_store::set_if_absent(const std::string &name, const std::string &value)
{
  check_writable(name);
  return properties.insert({ name, value }).second;
}

bool property_store::set_from_environment(const std::string &name, const std::string &environment_key)
{
  check_writable(name);
  const char *value = std::getenv(environment_key.c_str());
  if (value == nullptr)
    return false;
  properties[name] = value;
  return true;
}

std::optional<std::string> property_store::get(const std::string &name) const
{
  for (auto overlay = overlays.rbegin(); overlay != overlays.rend(); ++overlay) {
    auto i = overlay->find(name);
    if (i != overlay->end())
      return i->second;
  }
  auto i = properties.find(name);
  if (i != properties.end())
    return i->second;
  return std::nullopt;
}

bool property_store::contains(const std::string &name) const
{
  return get(name).has_value();
}

void property_store::seal()
{
  sealed = true;
}

property_store::binding_map property_store::visible_bindings() const
{
  binding_map bindings = properties;
  for (const auto &overlay: overlays)
    for (const auto &[name, value]: overlay)
      bindings[name] = value;
  return bindings;
}

std::optional<std::pair<std::string, std::string>> property_store::name_clash() const
{
  const auto bindings = visible_bindings();
  for (const auto &[name, value]: bindings) {
    for (auto dot = name.find('.'); dot != std::string::npos; dot = name.find('.', dot + 1)) {
      const auto prefix = name.substr(0, dot);
      if (bindings.contains(prefix))
        return std::make_pair(prefix, name);
    }
  }
  return std::nullopt;
}

void property_store::for_each(const std::function<void(const std::string &, const std::string &)> &visitor) const
{
  const auto bindings = visible_bindings();
  struct visit_guard {
    int &visitors;
    explicit visit_guard(int &visitors) : visitors(visitors)
    {
      ++visitors;
    }
    ~visit_guard()
    {
      --visitors;
    }
  } guard(active_visitors);

  for (const auto &[name, value]: bindings)
    visitor(name, value);
}

static std::string escape_pointer_token(const std::string &token)
{
  std::string escaped;
  for (const char c: token) {
    if (c == '~')
      escaped += "~0";
    else if (c == '/')
      escaped += "~1";
    else
      escaped += c;
  }
  return escaped;
}

nlohmann::json property_store::as_json() const
{
  nlohmann::json data = nlohmann::json::object();
  for (const auto &[name, value]: visible_bindings()) {
    std::string pointer;
    size_t start = 0;
    while (start <= name.size()) {
      const auto end = name.find('.', start);
      pointer += "/" + escape_pointer_token(name.substr(start, end == std::string::npos ? std::string::npos : end - start));
      if (end == std::string::npos)
        break;
      start = end + 1;
    }

    try {
      data[nlohmann::json::json_pointer{ pointer }] = value;
    } catch (const nlohmann::json::exception &e) {
      spdlog::warn("Property '{}' cannot be used in substitutions because it clashes with another property: {}", name, e.what());
    }
  }
  return data;
}

} // namespace gantry
