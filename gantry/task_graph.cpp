#include "task_graph.hpp"
#include "gantry_errors.hpp"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <functional>
#include <set>

namespace gantry {

static std::vector<std::string> string_list(const nlohmann::json &node, const std::string &context)
{
  std::vector<std::string> items;
  if (node.is_null())
    return items;
  if (node.is_string()) {
    items.push_back(node.get<std::string>());
    return items;
  }
  if (!node.is_array())
    throw pipeline_error(context + " must be a string or a list of strings");
  for (const auto &i: node) {
    if (!i.is_string())
      throw pipeline_error(context + " must only contain strings but found " + i.dump());
    items.push_back(i.get<std::string>());
  }
  return items;
}

static std::string call_target(const nlohmann::json &call, const std::string &task_name)
{
  if (call.is_string())
    return call.get<std::string>();
  if (call.is_object() && call.contains("task") && call["task"].is_string())
    return call["task"].get<std::string>();
  throw pipeline_error("Task '" + task_name + "' has a malformed call: " + call.dump());
}

task task::parse(const std::string &name, const nlohmann::json &node)
{
  task t;
  t.name = name;
  if (node.is_null())
    return t;
  if (!node.is_object())
    throw pipeline_error("Task '" + name + "' must be a map");

  t.description   = node.value("description", "");
  t.dependencies  = string_list(node.value("depends", nlohmann::json{}), "'depends' of task '" + name + "'");
  t.if_property   = node.value("if", "");
  t.unless_property = node.value("unless", "");
  t.fail_on_error = node.value("failonerror", true);
  if (node.contains("when"))
    t.when = condition::parse(node["when"]);

  if (node.contains("process")) {
    if (!node["process"].is_array())
      throw pipeline_error("'process' of task '" + name + "' must be a list");
    t.process = node["process"];
  }

  for (const auto &action: t.process) {
    if (!action.is_object() || action.size() != 1)
      throw pipeline_error("Action of task '" + name + "' must be a map with a single command: " + action.dump());
    if (action.begin().key() == "call") {
      const auto &call = action.begin().value();
      if (call.is_object() && call.contains("with") && !call["with"].is_null())
        t.scoped_call_targets.push_back(call_target(call, name));
      else
        t.call_targets.push_back(call_target(call, name));
    }
  }
  return t;
}

task_alias task_alias::parse(const std::string &name, const nlohmann::json &node)
{
  if (!node.is_object() || node.empty())
    throw pipeline_error("Alias '" + name + "' must map platform tags to tasks");

  task_alias alias;
  alias.name = name;
  for (const auto &[tag, target]: node.items()) {
    if (!target.is_string())
      throw pipeline_error("Alias '" + name + "' variant '" + tag + "' must name a task");

    std::string canonical_tag = tag;
    if (tag != "default") {
      const auto separator = tag.find('-');
      const auto family    = platform::canonical_os_family(tag.substr(0, separator));
      if (!family)
        throw pipeline_error("Alias '" + name + "' has an unknown platform tag '" + tag + "'");
      canonical_tag = *family;
      if (separator != std::string::npos) {
        const auto arch = platform::canonical_arch(tag.substr(separator + 1));
        if (!arch)
          throw pipeline_error("Alias '" + name + "' has an unknown architecture in tag '" + tag + "'");
        canonical_tag += "-" + *arch;
      }
    }
    alias.variants[canonical_tag] = target.get<std::string>();
  }
  return alias;
}

std::string task_alias::select(const platform &host) const
{
  for (const auto &tag: { host.tag(), host.os_family, std::string{ host.is_unix() ? "unix" : "" }, std::string{ "default" } }) {
    if (tag.empty())
      continue;
    auto i = variants.find(tag);
    if (i != variants.end())
      return i->second;
  }
  return "";
}

void task_graph::add_task(task new_task)
{
  if (task_table.contains(new_task.name) || alias_table.contains(new_task.name))
    throw pipeline_error("Duplicate task '" + new_task.name + "'");
  auto name = new_task.name;
  task_table.emplace(name, std::move(new_task));
}

void task_graph::add_alias(task_alias alias)
{
  if (task_table.contains(alias.name) || alias_table.contains(alias.name))
    throw pipeline_error("Alias '" + alias.name + "' clashes with an existing task or alias");
  auto name = alias.name;
  alias_table.emplace(name, std::move(alias));
  aliases_resolved = false;
}

void task_graph::resolve_aliases(const platform &host)
{
  resolved_aliases.clear();
  for (const auto &[name, alias]: alias_table) {
    const auto target = alias.select(host);
    if (target.empty())
      spdlog::info("Alias '{}' has no variant for {}, it will be skipped", name, host.tag());
    else
      spdlog::debug("Alias '{}' resolved to '{}'", name, target);
    resolved_aliases[name] = target;
  }
  aliases_resolved = true;
}

std::string task_graph::resolve(const std::string &name) const
{
  if (task_table.contains(name))
    return name;
  if (alias_table.contains(name)) {
    if (!aliases_resolved)
      throw error("Alias '" + name + "' used before aliases were resolved");
    return resolved_aliases.at(name);
  }
  throw pipeline_error("Unknown task '" + name + "'");
}

const task *task_graph::find(const std::string &name) const
{
  auto i = task_table.find(name);
  if (i == task_table.end())
    return nullptr;
  return &i->second;
}

bool task_graph::contains(const std::string &name) const
{
  return task_table.contains(name) || alias_table.contains(name);
}

bool task_graph::is_alias(const std::string &name) const
{
  return alias_table.contains(name);
}

std::vector<std::string> task_graph::edges(const task &t) const
{
  std::vector<std::string> targets;
  for (const auto &names: { &t.dependencies, &t.call_targets, &t.scoped_call_targets })
    for (const auto &name: *names) {
      const auto concrete = resolve(name);
      if (!concrete.empty())
        targets.push_back(concrete);
    }
  return targets;
}

void task_graph::validate(const std::vector<std::string> &entries) const
{
  for (const auto &[name, alias]: alias_table)
    for (const auto &[tag, target]: alias.variants)
      if (!task_table.contains(target))
        throw pipeline_error("Alias '" + name + "' variant '" + tag + "' names unknown task '" + target + "'");

  for (const auto &[name, t]: task_table) {
    for (const auto &dependency: t.dependencies)
      if (!contains(dependency))
        throw pipeline_error("Task '" + name + "' depends on unknown task '" + dependency + "'");
    for (const auto &names: { &t.call_targets, &t.scoped_call_targets })
      for (const auto &target: *names)
        if (!contains(target))
          throw pipeline_error("Task '" + name + "' calls unknown task '" + target + "'");
  }

  for (const auto &entry: entries)
    if (!contains(entry))
      throw pipeline_error("Unknown task '" + entry + "'");

  // Depth first search. Tasks on the current path are 'visiting'.
  enum class mark { VISITING, DONE };
  std::map<std::string, mark> marks;
  std::vector<std::string> path;

  std::function<void(const std::string &)> visit = [&](const std::string &name) {
    auto m = marks.find(name);
    if (m != marks.end()) {
      if (m->second == mark::DONE)
        return;
      std::vector<std::string> cycle(std::find(path.begin(), path.end(), name), path.end());
      cycle.push_back(name);
      throw cyclic_dependency_error(cycle);
    }
    marks[name] = mark::VISITING;
    path.push_back(name);
    for (const auto &next: edges(task_table.at(name)))
      visit(next);
    path.pop_back();
    marks[name] = mark::DONE;
  };

  for (const auto &[name, t]: task_table)
    visit(name);
}

std::vector<std::string> task_graph::reachable(const std::vector<std::string> &entries) const
{
  std::vector<std::string> order;
  std::set<std::string> seen;
  std::function<void(const std::string &)> visit = [&](const std::string &name) {
    const auto concrete = resolve(name);
    if (concrete.empty() || !seen.insert(concrete).second)
      return;
    for (const auto &next: edges(task_table.at(concrete)))
      visit(next);
    order.push_back(concrete);
  };
  for (const auto &entry: entries)
    visit(entry);
  return order;
}

std::vector<std::string> task_graph::unscoped_reachable(const std::vector<std::string> &entries) const
{
  std::vector<std::string> order;
  std::set<std::string> listed;
  std::set<std::string> explored;
  std::function<void(const std::string &, bool)> visit = [&](const std::string &name, bool scoped) {
    const auto concrete = resolve(name);
    if (concrete.empty() || listed.contains(concrete) || (scoped && explored.contains(concrete)))
      return;

    if (explored.insert(concrete).second) {
      const auto &t = task_table.at(concrete);
      for (const auto &names: { &t.dependencies, &t.call_targets })
        for (const auto &next: *names)
          visit(next, false);
      for (const auto &next: t.scoped_call_targets)
        visit(next, true);
    }
    if (!scoped) {
      listed.insert(concrete);
      order.push_back(concrete);
    }
  };
  for (const auto &entry: entries)
    visit(entry, false);
  return order;
}

std::vector<std::string> task_graph::task_names() const
{
  std::vector<std::string> names;
  for (const auto &[name, t]: task_table)
    names.push_back(name);
  for (const auto &[name, a]: alias_table)
    names.push_back(name);
  std::sort(names.begin(), names.end());
  return names;
}

} // namespace gantry
