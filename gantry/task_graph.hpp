#pragma once

#include "condition.hpp"
#include "platform.hpp"
#include "nlohmann/json.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace gantry {

/**
 * @brief A named unit of work
 *
 * `process` is a list of single-key actions, e.g. `- exec: {...}` or `- call: name`. The call
 * targets found in `process` are collected so the graph can be validated before anything runs.
 * Calls with `with` bindings go to `scoped_call_targets` since they run under a bound key.
 */
struct task {
  std::string name;
  std::string description;
  std::vector<std::string> dependencies;
  std::string if_property;
  std::string unless_property;
  std::optional<condition> when;
  bool fail_on_error = true;
  nlohmann::json process = nlohmann::json::array();
  std::vector<std::string> call_targets;
  std::vector<std::string> scoped_call_targets;

  /** @throw pipeline_error if the task definition is malformed */
  static task parse(const std::string &name, const nlohmann::json &node);

  bool has_guard() const
  {
    return !if_property.empty() || !unless_property.empty() || when.has_value();
  }
};

/**
 * @brief Platform tag to concrete task lookup table
 *
 * Tags are either an OS family (`macos`), an OS family with architecture (`macos-arm64`),
 * `unix` or `default`.
 */
struct task_alias {
  std::string name;
  std::map<std::string, std::string> variants;

  static task_alias parse(const std::string &name, const nlohmann::json &node);

  /** @return The concrete task for `host`, or an empty string if nothing matches */
  std::string select(const platform &host) const;
};

class task_graph {
public:
  /** @throw pipeline_error if the name is already used by a task or alias */
  void add_task(task new_task);
  void add_alias(task_alias alias);

  /** @brief Fix every alias to its concrete task. Done once at load time. */
  void resolve_aliases(const platform &host);

  /**
   * @brief Map a task or alias name to the concrete task name
   * @return The task name, or an empty string for an alias with no variant for this platform
   * @throw pipeline_error if the name is unknown
   */
  std::string resolve(const std::string &name) const;

  const task *find(const std::string &name) const;
  bool contains(const std::string &name) const;
  bool is_alias(const std::string &name) const;

  /**
   * @brief Static validation of everything reachable from `entries`
   *
   * @throw pipeline_error if a dependency, call target or entry names no task or alias
   * @throw cyclic_dependency_error if the depends and call edges form a cycle
   */
  void validate(const std::vector<std::string> &entries) const;

  /** @brief Every concrete task reachable from `entries` through depends and call edges */
  std::vector<std::string> reachable(const std::vector<std::string> &entries) const;

  /**
   * @brief The tasks reachable from `entries` that run under their own name
   *
   * A task reached only through calls with bindings is left out. Its own edges are still followed.
   */
  std::vector<std::string> unscoped_reachable(const std::vector<std::string> &entries) const;

  std::vector<std::string> task_names() const;
  const std::map<std::string, task> &tasks() const
  {
    return task_table;
  }
  const std::map<std::string, task_alias> &aliases() const
  {
    return alias_table;
  }

private:
  std::vector<std::string> edges(const task &t) const;

  std::map<std::string, task> task_table;
  std::map<std::string, task_alias> alias_table;
  std::map<std::string, std::string> resolved_aliases;
  bool aliases_resolved = false;
};

} // namespace gantry
