#pragma once

#include "gantry_project.hpp"
#include "task_engine.hpp"
#include "task_graph.hpp"
#include "nlohmann/json.hpp"
#include <functional>
#include <map>
#include <string>

namespace gantry {

struct command_context {
  task_engine &engine;
  gantry::project &project;
  const task &current_task;
  task_record &record;
};

/**
 * A task command receives the value of its action node. It returns captured output on success
 * and throws a gantry::error on failure.
 */
typedef std::function<std::string(const nlohmann::json &, command_context &)> task_command;

extern const std::map<const std::string, const task_command> task_commands;

} // namespace gantry
